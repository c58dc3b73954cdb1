#ifndef LIBAXML_TESTS_AXML_BUILDER_H
#define LIBAXML_TESTS_AXML_BUILDER_H

#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "axml.hpp"

// Encoder for small binary XML documents used as test fixtures.
namespace axml_test {

using Bytes = std::vector<uint8_t>;

const uint32_t NONE = 0xFFFFFFFF;

inline void put8(Bytes &out, uint8_t value) { out.push_back(value); }

inline void put16(Bytes &out, uint16_t value) {
  out.push_back(static_cast<uint8_t>(value & 0xFF));
  out.push_back(static_cast<uint8_t>(value >> 8));
}

inline void put32(Bytes &out, uint32_t value) {
  for (int shift = 0; shift < 32; shift += 8) {
    out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

inline void patch32(Bytes &out, size_t pos, uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out[pos + i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
  }
}

inline void append(Bytes &out, const Bytes &more) {
  out.insert(out.end(), more.begin(), more.end());
}

inline Bytes concat(std::initializer_list<Bytes> parts) {
  Bytes out;
  for (const Bytes &part : parts) {
    append(out, part);
  }
  return out;
}

// Any chunk: 8-byte header, extra header bytes, body.
inline Bytes chunk(uint16_t type, const Bytes &extra_header, const Bytes &body) {
  Bytes out;
  put16(out, type);
  put16(out, static_cast<uint16_t>(8 + extra_header.size()));
  put32(out, static_cast<uint32_t>(8 + extra_header.size() + body.size()));
  append(out, extra_header);
  append(out, body);
  return out;
}

inline Bytes xmlChunk(const Bytes &body) { return chunk(0x0003, {}, body); }

// Lenient UTF-16 length of UTF-8 text; stray bytes count as one unit.
inline uint32_t utf16Length(const std::string &text) {
  uint32_t units = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      units += c >= 0xF0 ? 2 : 1;
    }
  }
  return units;
}

inline std::vector<uint16_t> toUtf16(const std::string &text) {
  std::vector<uint16_t> units;
  size_t i = 0;
  while (i < text.size()) {
    unsigned char c = text[i];
    uint32_t cp;
    size_t extra;
    if (c < 0x80) {
      cp = c;
      extra = 0;
    } else if ((c & 0xE0) == 0xC0) {
      cp = c & 0x1F;
      extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      cp = c & 0x0F;
      extra = 2;
    } else {
      cp = c & 0x07;
      extra = 3;
    }
    for (size_t k = 1; k <= extra; ++k) {
      cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
    }
    i += extra + 1;
    if (cp >= 0x10000) {
      cp -= 0x10000;
      units.push_back(static_cast<uint16_t>(0xD800 + (cp >> 10)));
      units.push_back(static_cast<uint16_t>(0xDC00 + (cp & 0x3FF)));
    } else {
      units.push_back(static_cast<uint16_t>(cp));
    }
  }
  return units;
}

inline void putUtf8Length(Bytes &out, uint32_t length) {
  if (length > 0x7F) {
    put8(out, static_cast<uint8_t>(0x80 | (length >> 8)));
  }
  put8(out, static_cast<uint8_t>(length & 0xFF));
}

// Bytes of text are written verbatim, so invalid UTF-8 can be encoded too.
inline Bytes encodeUtf8String(const std::string &text) {
  Bytes out;
  putUtf8Length(out, utf16Length(text));
  putUtf8Length(out, static_cast<uint32_t>(text.size()));
  out.insert(out.end(), text.begin(), text.end());
  put8(out, 0);
  return out;
}

inline Bytes encodeUtf16Units(const std::vector<uint16_t> &units) {
  Bytes out;
  uint32_t length = static_cast<uint32_t>(units.size());
  if (length > 0x7FFF) {
    put16(out, static_cast<uint16_t>(0x8000 | (length >> 16)));
  }
  put16(out, static_cast<uint16_t>(length & 0xFFFF));
  for (uint16_t unit : units) {
    put16(out, unit);
  }
  put16(out, 0);
  return out;
}

inline Bytes encodeUtf16String(const std::string &text) {
  return encodeUtf16Units(toUtf16(text));
}

// String pool chunk from already-encoded string entries.
inline Bytes poolChunk(const std::vector<Bytes> &entries, uint32_t flags) {
  uint32_t count = static_cast<uint32_t>(entries.size());
  uint32_t strings_start = 28 + 4 * count;

  Bytes offsets;
  Bytes data;
  for (const Bytes &entry : entries) {
    put32(offsets, static_cast<uint32_t>(data.size()));
    append(data, entry);
  }
  while (data.size() % 4 != 0) {
    put8(data, 0);
  }

  Bytes header;
  put32(header, count);
  put32(header, 0); // style count
  put32(header, flags);
  put32(header, count > 0 ? strings_start : 0);
  put32(header, 0); // styles start
  return chunk(0x0001, header, concat({offsets, data}));
}

inline Bytes stringPoolChunk(const std::vector<std::string> &strings, bool utf8,
                             uint32_t extra_flags = 0) {
  std::vector<Bytes> entries;
  for (const std::string &text : strings) {
    entries.push_back(utf8 ? encodeUtf8String(text) : encodeUtf16String(text));
  }
  uint32_t flags = (utf8 ? libaxml::StringPool::UTF8_FLAG : 0) | extra_flags;
  return poolChunk(entries, flags);
}

inline Bytes resourceMapChunk(const std::vector<uint32_t> &ids) {
  Bytes body;
  for (uint32_t id : ids) {
    put32(body, id);
  }
  return chunk(0x0180, {}, body);
}

inline Bytes nodeChunk(uint16_t type, const Bytes &body, uint32_t comment = NONE,
                       uint32_t line = 1) {
  Bytes header;
  put32(header, line);
  put32(header, comment);
  return chunk(type, header, body);
}

inline Bytes namespaceChunk(uint16_t type, uint32_t prefix, uint32_t uri) {
  Bytes body;
  put32(body, prefix);
  put32(body, uri);
  return nodeChunk(type, body);
}

struct RawAttr {
  uint32_t ns;
  uint32_t name;
  uint32_t raw;
  uint8_t type;
  uint32_t data;
};

inline Bytes startElementChunk(uint32_t ns, uint32_t name,
                               const std::vector<RawAttr> &attrs,
                               uint32_t comment = NONE,
                               uint16_t attr_size = 20) {
  Bytes body;
  put32(body, ns);
  put32(body, name);
  put16(body, 20); // attribute start
  put16(body, attr_size);
  put16(body, static_cast<uint16_t>(attrs.size()));
  put16(body, 0); // id index
  put16(body, 0); // class index
  put16(body, 0); // style index
  for (const RawAttr &attr : attrs) {
    size_t begin = body.size();
    put32(body, attr.ns);
    put32(body, attr.name);
    put32(body, attr.raw);
    put16(body, 8);
    put8(body, 0);
    put8(body, attr.type);
    put32(body, attr.data);
    while (body.size() - begin < attr_size) {
      put8(body, 0);
    }
  }
  return nodeChunk(0x0102, body, comment);
}

inline Bytes endElementChunk(uint32_t ns, uint32_t name) {
  Bytes body;
  put32(body, ns);
  put32(body, name);
  return nodeChunk(0x0103, body);
}

inline Bytes cdataChunk(uint32_t data_index) {
  Bytes body;
  put32(body, data_index);
  put16(body, 8);
  put8(body, 0);
  put8(body, 0);
  put32(body, 0);
  return nodeChunk(0x0104, body);
}

// Attribute described by strings; the builder interns them.
struct Attr {
  std::string ns;
  std::string name;
  uint8_t type = libaxml::ValueType::TYPE_NULL;
  uint32_t data = 0;
  std::string text;
  bool is_string = false;

  static Attr str(const std::string &ns, const std::string &name,
                  const std::string &text) {
    Attr attr;
    attr.ns = ns;
    attr.name = name;
    attr.type = libaxml::ValueType::STRING;
    attr.text = text;
    attr.is_string = true;
    return attr;
  }

  static Attr typed(const std::string &ns, const std::string &name,
                    uint8_t type, uint32_t data) {
    Attr attr;
    attr.ns = ns;
    attr.name = name;
    attr.type = type;
    attr.data = data;
    return attr;
  }
};

// Builds a complete document: XML wrapper, string pool, resource map and
// the node chunks in call order. Empty namespace strings mean "none".
class DocumentBuilder {
public:
  explicit DocumentBuilder(bool utf8 = true) : utf8_(utf8) {}

  uint32_t string(const std::string &text) {
    for (size_t i = 0; i < strings_.size(); ++i) {
      if (strings_[i] == text) {
        return static_cast<uint32_t>(i);
      }
    }
    strings_.push_back(text);
    return static_cast<uint32_t>(strings_.size() - 1);
  }

  // Attribute names carrying a resource ID must come first in the pool.
  uint32_t resourceString(const std::string &name, uint32_t resource_id) {
    if (strings_.size() != resource_ids_.size()) {
      throw std::logic_error("resource names must be interned first");
    }
    strings_.push_back(name);
    resource_ids_.push_back(resource_id);
    return static_cast<uint32_t>(strings_.size() - 1);
  }

  DocumentBuilder &startNamespace(const std::string &prefix,
                                  const std::string &uri) {
    append(nodes_, namespaceChunk(0x0100, optional(prefix), string(uri)));
    return *this;
  }

  DocumentBuilder &endNamespace(const std::string &prefix,
                                const std::string &uri) {
    append(nodes_, namespaceChunk(0x0101, optional(prefix), string(uri)));
    return *this;
  }

  DocumentBuilder &startElement(const std::string &ns, const std::string &name,
                                const std::vector<Attr> &attrs = {},
                                const std::string &comment = "") {
    std::vector<RawAttr> raw;
    for (const Attr &attr : attrs) {
      RawAttr encoded;
      encoded.ns = optional(attr.ns);
      encoded.name = string(attr.name);
      encoded.type = attr.type;
      if (attr.is_string) {
        encoded.data = string(attr.text);
        encoded.raw = encoded.data;
      } else {
        encoded.data = attr.data;
        encoded.raw = NONE;
      }
      raw.push_back(encoded);
    }
    uint32_t comment_index = comment.empty() ? NONE : string(comment);
    uint32_t ns_index = optional(ns);
    uint32_t name_index = string(name);
    append(nodes_, startElementChunk(ns_index, name_index, raw, comment_index));
    return *this;
  }

  DocumentBuilder &endElement(const std::string &ns, const std::string &name) {
    uint32_t ns_index = optional(ns);
    append(nodes_, endElementChunk(ns_index, string(name)));
    return *this;
  }

  DocumentBuilder &text(const std::string &text) {
    append(nodes_, cdataChunk(string(text)));
    return *this;
  }

  // Appends an arbitrary pre-encoded chunk to the node stream.
  DocumentBuilder &raw(const Bytes &bytes) {
    append(nodes_, bytes);
    return *this;
  }

  Bytes pool() const { return stringPoolChunk(strings_, utf8_); }

  Bytes body() const {
    Bytes out = pool();
    if (!resource_ids_.empty()) {
      append(out, resourceMapChunk(resource_ids_));
    }
    append(out, nodes_);
    return out;
  }

  Bytes build() const { return xmlChunk(body()); }

private:
  uint32_t optional(const std::string &text) {
    return text.empty() ? NONE : string(text);
  }

  bool utf8_;
  std::vector<std::string> strings_;
  std::vector<uint32_t> resource_ids_;
  Bytes nodes_;
};

// Collects warnings passed to a DecodeOptions callback.
struct WarningLog {
  std::vector<std::pair<std::string, std::string>> entries;

  libaxml::WarningCallback callback() {
    return [this](const std::string &category, const std::string &message) {
      entries.emplace_back(category, message);
    };
  }

  size_t count(const std::string &category) const {
    size_t n = 0;
    for (const auto &entry : entries) {
      if (entry.first == category) {
        ++n;
      }
    }
    return n;
  }
};

} // namespace axml_test

#endif
