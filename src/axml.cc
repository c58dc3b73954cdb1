#include "axml.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <utility>

namespace libaxml {

const char *const ANDROID_NAMESPACE_URI =
    "http://schemas.android.com/apk/res/android";

namespace {

const uint32_t NO_INDEX = 0xFFFFFFFF;
const size_t CHUNK_HEADER_SIZE = 8;
const size_t NODE_HEADER_SIZE = 16;
const size_t STRING_POOL_HEADER_SIZE = 28;
const size_t ATTRIBUTE_RECORD_SIZE = 20;
const int MAX_XML_CHUNK_NESTING = 32;

const char *const XML_NAMESPACE_URI = "http://www.w3.org/XML/1998/namespace";
const char *const XMLNS_NAMESPACE_URI = "http://www.w3.org/2000/xmlns/";

std::string hexDigits(uint32_t value, int width) {
  std::ostringstream ss;
  ss << std::hex << std::nouppercase << std::setw(width) << std::setfill('0')
     << value;
  return ss.str();
}

std::string hex8(uint32_t value) { return hexDigits(value, 8); }

std::string hexOffset(size_t offset) {
  std::ostringstream ss;
  ss << "0x" << std::hex << offset;
  return ss.str();
}

std::string describeError(ErrorKind kind, size_t offset,
                          const std::string &message) {
  return std::string(errorKindName(kind)) + " at offset " + hexOffset(offset) +
         ": " + message;
}

void report(const WarningCallback &callback, const std::string &category,
            const std::string &message) {
  if (callback) {
    callback(category, message);
  }
}

void appendUtf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

const uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

// U+FFFE and U+FFFF are not XML 1.0 characters.
void appendTextChar(std::string &out, uint32_t cp) {
  appendUtf8(out, cp == 0xFFFE || cp == 0xFFFF ? REPLACEMENT_CHARACTER : cp);
}

bool isHighSurrogate(uint32_t cp) { return cp >= 0xD800 && cp <= 0xDBFF; }
bool isLowSurrogate(uint32_t cp) { return cp >= 0xDC00 && cp <= 0xDFFF; }

uint32_t combineSurrogates(uint32_t high, uint32_t low) {
  return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
}

// Decodes one UTF-8 sequence at bytes[i]. Returns the number of bytes it
// spans, or 0 when the sequence is invalid. Surrogate code points are
// returned as-is so the caller can pair them.
size_t decodeUtf8Sequence(const std::vector<uint8_t> &bytes, size_t i,
                          uint32_t &cp) {
  uint8_t lead = bytes[i];
  size_t need;
  uint32_t min;
  if (lead < 0x80) {
    cp = lead;
    return 1;
  } else if ((lead & 0xE0) == 0xC0) {
    need = 1;
    cp = lead & 0x1F;
    min = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    need = 2;
    cp = lead & 0x0F;
    min = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    need = 3;
    cp = lead & 0x07;
    min = 0x10000;
  } else {
    return 0;
  }

  if (bytes.size() - i <= need) {
    return 0;
  }
  for (size_t k = 1; k <= need; ++k) {
    uint8_t b = bytes[i + k];
    if ((b & 0xC0) != 0x80) {
      return 0;
    }
    cp = (cp << 6) | (b & 0x3F);
  }
  if (cp < min || cp > 0x10FFFF) {
    return 0;
  }
  return need + 1;
}

std::string sanitizeUtf8(const std::vector<uint8_t> &bytes) {
  std::string out;
  out.reserve(bytes.size());

  size_t i = 0;
  while (i < bytes.size()) {
    uint32_t cp = 0;
    size_t used = decodeUtf8Sequence(bytes, i, cp);
    if (used == 0) {
      appendUtf8(out, REPLACEMENT_CHARACTER);
      ++i;
      continue;
    }

    if (isHighSurrogate(cp)) {
      // modified UTF-8 stores supplementary characters as two 3-byte halves
      uint32_t low = 0;
      size_t next = i + used;
      size_t low_used =
          next < bytes.size() ? decodeUtf8Sequence(bytes, next, low) : 0;
      if (low_used == 3 && isLowSurrogate(low)) {
        appendUtf8(out, combineSurrogates(cp, low));
        i = next + low_used;
      } else {
        appendUtf8(out, REPLACEMENT_CHARACTER);
        i += used;
      }
      continue;
    }
    if (isLowSurrogate(cp)) {
      appendUtf8(out, REPLACEMENT_CHARACTER);
      i += used;
      continue;
    }

    if (used == 1) {
      out += static_cast<char>(cp);
    } else {
      appendTextChar(out, cp);
    }
    i += used;
  }
  return out;
}

std::string sanitizeComment(const std::string &text) {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    if (c == '-' && !result.empty() && result.back() == '-') {
      result += ' ';
    }
    result += c;
  }
  if (!result.empty() && result.back() == '-') {
    result += ' ';
  }
  return result;
}

// NameStartChar and NameChar from XML 1.0 (fifth edition), without ':'.
bool isNameStartChar(uint32_t cp) {
  return (cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z') || cp == '_' ||
         (cp >= 0xC0 && cp <= 0xD6) || (cp >= 0xD8 && cp <= 0xF6) ||
         (cp >= 0xF8 && cp <= 0x2FF) || (cp >= 0x370 && cp <= 0x37D) ||
         (cp >= 0x37F && cp <= 0x1FFF) || (cp >= 0x200C && cp <= 0x200D) ||
         (cp >= 0x2070 && cp <= 0x218F) || (cp >= 0x2C00 && cp <= 0x2FEF) ||
         (cp >= 0x3001 && cp <= 0xD7FF) || (cp >= 0xF900 && cp <= 0xFDCF) ||
         (cp >= 0xFDF0 && cp <= 0xFFFD) || (cp >= 0x10000 && cp <= 0xEFFFF);
}

bool isNameChar(uint32_t cp) {
  return isNameStartChar(cp) || cp == '-' || cp == '.' ||
         (cp >= '0' && cp <= '9') || cp == 0xB7 ||
         (cp >= 0x300 && cp <= 0x36F) || (cp >= 0x203F && cp <= 0x2040);
}

// True when name can be written as an element name, attribute local name or
// namespace prefix.
bool isNcName(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  std::vector<uint8_t> bytes(name.begin(), name.end());
  size_t i = 0;
  while (i < bytes.size()) {
    uint32_t cp = 0;
    size_t used = decodeUtf8Sequence(bytes, i, cp);
    if (used == 0 || (i == 0 ? !isNameStartChar(cp) : !isNameChar(cp))) {
      return false;
    }
    i += used;
  }
  return true;
}

} // anonymous namespace

// ============================================================================
// ERRORS
// ============================================================================

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::UnexpectedEof:
    return "UnexpectedEof";
  case ErrorKind::MalformedChunk:
    return "MalformedChunk";
  case ErrorKind::StringIndexOutOfBounds:
    return "StringIndexOutOfBounds";
  case ErrorKind::StructuralMismatch:
    return "StructuralMismatch";
  case ErrorKind::UnsupportedEncoding:
    return "UnsupportedEncoding";
  }
  return "Unknown";
}

AxmlError::AxmlError(ErrorKind kind, size_t offset, const std::string &message)
    : std::runtime_error(describeError(kind, offset, message)), kind_(kind),
      offset_(offset) {}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

std::string encode_xml_entities(const std::string &text) {
  std::string result;
  result.reserve(static_cast<size_t>(text.size() * 1.2));

  for (char c : text) {
    switch (c) {
    case '&':
      result += "&amp;";
      break;
    case '<':
      result += "&lt;";
      break;
    case '>':
      result += "&gt;";
      break;
    case '"':
      result += "&quot;";
      break;
    case '\'':
      result += "&apos;";
      break;
    case '\t':
    case '\n':
    case '\r':
      result += c;
      break;
    default:
      // XML 1.0 has no representation for the remaining C0 controls
      if (static_cast<unsigned char>(c) >= 0x20) {
        result += c;
      }
      break;
    }
  }

  return result;
}

// ============================================================================
// BINARY READER
// ============================================================================

BinaryReader::BinaryReader(const uint8_t *data, size_t size)
    : base_(data), begin_(0), end_(size), pos_(0) {}

BinaryReader::BinaryReader(const uint8_t *base, size_t begin, size_t end)
    : base_(base), begin_(begin), end_(end), pos_(begin) {}

void BinaryReader::require(size_t length) const {
  if (length > end_ - pos_) {
    throw AxmlError(ErrorKind::UnexpectedEof, pos_,
                    "need " + std::to_string(length) + " bytes but only " +
                        std::to_string(end_ - pos_) + " remain");
  }
}

uint8_t BinaryReader::readU8() {
  require(1);
  return base_[pos_++];
}

uint16_t BinaryReader::readU16() {
  require(2);
  uint16_t value = static_cast<uint16_t>(base_[pos_] | (base_[pos_ + 1] << 8));
  pos_ += 2;
  return value;
}

uint32_t BinaryReader::readU32() {
  require(4);
  uint32_t value = static_cast<uint32_t>(base_[pos_]) |
                   (static_cast<uint32_t>(base_[pos_ + 1]) << 8) |
                   (static_cast<uint32_t>(base_[pos_ + 2]) << 16) |
                   (static_cast<uint32_t>(base_[pos_ + 3]) << 24);
  pos_ += 4;
  return value;
}

std::optional<uint32_t> BinaryReader::readOptionalIndex() {
  uint32_t value = readU32();
  if (value == NO_INDEX) {
    return std::nullopt;
  }
  return value;
}

std::vector<uint8_t> BinaryReader::readBytes(size_t length) {
  require(length);
  std::vector<uint8_t> data(base_ + pos_, base_ + pos_ + length);
  pos_ += length;
  return data;
}

void BinaryReader::skip(size_t length) {
  require(length);
  pos_ += length;
}

void BinaryReader::seek(size_t pos) {
  if (pos < begin_ || pos > end_) {
    throw AxmlError(ErrorKind::UnexpectedEof, pos,
                    "seek outside readable range [" + hexOffset(begin_) +
                        ", " + hexOffset(end_) + ")");
  }
  pos_ = pos;
}

BinaryReader BinaryReader::slice(size_t offset, size_t length) const {
  if (offset < begin_ || offset > end_ || length > end_ - offset) {
    throw AxmlError(ErrorKind::UnexpectedEof, offset,
                    "range of " + std::to_string(length) +
                        " bytes exceeds readable end " + hexOffset(end_));
  }
  return BinaryReader(base_, offset, offset + length);
}

// ============================================================================
// CHUNKS
// ============================================================================

ChunkType classifyChunk(uint16_t raw_type) {
  switch (raw_type) {
  case 0x0000:
    return ChunkType::Null;
  case 0x0001:
    return ChunkType::StringPool;
  case 0x0002:
    return ChunkType::Table;
  case 0x0003:
    return ChunkType::Xml;
  case 0x0100:
    return ChunkType::XmlStartNamespace;
  case 0x0101:
    return ChunkType::XmlEndNamespace;
  case 0x0102:
    return ChunkType::XmlStartElement;
  case 0x0103:
    return ChunkType::XmlEndElement;
  case 0x0104:
    return ChunkType::XmlCData;
  case 0x0180:
    return ChunkType::XmlResourceMap;
  default:
    return ChunkType::Unknown;
  }
}

ChunkHeader ChunkHeader::read(BinaryReader &reader) {
  ChunkHeader header;
  header.offset = reader.position();
  size_t available = reader.remaining();
  if (available < CHUNK_HEADER_SIZE) {
    throw AxmlError(ErrorKind::UnexpectedEof, header.offset,
                    "truncated chunk header (" + std::to_string(available) +
                        " bytes left)");
  }

  header.type = reader.readU16();
  header.header_size = reader.readU16();
  header.chunk_size = reader.readU32();

  if (header.header_size < CHUNK_HEADER_SIZE) {
    throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                    "header size " + std::to_string(header.header_size) +
                        " is smaller than 8");
  }
  if (header.chunk_size < header.header_size) {
    throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                    "chunk size " + std::to_string(header.chunk_size) +
                        " is smaller than its header size " +
                        std::to_string(header.header_size));
  }
  if (header.chunk_size > available) {
    throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                    "chunk size " + std::to_string(header.chunk_size) +
                        " exceeds the " + std::to_string(available) +
                        " bytes available");
  }
  return header;
}

// ============================================================================
// STRING POOL
// ============================================================================

namespace {

std::string decodeUtf16String(BinaryReader &in) {
  uint32_t length = in.readU16();
  if (length & 0x8000) {
    length = ((length & 0x7FFF) << 16) | in.readU16();
  }
  if (length > in.remaining() / 2) {
    throw AxmlError(ErrorKind::UnexpectedEof, in.position(),
                    "UTF-16 string of " + std::to_string(length) +
                        " units runs past the string pool");
  }

  std::string out;
  out.reserve(length);
  for (uint32_t i = 0; i < length; ++i) {
    uint32_t unit = in.readU16();
    if (isHighSurrogate(unit)) {
      if (i + 1 < length) {
        size_t mark = in.position();
        uint32_t next = in.readU16();
        if (isLowSurrogate(next)) {
          appendUtf8(out, combineSurrogates(unit, next));
          ++i;
          continue;
        }
        in.seek(mark);
      }
      appendUtf8(out, REPLACEMENT_CHARACTER);
    } else if (isLowSurrogate(unit)) {
      appendUtf8(out, REPLACEMENT_CHARACTER);
    } else {
      appendTextChar(out, unit);
    }
  }
  return out;
}

uint32_t readUtf8Length(BinaryReader &in) {
  uint32_t length = in.readU8();
  if (length & 0x80) {
    length = ((length & 0x7F) << 8) | in.readU8();
  }
  return length;
}

std::string decodeUtf8String(BinaryReader &in) {
  readUtf8Length(in); // length in UTF-16 units, not needed for decoding
  uint32_t byte_length = readUtf8Length(in);
  return sanitizeUtf8(in.readBytes(byte_length));
}

std::vector<uint32_t> readOffsetTable(BinaryReader &chunk, uint32_t count,
                                      const char *what) {
  if (count > chunk.remaining() / 4) {
    throw AxmlError(ErrorKind::UnexpectedEof, chunk.position(),
                    std::string(what) + " table of " + std::to_string(count) +
                        " entries runs past the string pool");
  }
  std::vector<uint32_t> offsets;
  offsets.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    offsets.push_back(chunk.readU32());
  }
  return offsets;
}

} // anonymous namespace

StringPool StringPool::decode(const BinaryReader &reader,
                              const ChunkHeader &header,
                              const WarningCallback &warn) {
  if (header.header_size < STRING_POOL_HEADER_SIZE) {
    throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                    "string pool header size " +
                        std::to_string(header.header_size) +
                        " is smaller than 28");
  }

  BinaryReader chunk = reader.slice(header.offset, header.chunk_size);
  chunk.seek(header.offset + CHUNK_HEADER_SIZE);
  uint32_t string_count = chunk.readU32();
  uint32_t style_count = chunk.readU32();
  size_t flags_offset = chunk.position();
  uint32_t flags = chunk.readU32();
  uint32_t strings_start = chunk.readU32();
  uint32_t styles_start = chunk.readU32();

  if (flags & ~(SORTED_FLAG | UTF8_FLAG)) {
    throw AxmlError(ErrorKind::UnsupportedEncoding, flags_offset,
                    "unsupported string pool flags 0x" + hex8(flags));
  }

  StringPool pool;
  pool.encoding_ = (flags & UTF8_FLAG) ? Encoding::Utf8 : Encoding::Utf16;
  pool.sorted_ = (flags & SORTED_FLAG) != 0;
  pool.style_count_ = style_count;

  chunk.seek(header.bodyOffset());
  std::vector<uint32_t> string_offsets =
      readOffsetTable(chunk, string_count, "string offset");
  std::vector<uint32_t> style_offsets =
      readOffsetTable(chunk, style_count, "style offset");

  // string data ends where the style data begins, if there is any
  size_t data_end = header.endOffset();
  if (style_count > 0 && styles_start > strings_start &&
      styles_start < header.chunk_size) {
    data_end = header.offset + styles_start;
  }
  size_t strings_base = header.offset + strings_start;

  pool.strings_.reserve(string_count);
  for (uint32_t i = 0; i < string_count; ++i) {
    uint64_t pos = static_cast<uint64_t>(strings_base) + string_offsets[i];
    if (strings_start >= header.chunk_size || pos >= data_end) {
      throw AxmlError(ErrorKind::StringIndexOutOfBounds,
                      header.bodyOffset() + i * 4,
                      "string #" + std::to_string(i) + " offset 0x" +
                          hex8(string_offsets[i]) +
                          " points outside the string data");
    }
    BinaryReader in = chunk.slice(static_cast<size_t>(pos),
                                  data_end - static_cast<size_t>(pos));
    if (pool.encoding_ == Encoding::Utf8) {
      pool.strings_.push_back(decodeUtf8String(in));
    } else {
      pool.strings_.push_back(decodeUtf16String(in));
    }
  }

  // Styles are not interpreted, but each span list should be terminated
  // inside the chunk.
  for (size_t i = 0; i < style_offsets.size(); ++i) {
    uint64_t pos = static_cast<uint64_t>(header.offset) + styles_start +
                   style_offsets[i];
    if (pos >= header.endOffset()) {
      report(warn, "String pool",
             "style #" + std::to_string(i) + " points outside the pool");
      break;
    }
    try {
      BinaryReader spans = chunk.slice(static_cast<size_t>(pos),
                                       header.endOffset() -
                                           static_cast<size_t>(pos));
      while (spans.readU32() != NO_INDEX) {
        spans.skip(8);
      }
    } catch (const AxmlError &e) {
      report(warn, "String pool",
             "style #" + std::to_string(i) + " is unterminated: " + e.what());
      break;
    }
  }

  return pool;
}

const std::string &StringPool::at(uint32_t index, size_t offset) const {
  if (index >= strings_.size()) {
    throw AxmlError(ErrorKind::StringIndexOutOfBounds, offset,
                    "string index " + std::to_string(index) +
                        " out of range (pool has " +
                        std::to_string(strings_.size()) + " strings)");
  }
  return strings_[index];
}

// ============================================================================
// RESOURCE MAP
// ============================================================================

ResourceMap ResourceMap::decode(const BinaryReader &reader,
                                const ChunkHeader &header) {
  size_t body_size = header.chunk_size - header.header_size;
  if (body_size % 4 != 0) {
    throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                    "resource map body of " + std::to_string(body_size) +
                        " bytes is not a multiple of 4");
  }

  BinaryReader body = reader.slice(header.bodyOffset(), body_size);
  ResourceMap map;
  map.ids_.reserve(body_size / 4);
  while (body.remaining() > 0) {
    map.ids_.push_back(body.readU32());
  }
  return map;
}

std::optional<uint32_t> ResourceMap::idFor(uint32_t string_index) const {
  if (string_index < ids_.size()) {
    return ids_[string_index];
  }
  return std::nullopt;
}

// ============================================================================
// TYPED VALUES
// ============================================================================

TypedValue TypedValue::read(BinaryReader &reader) {
  TypedValue value;
  value.size = reader.readU16();
  value.res0 = reader.readU8();
  value.data_type = reader.readU8();
  value.data = reader.readU32();
  return value;
}

std::string formatFloat(float value) {
  if (std::isfinite(value) && value == std::floor(value) &&
      std::fabs(value) < 1e15f) {
    return std::to_string(static_cast<long long>(value)) + ".0";
  }
  if (!std::isfinite(value)) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
  }

  // fewest significant digits that read back as the same float
  std::string text;
  for (int precision = 1;
       precision <= std::numeric_limits<float>::max_digits10; ++precision) {
    std::ostringstream ss;
    ss << std::setprecision(precision) << value;
    text = ss.str();
    float parsed = 0.0f;
    std::istringstream(text) >> parsed;
    if (parsed == value) {
      break;
    }
  }
  return text;
}

std::string formatComplex(uint32_t data, bool fraction,
                          const WarningCallback &warn) {
  const float MANTISSA_MULT = 1.0f / (1 << 8);
  const float RADIX_MULTS[] = {
      1.0f * MANTISSA_MULT, 1.0f / (1 << 7) * MANTISSA_MULT,
      1.0f / (1 << 15) * MANTISSA_MULT, 1.0f / (1 << 23) * MANTISSA_MULT};

  float value = static_cast<float>(static_cast<int32_t>(data & 0xFFFFFF00u)) *
                RADIX_MULTS[(data >> 4) & 0x3];
  uint32_t unit = data & 0xF;

  if (fraction) {
    std::string result = formatFloat(value * 100.0f);
    switch (unit) {
    case 0:
      return result + "%";
    case 1:
      return result + "%p";
    default:
      report(warn, "Value types",
             "unknown fraction unit " + std::to_string(unit));
      return result;
    }
  }

  static const char *const UNITS[] = {"px", "dp", "sp", "pt", "in", "mm"};
  std::string result = formatFloat(value);
  if (unit < sizeof(UNITS) / sizeof(UNITS[0])) {
    return result + UNITS[unit];
  }
  report(warn, "Value types", "unknown dimension unit " + std::to_string(unit));
  return result;
}

std::string formatTypedValue(const TypedValue &value, const StringPool &pool,
                             std::optional<uint32_t> raw_value_index,
                             size_t offset, const WarningCallback &warn) {
  uint32_t data = value.data;

  switch (value.data_type) {
  case ValueType::TYPE_NULL:
    return "";
  case ValueType::REFERENCE:
    return "@0x" + hex8(data);
  case ValueType::ATTRIBUTE:
    return "?0x" + hex8(data);
  case ValueType::STRING:
    return pool.at(raw_value_index ? *raw_value_index : data, offset);
  case ValueType::FLOAT: {
    float f;
    std::memcpy(&f, &data, sizeof(float));
    return formatFloat(f);
  }
  case ValueType::DIMENSION:
    return formatComplex(data, false, warn);
  case ValueType::FRACTION:
    return formatComplex(data, true, warn);
  case ValueType::INT_DEC:
    return std::to_string(static_cast<int32_t>(data));
  case ValueType::INT_HEX:
    return "0x" + hex8(data);
  case ValueType::INT_BOOLEAN:
    return data != 0 ? "true" : "false";
  case ValueType::INT_COLOR_ARGB8:
    return "#" + hex8(data);
  case ValueType::INT_COLOR_RGB8:
    return "#" + hexDigits(data & 0xFFFFFF, 6);
  case ValueType::INT_COLOR_ARGB4:
    return "#" + hexDigits((data >> 28) & 0xF, 1) +
           hexDigits((data >> 20) & 0xF, 1) +
           hexDigits((data >> 12) & 0xF, 1) + hexDigits((data >> 4) & 0xF, 1);
  case ValueType::INT_COLOR_RGB4:
    return "#" + hexDigits((data >> 20) & 0xF, 1) +
           hexDigits((data >> 12) & 0xF, 1) + hexDigits((data >> 4) & 0xF, 1);
  default:
    report(warn, "Value types",
           "unrecognized value type 0x" + hexDigits(value.data_type, 2) +
               " at offset " + hexOffset(offset) + ", rendered as raw hex");
    return "0x" + hex8(data);
  }
}

// ============================================================================
// XML NODES
// ============================================================================

namespace {

NodeHeader readNodeHeader(BinaryReader &chunk, const ChunkHeader &header) {
  if (header.header_size < NODE_HEADER_SIZE) {
    throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                    "XML node header size " +
                        std::to_string(header.header_size) +
                        " is smaller than 16");
  }
  chunk.seek(header.offset + CHUNK_HEADER_SIZE);
  NodeHeader node;
  node.line_number = chunk.readU32();
  node.comment_index = chunk.readOptionalIndex();
  chunk.seek(header.bodyOffset());
  return node;
}

} // anonymous namespace

NamespaceNode decodeNamespaceNode(const BinaryReader &reader,
                                  const ChunkHeader &header) {
  BinaryReader chunk = reader.slice(header.offset, header.chunk_size);
  NamespaceNode ns;
  ns.node = readNodeHeader(chunk, header);
  ns.prefix_index = chunk.readOptionalIndex();
  ns.uri_index = chunk.readU32();
  return ns;
}

ElementStartNode decodeElementStartNode(const BinaryReader &reader,
                                        const ChunkHeader &header) {
  BinaryReader chunk = reader.slice(header.offset, header.chunk_size);
  ElementStartNode element;
  element.node = readNodeHeader(chunk, header);

  size_t ext_start = chunk.position();
  element.namespace_index = chunk.readOptionalIndex();
  element.name_index = chunk.readU32();
  element.attribute_start = chunk.readU16();
  element.attribute_size = chunk.readU16();
  element.attribute_count = chunk.readU16();
  element.id_index = chunk.readU16();
  element.class_index = chunk.readU16();
  element.style_index = chunk.readU16();

  if (element.attribute_count > 0 &&
      element.attribute_size < ATTRIBUTE_RECORD_SIZE) {
    throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                    "attribute record size " +
                        std::to_string(element.attribute_size) +
                        " is smaller than 20");
  }

  element.attributes.reserve(element.attribute_count);
  for (uint16_t i = 0; i < element.attribute_count; ++i) {
    chunk.seek(ext_start + element.attribute_start +
               static_cast<size_t>(i) * element.attribute_size);
    Attribute attr;
    attr.namespace_index = chunk.readOptionalIndex();
    attr.name_index = chunk.readU32();
    attr.raw_value_index = chunk.readOptionalIndex();
    attr.typed_value = TypedValue::read(chunk);
    element.attributes.push_back(attr);
  }
  return element;
}

ElementEndNode decodeElementEndNode(const BinaryReader &reader,
                                    const ChunkHeader &header) {
  BinaryReader chunk = reader.slice(header.offset, header.chunk_size);
  ElementEndNode element;
  element.node = readNodeHeader(chunk, header);
  element.namespace_index = chunk.readOptionalIndex();
  element.name_index = chunk.readU32();
  return element;
}

CDataNode decodeCDataNode(const BinaryReader &reader,
                          const ChunkHeader &header) {
  BinaryReader chunk = reader.slice(header.offset, header.chunk_size);
  CDataNode cdata;
  cdata.node = readNodeHeader(chunk, header);
  cdata.data_index = chunk.readU32();
  cdata.typed_value = TypedValue::read(chunk);
  return cdata;
}

// ============================================================================
// DOCUMENT ASSEMBLER
// ============================================================================

namespace {

struct NamespaceFrame {
  std::optional<uint32_t> prefix_index;
  uint32_t uri_index;
  std::string prefix;
  std::string uri;
  // false when the binding has no XML rendering (bad or reserved prefix)
  bool usable;
  bool declared;
  // open-element depth of the element carrying the declaration
  size_t declared_depth;
};

struct Binding {
  std::string prefix;
  std::string uri;
};

struct ElementFrame {
  std::optional<uint32_t> namespace_index;
  uint32_t name_index = 0;
  std::string qualified_name;
  // xmlns declarations written on this element
  std::vector<Binding> bindings;
};

class DocumentAssembler {
public:
  DocumentAssembler(const uint8_t *data, size_t size,
                    const DecodeOptions &options)
      : data_(data), size_(size), options_(options) {}

  std::string run() {
    if (options_.xml_declaration) {
      out_ += "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
    }

    BinaryReader reader(data_, size_);
    ChunkHeader top = ChunkHeader::read(reader);
    if (classifyChunk(top.type) != ChunkType::Xml) {
      // Android itself ignores the wrapper's type
      warn("Chunks", "unexpected document chunk type 0x" +
                         hexDigits(top.type, 4) +
                         ", treating it as the XML wrapper");
    }
    processStream(reader.slice(top.bodyOffset(),
                               top.chunk_size - top.header_size),
                  0);

    if (!root_seen_) {
      throw AxmlError(ErrorKind::MalformedChunk, top.endOffset(),
                      "document has no root element");
    }
    while (!elements_.empty()) {
      warn("Structure", "element <" + elements_.back().qualified_name +
                            "> not closed at end of document");
      closeElement();
    }
    if (!namespaces_.empty()) {
      warn("Namespaces", std::to_string(namespaces_.size()) +
                             " namespace(s) not ended at end of document");
    }
    out_ += "\n";
    return out_;
  }

private:
  void warn(const std::string &category, const std::string &message) {
    report(options_.warning_callback, category, message);
  }

  const std::string &str(uint32_t index, size_t offset) const {
    if (!pool_) {
      throw AxmlError(ErrorKind::StringIndexOutOfBounds, offset,
                      "string index " + std::to_string(index) +
                          " referenced before the string pool");
    }
    return pool_->at(index, offset);
  }

  void processStream(const BinaryReader &region, int depth) {
    if (depth > MAX_XML_CHUNK_NESTING) {
      throw AxmlError(ErrorKind::MalformedChunk, region.begin(),
                      "XML chunks nested too deeply");
    }

    BinaryReader cursor = region;
    while (cursor.remaining() > 0) {
      ChunkHeader header = ChunkHeader::read(cursor);
      dispatch(cursor, header, depth);
      cursor.seek(header.endOffset());
    }
  }

  void dispatch(const BinaryReader &cursor, const ChunkHeader &header,
                int depth) {
    switch (classifyChunk(header.type)) {
    case ChunkType::StringPool:
      if (pool_ || seen_nodes_) {
        throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                        pool_ ? "duplicate string pool"
                              : "string pool after XML node chunks");
      }
      pool_ = StringPool::decode(cursor, header, options_.warning_callback);
      break;

    case ChunkType::XmlResourceMap:
      if (has_resource_map_ || seen_nodes_) {
        throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                        has_resource_map_
                            ? "duplicate resource map"
                            : "resource map after XML node chunks");
      }
      resource_map_ = ResourceMap::decode(cursor, header);
      has_resource_map_ = true;
      break;

    case ChunkType::XmlStartNamespace:
      seen_nodes_ = true;
      onStartNamespace(decodeNamespaceNode(cursor, header), header);
      break;

    case ChunkType::XmlEndNamespace:
      seen_nodes_ = true;
      onEndNamespace(decodeNamespaceNode(cursor, header), header);
      break;

    case ChunkType::XmlStartElement:
      seen_nodes_ = true;
      onStartElement(decodeElementStartNode(cursor, header), header);
      break;

    case ChunkType::XmlEndElement:
      seen_nodes_ = true;
      onEndElement(decodeElementEndNode(cursor, header), header);
      break;

    case ChunkType::XmlCData:
      seen_nodes_ = true;
      onCData(decodeCDataNode(cursor, header), header);
      break;

    case ChunkType::Xml:
      processStream(cursor.slice(header.bodyOffset(),
                                 header.chunk_size - header.header_size),
                    depth + 1);
      break;

    case ChunkType::Null:
    case ChunkType::Table:
    case ChunkType::Unknown:
      warn("Chunks", "skipping chunk type 0x" + hexDigits(header.type, 4) +
                         " at offset " + hexOffset(header.offset));
      break;
    }
  }

  void onStartNamespace(const NamespaceNode &ns, const ChunkHeader &header) {
    NamespaceFrame frame;
    frame.prefix_index = ns.prefix_index;
    frame.uri_index = ns.uri_index;
    frame.uri = str(ns.uri_index, header.offset);
    frame.prefix = prefixOf(ns.prefix_index, header.offset);
    frame.declared = false;
    frame.declared_depth = 0;

    bool reserved_uri =
        frame.uri == XML_NAMESPACE_URI || frame.uri == XMLNS_NAMESPACE_URI;
    if (frame.prefix.empty()) {
      frame.usable = !reserved_uri;
    } else {
      frame.usable = isNcName(frame.prefix) && frame.prefix != "xml" &&
                     frame.prefix != "xmlns" && !frame.uri.empty() &&
                     !reserved_uri;
    }
    if (!frame.usable) {
      warn("Namespaces", "namespace binding '" + frame.prefix + "' -> '" +
                             frame.uri + "' at offset " +
                             hexOffset(header.offset) +
                             " cannot be declared in XML, ignored");
    }
    namespaces_.push_back(std::move(frame));
  }

  void onEndNamespace(const NamespaceNode &ns, const ChunkHeader &header) {
    const std::string &uri = str(ns.uri_index, header.offset);
    if (namespaces_.empty()) {
      warn("Namespaces", "end of namespace '" + uri +
                             "' without a matching start, ignored");
      return;
    }

    NamespaceFrame top = namespaces_.back();
    namespaces_.pop_back();
    if (uri != top.uri || prefixOf(ns.prefix_index, header.offset) !=
                              prefixOf(top.prefix_index, header.offset)) {
      warn("Namespaces", "end of namespace '" + uri + "' at offset " +
                             hexOffset(header.offset) +
                             " does not match open namespace '" + top.uri +
                             "', closing the open one");
    }
  }

  void onStartElement(const ElementStartNode &element,
                      const ChunkHeader &header) {
    if (elements_.empty() && root_closed_) {
      throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                      "second root element");
    }
    closeStartTag();

    ElementFrame frame;
    frame.namespace_index = element.namespace_index;
    frame.name_index = element.name_index;

    for (NamespaceFrame &ns : namespaces_) {
      if (ns.declared || !ns.usable) {
        continue;
      }
      ns.declared = true;
      ns.declared_depth = elements_.size();
      declare(frame, ns.prefix, ns.uri);
    }

    const std::string &name = str(element.name_index, header.offset);
    if (!isNcName(name)) {
      throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                      "element name '" + name + "' is not a valid XML name");
    }
    frame.qualified_name = name;
    std::string element_uri =
        namespaceOf(element.namespace_index, header.offset);
    if (!element_uri.empty()) {
      if (element_uri == XMLNS_NAMESPACE_URI) {
        throw AxmlError(ErrorKind::MalformedChunk, header.offset,
                        "element <" + name + "> in the xmlns namespace");
      }
      std::string prefix = prefixForUri(element_uri, false, frame);
      if (!prefix.empty()) {
        frame.qualified_name = prefix + ":" + name;
      }
    } else {
      std::optional<std::string> default_uri = boundUri("", frame);
      if (default_uri && !default_uri->empty()) {
        // unqualified element below a default namespace declaration
        declare(frame, "", "");
      }
    }

    std::string attributes;
    std::vector<std::string> seen;
    for (size_t i = 0; i < element.attributes.size(); ++i) {
      const Attribute &attr = element.attributes[i];
      std::string attr_name = str(attr.name_index, header.offset);
      std::optional<uint32_t> res_id = resource_map_.idFor(attr.name_index);

      bool invalid = !attr_name.empty() && !isNcName(attr_name);
      if (attr_name.empty() || invalid) {
        std::string where = "attribute #" + std::to_string(i) + " of <" +
                            frame.qualified_name + ">";
        if (!options_.resolve_framework_names || !res_id) {
          warn("Attributes", where + (invalid ? " has invalid name '" +
                                                    attr_name + "', dropped"
                                              : " has no name, dropped"));
          continue;
        }
        const char *known = frameworkAttributeName(*res_id);
        std::string resolved = known ? known : "_0x" + hex8(*res_id);
        if (invalid) {
          warn("Attributes", where + " has invalid name '" + attr_name +
                                 "', renamed to '" + resolved + "'");
        }
        attr_name = resolved;
      }

      std::string uri;
      if (attr.namespace_index) {
        uri = str(*attr.namespace_index, header.offset);
      } else if (options_.android_prefix_fallback && res_id &&
                 (*res_id >> 24) == 0x01) {
        uri = ANDROID_NAMESPACE_URI;
      }
      if (uri == XMLNS_NAMESPACE_URI ||
          (uri.empty() && attr_name == "xmlns")) {
        warn("Attributes", "attribute '" + attr_name + "' of <" +
                               frame.qualified_name +
                               "> would declare a namespace, dropped");
        continue;
      }
      std::string qualified = attr_name;
      if (!uri.empty()) {
        qualified = prefixForUri(uri, true, frame) + ":" + attr_name;
      }

      if (std::find(seen.begin(), seen.end(), qualified) != seen.end()) {
        warn("Attributes", "duplicate attribute '" + qualified + "' on <" +
                               frame.qualified_name + ">, later one dropped");
        continue;
      }
      seen.push_back(qualified);

      std::string value =
          formatTypedValue(attr.typed_value, *pool_, attr.raw_value_index,
                           header.offset, options_.warning_callback);
      attributes += " " + qualified + "=\"" + encode_xml_entities(value) + "\"";
    }

    if (options_.emit_comments && element.node.comment_index) {
      out_ += "<!--" +
              sanitizeComment(str(*element.node.comment_index, header.offset)) +
              "-->";
    }
    out_ += "<" + frame.qualified_name;
    for (const Binding &binding : frame.bindings) {
      out_ += " xmlns";
      if (!binding.prefix.empty()) {
        out_ += ":" + binding.prefix;
      }
      out_ += "=\"" + encode_xml_entities(binding.uri) + "\"";
    }
    out_ += attributes;

    start_tag_open_ = true;
    root_seen_ = true;
    elements_.push_back(std::move(frame));
  }

  void onEndElement(const ElementEndNode &element, const ChunkHeader &header) {
    const std::string &name = str(element.name_index, header.offset);
    if (elements_.empty()) {
      warn("Structure", "end of element '" + name +
                            "' without an open element, ignored");
      return;
    }

    const ElementFrame &open = elements_.back();
    if (name != str(open.name_index, header.offset) ||
        namespaceOf(element.namespace_index, header.offset) !=
            namespaceOf(open.namespace_index, header.offset)) {
      warn("Structure", "end of element '" + name + "' at offset " +
                            hexOffset(header.offset) +
                            " does not match open element <" +
                            open.qualified_name + ">, closing it");
    }
    closeElement();
  }

  void onCData(const CDataNode &cdata, const ChunkHeader &header) {
    const std::string &text = str(cdata.data_index, header.offset);
    if (elements_.empty()) {
      warn("Structure", "character data outside the root element at offset " +
                            hexOffset(header.offset) + " dropped");
      return;
    }
    closeStartTag();
    out_ += encode_xml_entities(text);
  }

  void closeStartTag() {
    if (start_tag_open_) {
      out_ += ">";
      start_tag_open_ = false;
    }
  }

  void closeElement() {
    if (start_tag_open_) {
      out_ += "/>";
      start_tag_open_ = false;
    } else {
      out_ += "</" + elements_.back().qualified_name + ">";
    }
    elements_.pop_back();
    if (elements_.empty()) {
      root_closed_ = true;
    }

    // declarations made on the closed element are out of scope now
    for (NamespaceFrame &ns : namespaces_) {
      if (ns.declared && ns.declared_depth == elements_.size()) {
        ns.declared = false;
      }
    }
  }

  std::string prefixOf(std::optional<uint32_t> index, size_t offset) const {
    return index ? str(*index, offset) : std::string();
  }

  std::string namespaceOf(std::optional<uint32_t> index, size_t offset) const {
    return index ? str(*index, offset) : std::string();
  }

  // Adds an xmlns declaration to the element being started. A later
  // declaration of the same prefix replaces the earlier one.
  void declare(ElementFrame &current, const std::string &prefix,
               const std::string &uri) {
    for (Binding &binding : current.bindings) {
      if (binding.prefix == prefix) {
        binding.uri = uri;
        return;
      }
    }
    current.bindings.push_back({prefix, uri});
  }

  // URI bound to prefix in the XML output at the element being started.
  std::optional<std::string> boundUri(const std::string &prefix,
                                      const ElementFrame &current) const {
    for (const Binding &binding : current.bindings) {
      if (binding.prefix == prefix) {
        return binding.uri;
      }
    }
    for (auto it = elements_.rbegin(); it != elements_.rend(); ++it) {
      for (const Binding &binding : it->bindings) {
        if (binding.prefix == prefix) {
          return binding.uri;
        }
      }
    }
    return std::nullopt;
  }

  bool prefixInUse(const std::string &prefix,
                   const ElementFrame &current) const {
    for (const NamespaceFrame &frame : namespaces_) {
      if (frame.prefix == prefix) {
        return true;
      }
    }
    return boundUri(prefix, current).has_value();
  }

  // Innermost namespace frame bound to uri whose prefix still means uri in
  // the output, then any binding in the output, then a new binding declared
  // on the current element.
  std::string prefixForUri(const std::string &uri, bool attribute,
                           ElementFrame &current) {
    if (uri == XML_NAMESPACE_URI) {
      return "xml";
    }

    for (auto it = namespaces_.rbegin(); it != namespaces_.rend(); ++it) {
      // attributes never pick up the default namespace
      if (!it->usable || it->uri != uri ||
          (attribute && it->prefix.empty())) {
        continue;
      }
      std::optional<std::string> bound = boundUri(it->prefix, current);
      if (bound && *bound == uri) {
        return it->prefix;
      }
    }

    std::vector<std::string> shadowed;
    auto scan = [&](const std::vector<Binding> &bindings)
        -> std::optional<std::string> {
      for (const Binding &binding : bindings) {
        bool hidden = std::find(shadowed.begin(), shadowed.end(),
                                binding.prefix) != shadowed.end();
        shadowed.push_back(binding.prefix);
        if (!hidden && binding.uri == uri &&
            !(attribute && binding.prefix.empty())) {
          return binding.prefix;
        }
      }
      return std::nullopt;
    };
    if (std::optional<std::string> found = scan(current.bindings)) {
      return *found;
    }
    for (auto it = elements_.rbegin(); it != elements_.rend(); ++it) {
      if (std::optional<std::string> found = scan(it->bindings)) {
        return *found;
      }
    }

    std::string prefix;
    if (uri == ANDROID_NAMESPACE_URI && !prefixInUse("android", current)) {
      prefix = "android";
    } else {
      do {
        prefix = "ns" + std::to_string(synthetic_counter_++);
      } while (prefixInUse(prefix, current));
    }
    warn("Namespaces", "namespace '" + uri +
                           "' has no declaration in scope, declared as '" +
                           prefix + "' on <" + str(current.name_index, 0) +
                           ">");
    declare(current, prefix, uri);
    return prefix;
  }

  const uint8_t *data_;
  size_t size_;
  const DecodeOptions &options_;

  std::optional<StringPool> pool_;
  ResourceMap resource_map_;
  bool has_resource_map_ = false;
  bool seen_nodes_ = false;

  std::vector<NamespaceFrame> namespaces_;
  std::vector<ElementFrame> elements_;
  bool start_tag_open_ = false;
  bool root_seen_ = false;
  bool root_closed_ = false;
  int synthetic_counter_ = 0;

  std::string out_;
};

} // anonymous namespace

AxmlDocumentDecoder::AxmlDocumentDecoder(const uint8_t *data, size_t size,
                                         DecodeOptions options)
    : data_(data), size_(size), options_(std::move(options)) {}

std::string AxmlDocumentDecoder::decode() {
  DocumentAssembler assembler(data_, size_, options_);
  return assembler.run();
}

// ============================================================================
// HIGH-LEVEL API
// ============================================================================

std::vector<uint8_t> readAxmlStream(std::istream &input) {
  std::vector<uint8_t> data;
  char buffer[8192];
  while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
    data.insert(data.end(), buffer, buffer + input.gcount());
  }
  if (input.bad()) {
    throw std::runtime_error("Failed to read AXML input stream");
  }
  return data;
}

std::vector<uint8_t> readAxmlFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open input file: " + path);
  }
  return readAxmlStream(file);
}

std::string convertAxmlToXmlString(const uint8_t *data, size_t size,
                                   const DecodeOptions &options) {
  AxmlDocumentDecoder decoder(data, size, options);
  return decoder.decode();
}

std::string convertAxmlToXmlString(const std::vector<uint8_t> &data,
                                   const DecodeOptions &options) {
  return convertAxmlToXmlString(data.data(), data.size(), options);
}

void convertAxmlToXmlStream(const uint8_t *data, size_t size,
                            std::ostream &output,
                            const DecodeOptions &options) {
  std::string xml = convertAxmlToXmlString(data, size, options);
  output << xml;
  if (!output) {
    throw std::runtime_error("Failed to write XML output");
  }
}

std::string convertAxmlFileToXmlString(const std::string &axml_path,
                                       const DecodeOptions &options) {
  std::vector<uint8_t> data = readAxmlFile(axml_path);
  return convertAxmlToXmlString(data, options);
}

void convertAxmlFileToXmlFile(const std::string &axml_path,
                              const std::string &xml_path,
                              const DecodeOptions &options) {
  std::string xml = convertAxmlFileToXmlString(axml_path, options);

  std::ofstream out(xml_path, std::ios::binary);
  if (!out) {
    throw std::runtime_error("Failed to open output file: " + xml_path);
  }
  out << xml;
  if (!out) {
    throw std::runtime_error("Failed to write output file: " + xml_path);
  }
}

} // namespace libaxml
