#ifndef LIBAXML_H
#define LIBAXML_H
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @namespace libaxml
 * @brief Decoder for Android's compiled binary XML (AXML) resource format.
 *
 * AXML is the chunk-based encoding aapt/aapt2 produce for
 * AndroidManifest.xml and compiled layouts inside an APK. Strings are
 * deduplicated into a pool, element and attribute names are pool indices,
 * and attribute values carry a type tag. This library turns such a buffer
 * back into well-formed XML text.
 *
 * The decoder is one-way (binary to text) and does not resolve resource
 * references against resources.arsc: references are emitted as raw
 * numeric IDs (`@0x7f040001`).
 *
 * ### AXML File to XML String
 * @code
 * #include "axml.hpp"
 *
 * std::string xml = libaxml::convertAxmlFileToXmlString("AndroidManifest.xml");
 * std::cout << xml;
 * @endcode
 *
 * ### In-memory Buffer with Warning Callback
 * @code
 * libaxml::DecodeOptions opts;
 * opts.warning_callback = [](const std::string& category, const std::string& msg) {
 *     std::cerr << "[" << category << "] " << msg << std::endl;
 * };
 * std::string xml = libaxml::convertAxmlToXmlString(bytes.data(), bytes.size(), opts);
 * @endcode
 *
 * ### Manifest Summary
 * @code
 * libaxml::ManifestSummary summary = libaxml::summarizeManifest(xml);
 * std::cout << summary.package << " targets SDK " << summary.target_sdk << std::endl;
 * @endcode
 */
namespace libaxml {

/**
 * @typedef WarningCallback
 * @brief Callback receiving non-fatal diagnostics during decoding.
 *
 * - @param category Short category string (e.g. "Namespaces", "Structure")
 * - @param message Human readable description
 *
 * Recoverable anomalies (mismatched end chunks, unknown value types,
 * unknown chunk types, duplicate attributes) are reported here and never
 * interrupt the decode.
 */
using WarningCallback =
    std::function<void(const std::string& category, const std::string& message)>;

/// Namespace URI of the Android framework attributes.
extern const char* const ANDROID_NAMESPACE_URI;

// ============================================================================
// ERRORS
// ============================================================================

/**
 * @defgroup Errors Error Reporting
 * @{
 */

/**
 * @enum ErrorKind
 * @brief Classification of decode failures.
 */
enum class ErrorKind {
    UnexpectedEof,           ///< A read needed more bytes than remain
    MalformedChunk,          ///< Chunk sizes inconsistent with bounds or layout
    StringIndexOutOfBounds,  ///< String pool index or offset out of range
    StructuralMismatch,      ///< End chunk does not match the open frame
    UnsupportedEncoding      ///< String pool flags name an unknown encoding
};

/**
 * @brief Stable name of an error kind (e.g. "UnexpectedEof").
 */
const char* errorKindName(ErrorKind kind);

/**
 * @class AxmlError
 * @brief Terminal decode failure.
 *
 * Carries the kind of failure and the absolute byte offset in the input
 * buffer where it was detected.
 */
class AxmlError : public std::runtime_error {
   public:
    AxmlError(ErrorKind kind, size_t offset, const std::string& message);

    ErrorKind kind() const { return kind_; }
    size_t offset() const { return offset_; }

   private:
    ErrorKind kind_;
    size_t offset_;
};

/** @} */

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Encode XML entities in a string.
 *
 * Escapes &, <, >, " and ' and drops characters that XML 1.0 cannot
 * represent (C0 controls other than TAB, LF and CR).
 *
 * @param text UTF-8 text
 * @return Text safe for element content and attribute values
 */
std::string encode_xml_entities(const std::string& text);

/**
 * @brief Name of a well-known Android framework attribute.
 *
 * @param resource_id Attribute resource ID (0x0101xxxx)
 * @return Attribute name, or nullptr when the ID is not in the table
 */
const char* frameworkAttributeName(uint32_t resource_id);

// ============================================================================
// BINARY READER
// ============================================================================

/**
 * @class BinaryReader
 * @brief Bounds-checked little-endian reader over a fixed byte range.
 *
 * The reader never owns its data. Positions are absolute offsets into the
 * original input buffer so that errors raised from a sliced reader still
 * point at the right byte. Every read either consumes exactly its width or
 * throws AxmlError(UnexpectedEof) without moving.
 */
class BinaryReader {
   public:
    /**
     * @brief Construct a reader over a whole buffer.
     *
     * @param data Pointer to the first byte
     * @param size Number of readable bytes
     */
    BinaryReader(const uint8_t* data, size_t size);

    uint8_t readU8();
    uint16_t readU16();
    uint32_t readU32();

    /**
     * @brief Read a 32-bit index where 0xFFFFFFFF means "none".
     */
    std::optional<uint32_t> readOptionalIndex();

    /**
     * @brief Read a fixed number of bytes.
     *
     * @param length Number of bytes to read
     * @throws AxmlError UnexpectedEof if fewer than length bytes remain
     */
    std::vector<uint8_t> readBytes(size_t length);

    /**
     * @brief Advance without reading.
     *
     * @throws AxmlError UnexpectedEof if fewer than length bytes remain
     */
    void skip(size_t length);

    /**
     * @brief Move to an absolute offset inside this reader's range.
     *
     * @throws AxmlError UnexpectedEof if pos lies outside [begin(), end()]
     */
    void seek(size_t pos);

    /**
     * @brief Create a reader restricted to [offset, offset + length).
     *
     * @param offset Absolute start offset
     * @param length Length of the new range
     * @throws AxmlError UnexpectedEof if the range exceeds this reader's end
     */
    BinaryReader slice(size_t offset, size_t length) const;

    size_t position() const { return pos_; }
    size_t remaining() const { return end_ - pos_; }
    size_t begin() const { return begin_; }
    size_t end() const { return end_; }

   private:
    BinaryReader(const uint8_t* base, size_t begin, size_t end);

    void require(size_t length) const;

    const uint8_t* base_;
    size_t begin_;
    size_t end_;
    size_t pos_;
};

// ============================================================================
// CHUNKS
// ============================================================================

/**
 * @defgroup Chunks Chunk Layer
 * @brief Chunk headers and the closed set of chunk types.
 * @{
 */

/**
 * @enum ChunkType
 * @brief Chunk type identifiers understood by the decoder.
 *
 * Any other 16-bit value classifies as Unknown and is skipped using the
 * chunk's declared size.
 */
enum class ChunkType : uint16_t {
    Null = 0x0000,
    StringPool = 0x0001,
    Table = 0x0002,
    Xml = 0x0003,
    XmlStartNamespace = 0x0100,
    XmlEndNamespace = 0x0101,
    XmlStartElement = 0x0102,
    XmlEndElement = 0x0103,
    XmlCData = 0x0104,
    XmlResourceMap = 0x0180,
    Unknown = 0xFFFF
};

/**
 * @brief Map a raw chunk type to the closed enumeration.
 */
ChunkType classifyChunk(uint16_t raw_type);

/**
 * @struct ChunkHeader
 * @brief The 8-byte header opening every chunk.
 */
struct ChunkHeader {
    uint16_t type = 0;
    uint16_t header_size = 0;
    uint32_t chunk_size = 0;
    size_t offset = 0;  ///< Absolute offset of the first header byte

    /**
     * @brief Read and validate a chunk header at the reader's position.
     *
     * Requires header_size >= 8, chunk_size >= header_size and the chunk
     * to fit in the reader's remaining range.
     *
     * @throws AxmlError UnexpectedEof if fewer than 8 bytes remain
     * @throws AxmlError MalformedChunk on inconsistent sizes
     */
    static ChunkHeader read(BinaryReader& reader);

    size_t bodyOffset() const { return offset + header_size; }
    size_t endOffset() const { return offset + chunk_size; }
};

/** @} */

// ============================================================================
// STRING POOL AND RESOURCE MAP
// ============================================================================

/**
 * @class StringPool
 * @brief The decoded, immutable string table of one document.
 *
 * Strings are stored as UTF-8 regardless of the pool's encoding. Style
 * records are validated and counted but not interpreted.
 */
class StringPool {
   public:
    enum class Encoding { Utf8, Utf16 };

    static constexpr uint32_t SORTED_FLAG = 1 << 0;
    static constexpr uint32_t UTF8_FLAG = 1 << 8;

    StringPool() = default;

    /**
     * @brief Decode a string pool chunk.
     *
     * @param reader Reader covering at least the whole chunk
     * @param header The already-read header of the chunk
     * @param warn Optional callback for non-fatal style-table problems
     * @throws AxmlError MalformedChunk if the pool header is too short
     * @throws AxmlError UnsupportedEncoding on unknown flag bits
     * @throws AxmlError StringIndexOutOfBounds if a string offset points
     *         outside the chunk
     * @throws AxmlError UnexpectedEof if string data runs past the chunk
     */
    static StringPool decode(const BinaryReader& reader, const ChunkHeader& header,
                             const WarningCallback& warn = nullptr);

    /**
     * @brief String at index.
     *
     * @param index Pool index
     * @param offset Byte offset reported if the index is out of range
     * @throws AxmlError StringIndexOutOfBounds
     */
    const std::string& at(uint32_t index, size_t offset) const;

    size_t size() const { return strings_.size(); }
    bool empty() const { return strings_.empty(); }
    Encoding encoding() const { return encoding_; }
    bool sorted() const { return sorted_; }
    size_t styleCount() const { return style_count_; }

   private:
    Encoding encoding_ = Encoding::Utf16;
    bool sorted_ = false;
    size_t style_count_ = 0;
    std::vector<std::string> strings_;
};

/**
 * @class ResourceMap
 * @brief Resource IDs aligned positionally with the string pool.
 *
 * Entry i is the framework resource ID of the attribute name stored at
 * string pool index i.
 */
class ResourceMap {
   public:
    ResourceMap() = default;

    /**
     * @brief Decode a resource map chunk.
     *
     * @throws AxmlError MalformedChunk if the body is not a multiple of 4
     */
    static ResourceMap decode(const BinaryReader& reader, const ChunkHeader& header);

    /**
     * @brief Resource ID for a string pool index, if the map covers it.
     */
    std::optional<uint32_t> idFor(uint32_t string_index) const;

    size_t size() const { return ids_.size(); }
    const std::vector<uint32_t>& ids() const { return ids_; }

   private:
    std::vector<uint32_t> ids_;
};

// ============================================================================
// TYPED VALUES
// ============================================================================

/**
 * @defgroup Values Typed Values
 * @brief Res_value type tags and their textual rendering.
 * @{
 */

/**
 * @struct ValueType
 * @brief Res_value data type tags.
 */
struct ValueType {
    static constexpr uint8_t TYPE_NULL = 0x00;       ///< No value
    static constexpr uint8_t REFERENCE = 0x01;       ///< @0x........ resource reference
    static constexpr uint8_t ATTRIBUTE = 0x02;       ///< ?0x........ attribute reference
    static constexpr uint8_t STRING = 0x03;          ///< String pool index
    static constexpr uint8_t FLOAT = 0x04;           ///< IEEE-754 single
    static constexpr uint8_t DIMENSION = 0x05;       ///< Complex value with unit
    static constexpr uint8_t FRACTION = 0x06;        ///< Complex value, % or %p
    static constexpr uint8_t INT_DEC = 0x10;         ///< Signed decimal
    static constexpr uint8_t INT_HEX = 0x11;         ///< Hex integer
    static constexpr uint8_t INT_BOOLEAN = 0x12;     ///< Zero or non-zero
    static constexpr uint8_t INT_COLOR_ARGB8 = 0x1c; ///< #aarrggbb
    static constexpr uint8_t INT_COLOR_RGB8 = 0x1d;  ///< #rrggbb
    static constexpr uint8_t INT_COLOR_ARGB4 = 0x1e; ///< #argb
    static constexpr uint8_t INT_COLOR_RGB4 = 0x1f;  ///< #rgb
};

/**
 * @struct TypedValue
 * @brief A (type tag, 32-bit payload) pair as stored in Res_value.
 */
struct TypedValue {
    uint16_t size = 8;
    uint8_t res0 = 0;
    uint8_t data_type = ValueType::TYPE_NULL;
    uint32_t data = 0;

    /**
     * @brief Read the 8-byte Res_value layout.
     */
    static TypedValue read(BinaryReader& reader);
};

/**
 * @brief Render a single-precision value the way the decoder prints floats.
 *
 * Integral finite values print with a trailing ".0" ("16.0"). Everything
 * else uses the shortest stream formatting that reads back as the same
 * float ("0.1", "0.33333334").
 */
std::string formatFloat(float value);

/**
 * @brief Render a DIMENSION or FRACTION complex value.
 *
 * @param data Packed complex value (mantissa, radix, unit)
 * @param fraction true for FRACTION, false for DIMENSION
 * @param warn Optional callback for unknown units
 * @return Numeric part plus unit suffix, e.g. "16.0dp" or "50.0%"
 */
std::string formatComplex(uint32_t data, bool fraction, const WarningCallback& warn = nullptr);

/**
 * @brief Render a typed value as attribute text (unescaped).
 *
 * STRING values use raw_value_index when present, otherwise data, as a
 * string pool index. Unrecognized type tags render as "0x" plus 8 hex
 * digits and are reported to the warning callback.
 *
 * @param value The typed value
 * @param pool String pool used for STRING values
 * @param raw_value_index Raw string value of the attribute, if any
 * @param offset Byte offset reported with errors
 * @param warn Optional callback
 * @throws AxmlError StringIndexOutOfBounds for a bad STRING index
 */
std::string formatTypedValue(const TypedValue& value, const StringPool& pool,
                             std::optional<uint32_t> raw_value_index = std::nullopt,
                             size_t offset = 0, const WarningCallback& warn = nullptr);

/** @} */

// ============================================================================
// XML NODES
// ============================================================================

/**
 * @defgroup Nodes XML Node Chunks
 * @brief Decoded bodies of the namespace, element and CDATA chunks.
 * @{
 */

/**
 * @struct NodeHeader
 * @brief Line number and comment shared by every XML node chunk.
 */
struct NodeHeader {
    uint32_t line_number = 0;
    std::optional<uint32_t> comment_index;
};

struct NamespaceNode {
    NodeHeader node;
    std::optional<uint32_t> prefix_index;
    uint32_t uri_index = 0;
};

struct Attribute {
    std::optional<uint32_t> namespace_index;
    uint32_t name_index = 0;
    std::optional<uint32_t> raw_value_index;
    TypedValue typed_value;
};

struct ElementStartNode {
    NodeHeader node;
    std::optional<uint32_t> namespace_index;
    uint32_t name_index = 0;
    uint16_t attribute_start = 0;
    uint16_t attribute_size = 0;
    uint16_t attribute_count = 0;
    uint16_t id_index = 0;     ///< 1-based index of the "id" attribute, 0 if none
    uint16_t class_index = 0;  ///< 1-based index of the "class" attribute, 0 if none
    uint16_t style_index = 0;  ///< 1-based index of the "style" attribute, 0 if none
    std::vector<Attribute> attributes;
};

struct ElementEndNode {
    NodeHeader node;
    std::optional<uint32_t> namespace_index;
    uint32_t name_index = 0;
};

struct CDataNode {
    NodeHeader node;
    uint32_t data_index = 0;
    TypedValue typed_value;
};

/**
 * @brief Decode a namespace start or end chunk.
 *
 * @throws AxmlError MalformedChunk if the node header is shorter than 16 bytes
 */
NamespaceNode decodeNamespaceNode(const BinaryReader& reader, const ChunkHeader& header);

/**
 * @brief Decode an element start chunk including its attribute records.
 *
 * @throws AxmlError MalformedChunk if attribute records are smaller than 20 bytes
 * @throws AxmlError UnexpectedEof if attributes run past the chunk
 */
ElementStartNode decodeElementStartNode(const BinaryReader& reader, const ChunkHeader& header);

ElementEndNode decodeElementEndNode(const BinaryReader& reader, const ChunkHeader& header);

CDataNode decodeCDataNode(const BinaryReader& reader, const ChunkHeader& header);

/** @} */

// ============================================================================
// DOCUMENT DECODER
// ============================================================================

/**
 * @struct DecodeOptions
 * @brief Configuration for AXML to XML conversion.
 */
struct DecodeOptions {
    /**
     * @brief Emit `<?xml version="1.0" encoding="utf-8"?>` first.
     *
     * Default: true
     */
    bool xml_declaration = true;

    /**
     * @brief Render namespace-less framework attributes in the android namespace.
     *
     * Attributes without a namespace whose resource map ID belongs to the
     * framework package (0x01xxxxxx) get the `android:` prefix, as produced
     * by manifests stripped of their namespace chunks.
     *
     * Default: true
     */
    bool android_prefix_fallback = true;

    /**
     * @brief Name attributes with an empty pool name from their resource ID.
     *
     * Default: true
     */
    bool resolve_framework_names = true;

    /**
     * @brief Emit node comments as `<!--...-->` before their element.
     *
     * Default: false
     */
    bool emit_comments = false;

    /**
     * @brief Optional callback for warnings.
     *
     * Default: nullptr (warnings are discarded)
     */
    WarningCallback warning_callback = nullptr;
};

/**
 * @class AxmlDocumentDecoder
 * @brief Drives the chunk loop and assembles the XML text.
 *
 * Each call to decode() is an independent run over the buffer: the string
 * pool, resource map, namespace scope and element stack are rebuilt from
 * scratch, so decoding twice yields identical output.
 *
 * @example
 * @code
 * libaxml::AxmlDocumentDecoder decoder(bytes.data(), bytes.size());
 * std::string xml = decoder.decode();
 * @endcode
 */
class AxmlDocumentDecoder {
   public:
    /**
     * @param data Buffer holding the binary XML; must outlive the decoder
     * @param size Buffer size in bytes
     * @param options Conversion options
     */
    AxmlDocumentDecoder(const uint8_t* data, size_t size, DecodeOptions options = {});

    /**
     * @brief Decode the whole buffer.
     *
     * @return Complete, well-formed XML text (UTF-8)
     * @throws AxmlError on any fatal format error; no partial output is returned
     */
    std::string decode();

   private:
    const uint8_t* data_;
    size_t size_;
    DecodeOptions options_;
};

// ============================================================================
// HIGH-LEVEL API
// ============================================================================

/**
 * @defgroup HighLevelAPI High-Level API
 * @brief File, stream and buffer conversion helpers.
 * @{
 */

/**
 * @brief Read a whole file into memory.
 *
 * @throws std::runtime_error if the file cannot be opened or read
 */
std::vector<uint8_t> readAxmlFile(const std::string& path);

/**
 * @brief Read a whole stream into memory.
 *
 * @throws std::runtime_error if the stream fails before end-of-file
 */
std::vector<uint8_t> readAxmlStream(std::istream& input);

std::string convertAxmlToXmlString(const uint8_t* data, size_t size,
                                   const DecodeOptions& options = {});

std::string convertAxmlToXmlString(const std::vector<uint8_t>& data,
                                   const DecodeOptions& options = {});

/**
 * @brief Decode a buffer and write the XML to a stream.
 *
 * Nothing is written unless decoding succeeds.
 */
void convertAxmlToXmlStream(const uint8_t* data, size_t size, std::ostream& output,
                            const DecodeOptions& options = {});

/**
 * @brief Load and decode an AXML file.
 *
 * @example
 * @code
 * std::string xml = libaxml::convertAxmlFileToXmlString("AndroidManifest.xml");
 * @endcode
 */
std::string convertAxmlFileToXmlString(const std::string& axml_path,
                                       const DecodeOptions& options = {});

/**
 * @brief Decode an AXML file into an XML file.
 *
 * The output file is only created after a successful decode.
 *
 * @throws std::runtime_error if either file cannot be opened
 * @throws AxmlError on decode failure
 */
void convertAxmlFileToXmlFile(const std::string& axml_path, const std::string& xml_path,
                              const DecodeOptions& options = {});

/** @} */

// ============================================================================
// XML POST-PROCESSING
// ============================================================================

/**
 * @defgroup PostProcessing XML Post-Processing
 * @brief Operations on decoded text, backed by pugixml.
 * @{
 */

/**
 * @brief Re-indent decoded XML.
 *
 * @param xml Decoded XML text
 * @param indent Indentation unit
 * @return Indented XML, with declaration when the input had one
 * @throws std::runtime_error if pugixml cannot parse the input
 */
std::string prettyPrintXml(const std::string& xml, const std::string& indent = "  ");

struct IntentFilter {
    std::vector<std::string> actions;
    std::vector<std::string> categories;
};

struct Component {
    std::string name;
    std::vector<IntentFilter> intent_filters;
};

/**
 * @struct ManifestSummary
 * @brief Key facts pulled from a decoded AndroidManifest.xml.
 */
struct ManifestSummary {
    std::string package;
    std::string version_code;
    std::string version_name;
    std::string min_sdk;
    std::string target_sdk;
    std::string application_name;
    std::string application_label;
    std::string application_icon;
    std::vector<std::string> permissions;
    std::vector<Component> activities;
    std::vector<Component> services;
    std::vector<Component> receivers;
    std::vector<std::string> providers;
};

/**
 * @brief Extract a ManifestSummary from decoded manifest XML.
 *
 * Attributes are looked up with the `android:` prefix first and then
 * unprefixed, so manifests without namespace chunks are handled too.
 *
 * @throws std::runtime_error if the XML cannot be parsed or has no
 *         `manifest` root element
 */
ManifestSummary summarizeManifest(const std::string& xml);

/**
 * @brief Render a summary as a plain-text report.
 */
std::string formatManifestSummary(const ManifestSummary& summary);

/** @} */

}  // namespace libaxml

#endif
