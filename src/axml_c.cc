#include "axml.h"
#include "axml.hpp"

#include <cstring>
#include <fstream>
#include <string>
#include <vector>


thread_local std::string g_last_error;
thread_local size_t g_last_error_offset = static_cast<size_t>(-1);


static axml_error_t set_error(axml_error_t code, const std::string& msg) {
    g_last_error = msg;
    g_last_error_offset = static_cast<size_t>(-1);
    return code;
}


static void clear_error() {
    g_last_error.clear();
    g_last_error_offset = static_cast<size_t>(-1);
}


static axml_error_t error_code(libaxml::ErrorKind kind) {
    switch (kind) {
    case libaxml::ErrorKind::UnexpectedEof: return AXML_ERROR_UNEXPECTED_EOF;
    case libaxml::ErrorKind::MalformedChunk: return AXML_ERROR_MALFORMED_CHUNK;
    case libaxml::ErrorKind::StringIndexOutOfBounds: return AXML_ERROR_STRING_INDEX;
    case libaxml::ErrorKind::StructuralMismatch: return AXML_ERROR_STRUCTURAL_MISMATCH;
    case libaxml::ErrorKind::UnsupportedEncoding: return AXML_ERROR_UNSUPPORTED_ENCODING;
    }
    return AXML_ERROR_UNKNOWN;
}


static axml_error_t handle_exception(const libaxml::AxmlError& e) {
    g_last_error = e.what();
    g_last_error_offset = e.offset();
    return error_code(e.kind());
}


static axml_error_t handle_exception(const std::exception& e) {
    g_last_error = e.what();
    g_last_error_offset = static_cast<size_t>(-1);
    return AXML_ERROR_UNKNOWN;
}

// ============================================================================
// INTERNAL HELPERS
// ============================================================================

static libaxml::DecodeOptions to_decode_options(const axml_options_t* options) {
    libaxml::DecodeOptions opts;
    if (!options) return opts;

    opts.xml_declaration = options->xml_declaration != 0;
    opts.android_prefix_fallback = options->android_prefix_fallback != 0;
    opts.resolve_framework_names = options->resolve_framework_names != 0;
    opts.emit_comments = options->emit_comments != 0;
    if (options->warning_callback) {
        axml_warning_callback_t callback = options->warning_callback;
        void* user_data = options->user_data;
        opts.warning_callback = [callback, user_data](const std::string& category, const std::string& message) {
            callback(category.c_str(), message.c_str(), user_data);
        };
    }
    return opts;
}

static size_t copy_result(const std::string& result, char* out_buffer, size_t buffer_size) {
    size_t needed = result.size() + 1;
    if (out_buffer && buffer_size >= needed) {
        std::memcpy(out_buffer, result.c_str(), needed);
    }
    return needed;
}

static axml_error_t write_xml_file(const std::string& xml, const char* xml_path) {
    std::ofstream out(xml_path, std::ios::binary);
    if (!out) {
        return set_error(AXML_ERROR_WRITE_FAILED, std::string("Failed to open output file: ") + xml_path);
    }
    out << xml;
    if (!out) {
        return set_error(AXML_ERROR_WRITE_FAILED, std::string("Failed to write output file: ") + xml_path);
    }
    return AXML_OK;
}

// ============================================================================
// ERROR HANDLING
// ============================================================================

extern "C" const char* axml_get_last_error(void) {
    return g_last_error.empty() ? nullptr : g_last_error.c_str();
}

extern "C" size_t axml_get_last_error_offset(void) {
    return g_last_error_offset;
}

// ============================================================================
// OPTIONS
// ============================================================================

extern "C" void axml_options_init(axml_options_t* options) {
    if (!options) return;

    options->xml_declaration = 1;
    options->android_prefix_fallback = 1;
    options->resolve_framework_names = 1;
    options->emit_comments = 0;
    options->warning_callback = nullptr;
    options->user_data = nullptr;
}

// ============================================================================
// HIGH-LEVEL API
// ============================================================================

extern "C" size_t axml_convert_buffer_to_string(const uint8_t* data, size_t length,
                                                char* out_buffer, size_t buffer_size,
                                                const axml_options_t* options, axml_error_t* error) {
    if (!data) {
        if (error) *error = set_error(AXML_ERROR_NULL_POINTER, "data is null");
        return 0;
    }

    try {
        clear_error();
        std::string result = libaxml::convertAxmlToXmlString(data, length, to_decode_options(options));
        if (error) *error = AXML_OK;
        return copy_result(result, out_buffer, buffer_size);
    } catch (const libaxml::AxmlError& e) {
        if (error) *error = handle_exception(e);
        return 0;
    } catch (const std::exception& e) {
        if (error) *error = handle_exception(e);
        return 0;
    }
}

extern "C" size_t axml_convert_file_to_string(const char* axml_path,
                                              char* out_buffer, size_t buffer_size,
                                              const axml_options_t* options, axml_error_t* error) {
    if (!axml_path) {
        if (error) *error = set_error(AXML_ERROR_NULL_POINTER, "axml_path is null");
        return 0;
    }

    try {
        clear_error();
        std::ifstream in(axml_path, std::ios::binary);
        if (!in) {
            if (error) *error = set_error(AXML_ERROR_FILE_NOT_FOUND, std::string("Failed to open AXML file: ") + axml_path);
            return 0;
        }

        std::vector<uint8_t> data = libaxml::readAxmlStream(in);
        std::string result = libaxml::convertAxmlToXmlString(data, to_decode_options(options));
        if (error) *error = AXML_OK;
        return copy_result(result, out_buffer, buffer_size);
    } catch (const libaxml::AxmlError& e) {
        if (error) *error = handle_exception(e);
        return 0;
    } catch (const std::exception& e) {
        if (error) *error = handle_exception(e);
        return 0;
    }
}

extern "C" axml_error_t axml_convert_file_to_xml_file(const char* axml_path, const char* xml_path,
                                                      const axml_options_t* options) {
    if (!axml_path || !xml_path) {
        return set_error(AXML_ERROR_NULL_POINTER, "Path is null");
    }

    try {
        clear_error();
        std::ifstream in(axml_path, std::ios::binary);
        if (!in) {
            return set_error(AXML_ERROR_FILE_NOT_FOUND, std::string("Failed to open AXML file: ") + axml_path);
        }

        std::vector<uint8_t> data = libaxml::readAxmlStream(in);
        std::string xml = libaxml::convertAxmlToXmlString(data, to_decode_options(options));
        return write_xml_file(xml, xml_path);
    } catch (const libaxml::AxmlError& e) {
        return handle_exception(e);
    } catch (const std::exception& e) {
        return handle_exception(e);
    }
}

extern "C" axml_error_t axml_convert_buffer_to_xml_file(const uint8_t* data, size_t length,
                                                        const char* xml_path,
                                                        const axml_options_t* options) {
    if (!data || !xml_path) {
        return set_error(AXML_ERROR_NULL_POINTER, "Parameter is null");
    }

    try {
        clear_error();
        std::string xml = libaxml::convertAxmlToXmlString(data, length, to_decode_options(options));
        return write_xml_file(xml, xml_path);
    } catch (const libaxml::AxmlError& e) {
        return handle_exception(e);
    } catch (const std::exception& e) {
        return handle_exception(e);
    }
}
