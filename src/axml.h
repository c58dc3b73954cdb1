/**
 * @file axml.h
 * @brief C language binding for libaxml.
 *
 * This header provides a C API for decoding Android binary XML (AXML) into
 * textual XML. It's suitable for use in C projects, C++ projects avoiding
 * C++ exceptions, or bindings to other languages.
 *
 * @defgroup CBinding C Language Binding
 * @brief C API for AXML to XML conversion.
 *
 * The C API provides:
 * - Error codes for all operations
 * - Thread-safe error reporting via thread-local storage
 * - Support for both file and in-memory input
 *
 * @section usage_overview Quick Start
 *
 * ### Convert an AXML file to an XML file:
 * @code
 * axml_error_t err;
 * err = axml_convert_file_to_xml_file("AndroidManifest.xml", "manifest.xml", NULL);
 * if (err != AXML_OK) {
 *     fprintf(stderr, "Error: %s\n", axml_get_last_error());
 * }
 * @endcode
 *
 * ### Decode an in-memory buffer:
 * @code
 * axml_error_t err = AXML_OK;
 * size_t size = axml_convert_buffer_to_string(data, length, NULL, 0, NULL, &err);
 * if (err == AXML_OK) {
 *     char* xml = malloc(size);
 *     axml_convert_buffer_to_string(data, length, xml, size, NULL, &err);
 *     printf("%s", xml);
 *     free(xml);
 * }
 * @endcode
 */

#ifndef LIBAXML_C_API_H
#define LIBAXML_C_API_H

/**
 *
 * THREAD SAFETY:
 * ==============
 * - Every function is independent; concurrent calls on different buffers
 *   are safe
 * - Error messages and offsets are stored in thread-local storage
 */

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @defgroup ErrorHandling Error Codes and Handling
 * @{
 */

/**
 * @enum axml_error_t
 * @brief Error codes returned by libaxml C functions.
 *
 * Success is AXML_OK, error conditions are negative values. The decode
 * error codes mirror libaxml::ErrorKind.
 */
typedef enum {
    AXML_OK = 0,                               ///< Operation completed successfully
    AXML_ERROR_NULL_POINTER = -1,              ///< NULL pointer passed as argument
    AXML_ERROR_FILE_NOT_FOUND = -3,            ///< File does not exist or cannot be opened
    AXML_ERROR_WRITE_FAILED = -5,              ///< Failed to write the output file
    AXML_ERROR_UNEXPECTED_EOF = -10,           ///< Input ended in the middle of a structure
    AXML_ERROR_MALFORMED_CHUNK = -11,          ///< Chunk sizes inconsistent with the buffer
    AXML_ERROR_STRING_INDEX = -12,             ///< String pool index or offset out of range
    AXML_ERROR_STRUCTURAL_MISMATCH = -13,      ///< End chunk does not match the open frame
    AXML_ERROR_UNSUPPORTED_ENCODING = -14,     ///< Unknown string pool encoding flags
    AXML_ERROR_UNKNOWN = -100                  ///< Unknown error (check axml_get_last_error() for details)
} axml_error_t;

/**
 * @brief Get the last error message.
 *
 * The message is stored in thread-local storage, so different threads
 * maintain separate error states.
 *
 * @return Pointer to error message string, or NULL if no error has occurred
 * @note The returned pointer is valid until the next libaxml call on this thread
 */
const char* axml_get_last_error(void);

/**
 * @brief Byte offset of the last decode error.
 *
 * @return Absolute offset into the input buffer, or (size_t)-1 when the last
 *         error was not a decode error
 */
size_t axml_get_last_error_offset(void);

/** @} */

/**
 * @defgroup ConversionOptions Conversion Options
 * @{
 */

/**
 * @typedef axml_warning_callback_t
 * @brief Callback function for non-fatal decode warnings.
 *
 * @param category Category of warning (e.g., "Namespaces", "Structure")
 * @param message Descriptive message about the warning
 * @param user_data The user_data pointer from axml_options_t
 *
 * @example
 * @code
 * void my_warning_handler(const char* category, const char* message, void* user_data) {
 *     fprintf(stderr, "Warning [%s]: %s\n", category, message);
 * }
 * @endcode
 */
typedef void (*axml_warning_callback_t)(const char* category, const char* message, void* user_data);

/**
 * @struct axml_options_t
 * @brief Options for controlling AXML-to-XML conversion.
 *
 * Initialize with axml_options_init(). NULL is equivalent to default options.
 */
typedef struct {
    int xml_declaration;              ///< Emit the XML declaration. Default: 1
    int android_prefix_fallback;      ///< android: prefix for framework IDs. Default: 1
    int resolve_framework_names;      ///< Name empty attributes from IDs. Default: 1
    int emit_comments;                ///< Emit node comments. Default: 0
    axml_warning_callback_t warning_callback;  ///< Default: NULL
    void* user_data;                  ///< Passed to warning_callback
} axml_options_t;

/**
 * @brief Fill options with the defaults.
 */
void axml_options_init(axml_options_t* options);

/** @} */

/**
 * @defgroup HighLevelAPI High-Level Convenience Functions
 * @{
 */

/**
 * @brief Decode an AXML buffer into an XML string.
 *
 * @param data AXML bytes
 * @param length Number of bytes
 * @param out_buffer Optional destination. If NULL, only the size is returned
 * @param buffer_size Size of out_buffer in bytes
 * @param options Optional options (NULL for defaults)
 * @param error Optional error code output
 * @return Required size including null terminator, 0 on error. If
 *         out_buffer was provided and is too small, the data is not copied.
 */
size_t axml_convert_buffer_to_string(const uint8_t* data, size_t length, char* out_buffer,
                                     size_t buffer_size, const axml_options_t* options,
                                     axml_error_t* error);

/**
 * @brief Decode an AXML file into an XML string.
 *
 * Same size contract as axml_convert_buffer_to_string().
 */
size_t axml_convert_file_to_string(const char* axml_path, char* out_buffer, size_t buffer_size,
                                   const axml_options_t* options, axml_error_t* error);

/**
 * @brief Decode an AXML file into an XML file.
 *
 * The output file is only written after a successful decode.
 *
 * @return AXML_OK on success, error code on failure
 */
axml_error_t axml_convert_file_to_xml_file(const char* axml_path, const char* xml_path,
                                           const axml_options_t* options);

/**
 * @brief Decode an AXML buffer into an XML file.
 *
 * @return AXML_OK on success, error code on failure
 */
axml_error_t axml_convert_buffer_to_xml_file(const uint8_t* data, size_t length,
                                             const char* xml_path,
                                             const axml_options_t* options);

/** @} */

#ifdef __cplusplus
}
#endif

#endif // LIBAXML_C_API_H
