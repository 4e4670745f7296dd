/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <pngc/export_pngc.h>

namespace pngc {

    /**
     * @class pngc_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every chunk codec error with a single catch block.
     */
    class pngc_error : public std::runtime_error {
    public:
        explicit pngc_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when stream access fails or a read runs past the end
     * of the available data.
     */
    class io_error : public pngc_error {
    public:
        explicit io_error(const std::string& msg)
            : pngc_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for container framing errors
     *
     * Thrown when the signature is wrong, a record is corrupted
     * or the datastream structure is invalid.
     */
    class parse_error : public pngc_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngc_error(msg) {}
    };

    /**
     * @class compression_error
     * @brief Exception raised by the payload compressor
     */
    class compression_error : public pngc_error {
    public:
        explicit compression_error(const std::string& msg)
            : pngc_error(msg) {}
    };

    /**
     * @enum error_kind
     * @brief Classification of chunk-level failures
     */
    enum class error_kind {
        unknown_chunk_type,      ///< Registry miss while binding a type
        unknown_critical_chunk,  ///< Unregistered critical chunk in the stream
        duplicate_chunk,         ///< Second occurrence of a singleton type
        missing_dependency,      ///< Required predecessor chunk absent
        malformed_length,        ///< Body length violates the type's layout
        invalid_for_color_type,  ///< Chunk not allowed with the header's colour type
        palette_too_small,       ///< Fewer palette entries than the bit depth addresses
        index_out_of_range,      ///< Accessor index outside the data
        invalid_tag,             ///< Structured data tag is not four characters
        version_out_of_range,    ///< Structured data version above 255
        malformed_payload,       ///< Embedded payload failed to decompress or parse
        unimplemented_encode,    ///< Type cannot be encoded
        invalid_field,           ///< Field value outside its allowed set
        order_violation          ///< Chunk appears after a chunk it must precede
    };

    /**
     * @brief Human readable name of an error kind
     */
    PNGC_EXPORT const char* to_string(error_kind kind) noexcept;

    /**
     * @class chunk_error
     * @brief Base exception for chunk validation and accessor errors
     *
     * Every chunk error is also a parse_error, so a failed chunk aborts
     * a decode like any other framing problem.
     */
    class chunk_error : public parse_error {
    public:
        chunk_error(error_kind kind, const std::string& msg)
            : parse_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

#define PNGC_DEFINE_CHUNK_ERROR(name)                                  \
    class name : public chunk_error {                                  \
    public:                                                            \
        explicit name(const std::string& msg)                          \
            : chunk_error(error_kind::name, msg) {}                    \
    };

    PNGC_DEFINE_CHUNK_ERROR(unknown_chunk_type)
    PNGC_DEFINE_CHUNK_ERROR(unknown_critical_chunk)
    PNGC_DEFINE_CHUNK_ERROR(duplicate_chunk)
    PNGC_DEFINE_CHUNK_ERROR(missing_dependency)
    PNGC_DEFINE_CHUNK_ERROR(malformed_length)
    PNGC_DEFINE_CHUNK_ERROR(invalid_for_color_type)
    PNGC_DEFINE_CHUNK_ERROR(palette_too_small)
    PNGC_DEFINE_CHUNK_ERROR(index_out_of_range)
    PNGC_DEFINE_CHUNK_ERROR(invalid_tag)
    PNGC_DEFINE_CHUNK_ERROR(version_out_of_range)
    PNGC_DEFINE_CHUNK_ERROR(malformed_payload)
    PNGC_DEFINE_CHUNK_ERROR(unimplemented_encode)
    PNGC_DEFINE_CHUNK_ERROR(invalid_field)
    PNGC_DEFINE_CHUNK_ERROR(order_violation)

#undef PNGC_DEFINE_CHUNK_ERROR

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     * @param ... Variable arguments to format into error message
     */
    #define THROW_IO(...) \
        throw ::pngc::io_error(::pngc::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with formatted message
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PARSE(...) \
        throw ::pngc::parse_error(::pngc::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CHUNK
     * @brief Throw one of the chunk_error subclasses with formatted message
     * @param type Unqualified exception class (e.g. duplicate_chunk)
     * @param ... Variable arguments to format into error message
     */
    #define THROW_CHUNK(type, ...) \
        throw ::pngc::type(::pngc::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define THROW_PARSE_IF(condition, ...) \
        do { if (condition) THROW_PARSE(__VA_ARGS__); } while(0)

    /**
     * @def THROW_CHUNK_IF
     * @brief Conditionally throw a chunk_error subclass
     */
    #define THROW_CHUNK_IF(condition, type, ...) \
        do { if (condition) THROW_CHUNK(type, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_UNLESS
     * @brief Throw a parse_error unless condition is true
     */
    #define THROW_PARSE_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_PARSE(__VA_ARGS__); } while(0)

    /**
     * @def THROW_CHUNK_UNLESS
     * @brief Throw a chunk_error subclass unless condition is true
     */
    #define THROW_CHUNK_UNLESS(condition, type, ...) \
        do { if (!(condition)) THROW_CHUNK(type, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngc
