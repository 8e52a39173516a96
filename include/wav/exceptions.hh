/**
 * @file exceptions.hh
 * @brief Error taxonomy, exception classes and throwing macros for libwav
 * @author Igor
 * @date 19/10/2026
 *
 * Every failure raised by the library carries one of the closed set of
 * error codes below, so callers can dispatch on the kind of failure
 * without parsing messages.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

#include <wav/export_wav.h>

namespace wav {

    /**
     * @enum error_code
     * @brief Closed set of failure kinds
     */
    enum class error_code {
        // structural
        no_riff_chunk_found,       ///< Container does not start with RIFF/RIFX
        no_wave_tag_found,         ///< Form type is not WAVE
        no_fmt_chunk_found,        ///< No 'fmt ' subchunk within the scanned chunks
        no_data_chunk_found,       ///< No 'data' subchunk within the scanned chunks
        // decode
        unsupported_audio_format,  ///< Format code other than linear PCM
        unsupported_channel_count, ///< Neither mono nor stereo
        unknown_encoding,          ///< Bits per sample other than 8/16/24
        fmt_chunk_error,           ///< 'fmt ' payload too short
        // sizing
        chunk_size_incorrect,      ///< Truncated header or chunk past end of file
        buffer_size_incorrect,     ///< Scratch buffer too small
        exceeded_max_chunks,       ///< Chunk table full and caller asked to fail
        seek_out_of_bounds,        ///< Seek target outside the data chunk
        // platform
        platform_error             ///< Failure reported by the platform file
    };

    /**
     * @brief Stable name of an error code
     */
    WAV_EXPORT const char* to_string(error_code code) noexcept;

    /**
     * @class wav_error
     * @brief Base exception class for all libwav errors
     */
    class wav_error : public std::runtime_error {
    public:
        wav_error(error_code code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        [[nodiscard]] error_code code() const noexcept { return m_code; }

    private:
        error_code m_code;
    };

    /**
     * @class io_error
     * @brief Failure of the underlying platform file
     *
     * Exceptions of other types thrown by a platform file are rethrown
     * nested inside an io_error (see std::throw_with_nested).
     */
    class io_error : public wav_error {
    public:
        explicit io_error(const std::string& msg)
            : wav_error(error_code::platform_error, msg) {}
    };

    /**
     * @class end_of_file
     * @brief End of file signaled as an error
     *
     * Embedded file system drivers report EOF this way instead of
     * returning a zero-length read. The scanner and the reader treat
     * it as a normal end of data.
     */
    class end_of_file : public io_error {
    public:
        explicit end_of_file(const std::string& msg)
            : io_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Malformed or unsupported input
     */
    class parse_error : public wav_error {
    public:
        parse_error(error_code code, const std::string& msg)
            : wav_error(code, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
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

    #define THROW_PARSE(code, ...) \
        throw ::wav::parse_error((code), ::wav::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE_IF(condition, code, ...) \
        do { if (condition) THROW_PARSE(code, __VA_ARGS__); } while(0)

    #define THROW_IO(...) \
        throw ::wav::io_error(::wav::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_EOF(...) \
        throw ::wav::end_of_file(::wav::build_error_msg(__VA_ARGS__))

    /** @} */ // end of ExceptionMacros group

} // namespace wav
