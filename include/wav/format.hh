/**
 * @file format.hh
 * @brief WAVE format descriptor and the 'fmt ' chunk decoder
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <wav/byte_order.hh>
#include <wav/export_wav.h>

namespace wav {

    /**
     * @enum channels
     * @brief Supported channel layouts (interleaved)
     */
    enum class channels : std::uint16_t {
        mono = 1,
        stereo = 2
    };

    /**
     * @enum sample_format
     * @brief Supported PCM sample encodings
     */
    enum class sample_format {
        u8,  ///< unsigned 8 bit
        i16, ///< signed 16 bit
        i24  ///< signed 24 bit, packed in 3 bytes
    };

    /**
     * @brief Bytes occupied by one sample of the given format
     */
    constexpr std::size_t sample_size(sample_format f) noexcept {
        switch (f) {
            case sample_format::u8: return 1;
            case sample_format::i16: return 2;
            case sample_format::i24: return 3;
        }
        // make compiler happy
        return 1;
    }

    constexpr std::uint16_t channel_count(channels c) noexcept {
        return static_cast<std::uint16_t>(c);
    }

    WAV_EXPORT const char* to_string(sample_format f) noexcept;
    WAV_EXPORT const char* to_string(channels c) noexcept;

    /**
     * @struct fmt_descriptor
     * @brief Validated content of a 'fmt ' chunk
     */
    struct fmt_descriptor {
        static constexpr std::uint16_t pcm = 1;     ///< WAVE_FORMAT_PCM
        static constexpr std::size_t basic_size = 16;

        std::uint16_t audio_format = pcm;
        wav::channels channels = wav::channels::mono;
        std::uint32_t sample_rate = 0;
        std::uint32_t byte_rate = 0;       ///< carried as found, not validated
        std::uint16_t block_align = 0;     ///< carried as found, not validated
        sample_format format = sample_format::i16;
        std::uint32_t extension_size = 0;  ///< bytes after the basic 16-byte block, not parsed
    };

    /**
     * @brief Decode the payload of a 'fmt ' chunk
     *
     * Layout: audio_format:u16, channels:u16, sample_rate:u32,
     * byte_rate:u32, block_align:u16, bits_per_sample:u16, then optional
     * extension bytes which are ignored.
     *
     * @param data First bytes of the payload
     * @param size Number of bytes available at @p data
     * @param declared_size Size of the whole payload as declared in the file
     * @param bo Byte order of the container
     *
     * @throws parse_error fmt_chunk_error, unsupported_audio_format,
     *         unsupported_channel_count, unknown_encoding
     */
    WAV_EXPORT fmt_descriptor decode_fmt(const std::byte* data, std::size_t size,
                                         std::uint64_t declared_size,
                                         byte_order bo = byte_order::little);

    /**
     * @brief Decode a payload held entirely in memory
     */
    inline fmt_descriptor decode_fmt(const std::byte* data, std::size_t size,
                                     byte_order bo = byte_order::little) {
        return decode_fmt(data, size, size, bo);
    }

} // namespace wav
