//
// Created by igor on 19/10/2026.
//

#include <wav/format.hh>
#include <wav/exceptions.hh>

namespace wav {

    const char* to_string(sample_format f) noexcept {
        switch (f) {
            case sample_format::u8: return "u8";
            case sample_format::i16: return "i16";
            case sample_format::i24: return "i24";
        }
        return "?";
    }

    const char* to_string(channels c) noexcept {
        switch (c) {
            case channels::mono: return "mono";
            case channels::stereo: return "stereo";
        }
        return "?";
    }

    fmt_descriptor decode_fmt(const std::byte* data, std::size_t size,
                              std::uint64_t declared_size, byte_order bo) {
        THROW_PARSE_IF(!data || size < fmt_descriptor::basic_size || declared_size < fmt_descriptor::basic_size,
                       error_code::fmt_chunk_error,
                       "'fmt ' chunk has ", declared_size, " bytes, at least ",
                       fmt_descriptor::basic_size, " required");

        fmt_descriptor fmt;

        fmt.audio_format = load_u16(data, bo);
        THROW_PARSE_IF(fmt.audio_format != fmt_descriptor::pcm, error_code::unsupported_audio_format,
                       "Unsupported audio format 0x", std::hex, fmt.audio_format,
                       std::dec, ", only PCM (1) is supported");

        auto channel_count = load_u16(data + 2, bo);
        switch (channel_count) {
            case 1:
                fmt.channels = channels::mono;
                break;
            case 2:
                fmt.channels = channels::stereo;
                break;
            default:
                THROW_PARSE(error_code::unsupported_channel_count,
                            "Unsupported channel count ", channel_count, ", expected 1 or 2");
        }

        fmt.sample_rate = load_u32(data + 4, bo);
        fmt.byte_rate = load_u32(data + 8, bo);
        fmt.block_align = load_u16(data + 12, bo);

        auto bits_per_sample = load_u16(data + 14, bo);
        switch (bits_per_sample) {
            case 8:
                fmt.format = sample_format::u8;
                break;
            case 16:
                fmt.format = sample_format::i16;
                break;
            case 24:
                fmt.format = sample_format::i24;
                break;
            default:
                THROW_PARSE(error_code::unknown_encoding,
                            "Unsupported bits per sample ", bits_per_sample, ", expected 8, 16 or 24");
        }

        fmt.extension_size = static_cast<std::uint32_t>(declared_size - fmt_descriptor::basic_size);
        return fmt;
    }
}
