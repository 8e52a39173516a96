//
// Created by igor on 19/10/2026.
//

#include <wav/exceptions.hh>

namespace wav {

    const char* to_string(error_code code) noexcept {
        switch (code) {
            case error_code::no_riff_chunk_found: return "no_riff_chunk_found";
            case error_code::no_wave_tag_found: return "no_wave_tag_found";
            case error_code::no_fmt_chunk_found: return "no_fmt_chunk_found";
            case error_code::no_data_chunk_found: return "no_data_chunk_found";
            case error_code::unsupported_audio_format: return "unsupported_audio_format";
            case error_code::unsupported_channel_count: return "unsupported_channel_count";
            case error_code::unknown_encoding: return "unknown_encoding";
            case error_code::fmt_chunk_error: return "fmt_chunk_error";
            case error_code::chunk_size_incorrect: return "chunk_size_incorrect";
            case error_code::buffer_size_incorrect: return "buffer_size_incorrect";
            case error_code::exceeded_max_chunks: return "exceeded_max_chunks";
            case error_code::seek_out_of_bounds: return "seek_out_of_bounds";
            case error_code::platform_error: return "platform_error";
        }
        // make compiler happy
        return "unknown";
    }
}
