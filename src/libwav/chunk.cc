//
// Created by igor on 19/10/2026.
//

#include <wav/chunk.hh>

namespace wav {

    static constexpr auto RIFF = "RIFF"_4cc;
    static constexpr auto RIFX = "RIFX"_4cc;
    static constexpr auto WAVE = "WAVE"_4cc;
    static constexpr auto FMT = "fmt "_4cc;
    static constexpr auto DATA = "data"_4cc;

    chunk_kind classify(const fourcc& id) noexcept {
        if (id == RIFF) {
            return chunk_kind::riff;
        }
        if (id == RIFX) {
            return chunk_kind::rifx;
        }
        if (id == WAVE) {
            return chunk_kind::wave;
        }
        if (id == FMT) {
            return chunk_kind::fmt;
        }
        if (id == DATA) {
            return chunk_kind::data;
        }
        return chunk_kind::unknown;
    }

    const char* to_string(chunk_kind kind) noexcept {
        switch (kind) {
            case chunk_kind::riff: return "riff";
            case chunk_kind::rifx: return "rifx";
            case chunk_kind::wave: return "wave";
            case chunk_kind::fmt: return "fmt";
            case chunk_kind::data: return "data";
            case chunk_kind::unknown: return "unknown";
        }
        // make compiler happy
        return "unknown";
    }
}
