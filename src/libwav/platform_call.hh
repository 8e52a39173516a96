//
// Created by igor on 19/10/2026.
//

#pragma once

#include <exception>

#include <wav/exceptions.hh>

namespace wav {

    // Run a platform file operation. libwav exceptions pass through, anything
    // else a platform implementation throws is nested inside an io_error so
    // callers only have to deal with the wav_error hierarchy.
    template<typename Func>
    auto platform_call(const char* what, Func&& func) -> decltype(func()) {
        try {
            return func();
        } catch (const wav_error&) {
            throw;
        } catch (const std::exception& e) {
            std::throw_with_nested(io_error(build_error_msg(what, " failed: ", e.what())));
        }
    }
}
