#pragma once

#include "log/debug_log.hpp"

#include <exception>
#include <new>
#include <string>
#include <utility>

namespace voiceflow::ffi {

// Runs `body` and never lets an exception escape.
//
// On a throw, the description (what() or "Unknown panic") is written to the
// debug log and `fallback(description)` supplies the return value instead.
// `fallback` must not throw.
//
// Every extern "C" entry point with non-trivial logic runs its body through this.
template <typename Body, typename Fallback>
auto guarded(const char* entryPoint, Body&& body, Fallback&& fallback) noexcept
    -> decltype(std::forward<Body>(body)()) {
    const char* description = "Unknown panic";
    std::string what;
    try {
        return std::forward<Body>(body)();
    } catch (const std::exception& e) {
        try {
            what = e.what();
            description = what.c_str();
        } catch (const std::bad_alloc&) {
            description = "out of memory";
        }
    } catch (...) {
        // Not a std::exception: nothing to describe.
    }

    try {
        debugLog(std::string("PANIC caught in ") + entryPoint + ": " + description);
    } catch (const std::bad_alloc&) {
        // The log line itself could not be built.
    }
    return std::forward<Fallback>(fallback)(description);
}

} // namespace voiceflow::ffi
