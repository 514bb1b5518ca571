// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_PROFILING_HPP
#define HSPLIT_PROFILING_HPP

// Optional scoped profiler for hsplit.
//
// Define HSPLIT_ENABLE_PROFILING before including this header to time
// push/flush calls; timings are logged at debug level through the library
// logger. When the macro is not defined the profiler compiles to a
// zero-cost no-op.

#include <string_view>

#ifdef HSPLIT_ENABLE_PROFILING

#include <chrono>
#include <string>
#include "hsplit/logging.hpp"

namespace hsplit {
class profiler {
public:
    explicit profiler(std::string_view label)
        : _label(label), _start(std::chrono::steady_clock::now()) {}
    ~profiler() {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - _start).count();
        log::logger()->debug("[profiler] {} took {} us", _label, duration);
    }

    profiler(const profiler&) = delete;
    profiler& operator=(const profiler&) = delete;

private:
    std::string _label;
    std::chrono::steady_clock::time_point _start;
};
}

#else  // HSPLIT_ENABLE_PROFILING

namespace hsplit {
class profiler {
public:
    constexpr explicit profiler(const char*) noexcept {}
    constexpr explicit profiler(std::string_view) noexcept {}
    ~profiler() noexcept = default;
};
}

#endif  // HSPLIT_ENABLE_PROFILING

#endif  // HSPLIT_PROFILING_HPP
