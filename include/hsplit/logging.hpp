// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_LOGGING_HPP
#define HSPLIT_LOGGING_HPP

// Library logger. hsplit never logs per byte: configuration creation, flush
// summaries and safety-valve closures go out at debug, roots at trace, and
// rejected calls at warn.
//
// The default logger writes to stderr and is not registered with spdlog's
// global registry, so hosts are free to use the name "hsplit" themselves.
// Its initial level comes from the HSPLIT_LOG_LEVEL environment variable.

#include "hsplit/config.hpp"
#include <cstdlib>
#include <memory>
#include <mutex>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hsplit::log {

namespace detail {

    inline spdlog::level::level_enum initial_level() {
        const char* env = std::getenv(HSPLIT_LOG_LEVEL_ENV);
        return spdlog::level::from_str(env ? env : HSPLIT_DEFAULT_LOG_LEVEL);
    }

    inline std::shared_ptr<spdlog::logger> make_default_logger() {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("hsplit", std::move(sink));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(initial_level());
        return logger;
    }

    struct logger_holder {
        std::mutex mutex;
        std::shared_ptr<spdlog::logger> logger = make_default_logger();
    };

    inline logger_holder& holder() {
        static logger_holder instance;
        return instance;
    }

} // namespace detail

// Returns the logger used by every hsplit component.
inline std::shared_ptr<spdlog::logger> logger() {
    auto& h = detail::holder();
    std::lock_guard<std::mutex> lock(h.mutex);
    return h.logger;
}

// Replaces the library logger. Passing nullptr restores the default one.
inline void set_logger(std::shared_ptr<spdlog::logger> logger) {
    auto& h = detail::holder();
    std::lock_guard<std::mutex> lock(h.mutex);
    h.logger = logger ? std::move(logger) : detail::make_default_logger();
}

inline void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace hsplit::log

#endif // HSPLIT_LOGGING_HPP
