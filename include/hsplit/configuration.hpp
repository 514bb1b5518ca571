// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_CONFIGURATION_HPP
#define HSPLIT_CONFIGURATION_HPP

// Immutable, validated chunking parameters shared by every part of a
// driver. Build one from an options aggregate:
//
//   auto cfg = hsplit::make_configuration({.window_size = 48, .max_level = 3});
//
// Validation happens once, in the constructor; a configuration that exists
// is always usable.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>
#include "hsplit/boundary_rule.hpp"
#include "hsplit/config.hpp"
#include "hsplit/errors.hpp"
#include "hsplit/hashers.hpp"
#include "hsplit/logging.hpp"

namespace hsplit {

struct options {
    std::size_t window_size = HSPLIT_DEFAULT_WINDOW_SIZE;
    unsigned max_level = HSPLIT_DEFAULT_MAX_LEVEL;
    std::shared_ptr<const boundary_rule> rule = std::make_shared<const trailing_zeros_rule>();
    std::uint32_t seed = HSPLIT_DEFAULT_SEED;
    std::size_t min_chunk_size = HSPLIT_DEFAULT_MIN_CHUNK_SIZE;
    std::size_t max_chunk_size = HSPLIT_DEFAULT_MAX_CHUNK_SIZE;
    std::size_t max_children = HSPLIT_DEFAULT_MAX_CHILDREN;
};

namespace detail {

    // 65536 -> "64Ki", 2097152 -> "2Mi", 1000 -> "1000".
    inline std::string format_size(std::size_t z) {
        if (z == 0) return "0";
        if (z % (std::size_t{1} << 30) == 0) return fmt::format("{}Gi", z >> 30);
        if (z % (std::size_t{1} << 20) == 0) return fmt::format("{}Mi", z >> 20);
        if (z % (std::size_t{1} << 10) == 0) return fmt::format("{}Ki", z >> 10);
        return fmt::format("{}", z);
    }

} // namespace detail

class configuration {
public:
    explicit configuration(options opts = {}) : _opts(std::move(opts)) {
        if (_opts.window_size == 0) {
            fail("window_size must be positive");
        }
        if (!_opts.rule) {
            fail("a boundary rule is required");
        }
        if (_opts.max_level > _opts.rule->max_level()) {
            fail(fmt::format("max_level {} exceeds the {} levels rule '{}' can represent",
                             _opts.max_level, _opts.rule->max_level(), _opts.rule->tag()));
        }
        if (_opts.max_chunk_size != 0 && _opts.min_chunk_size > _opts.max_chunk_size) {
            fail(fmt::format("min_chunk_size {} exceeds max_chunk_size {}",
                             _opts.min_chunk_size, _opts.max_chunk_size));
        }
        if (_opts.max_children == 1) {
            fail("max_children must be 0 (disabled) or at least 2");
        }

        log::logger()->debug("hsplit::configuration: window={} max_level={} rule={} seed={} "
                             "min_chunk={} max_chunk={} max_children={}",
                             _opts.window_size, _opts.max_level, _opts.rule->tag(), _opts.seed,
                             _opts.min_chunk_size, _opts.max_chunk_size, _opts.max_children);
    }

    HSPLIT_NODISCARD std::size_t window_size() const noexcept { return _opts.window_size; }
    HSPLIT_NODISCARD unsigned max_level() const noexcept { return _opts.max_level; }
    HSPLIT_NODISCARD const boundary_rule& rule() const noexcept { return *_opts.rule; }
    HSPLIT_NODISCARD std::uint32_t seed() const noexcept { return _opts.seed; }
    HSPLIT_NODISCARD std::size_t min_chunk_size() const noexcept { return _opts.min_chunk_size; }
    HSPLIT_NODISCARD std::size_t max_chunk_size() const noexcept { return _opts.max_chunk_size; }
    HSPLIT_NODISCARD std::size_t max_children() const noexcept { return _opts.max_children; }
    HSPLIT_NODISCARD const options& opts() const noexcept { return _opts; }

    HSPLIT_NODISCARD level_classifier classifier() const noexcept {
        return level_classifier(*_opts.rule, _opts.max_level);
    }

    // Boundary level of digest, capped at max_level.
    HSPLIT_NODISCARD boundary_level classify(digest_type digest) const noexcept {
        return classifier().classify(digest);
    }

    // "HashSplit_<rule tag>_<hasher>_<min chunk>_<max chunk>".
    HSPLIT_NODISCARD std::string name(std::string_view hasher_name) const {
        return fmt::format("HashSplit_{}_{}_{}_{}", _opts.rule->tag(), hasher_name,
                           detail::format_size(_opts.min_chunk_size),
                           detail::format_size(_opts.max_chunk_size));
    }

    template <rolling_hasher Hasher = rrs1>
    HSPLIT_NODISCARD std::string name() const {
        return name(Hasher::name);
    }

private:
    [[noreturn]] static void fail(const std::string& why) {
        log::logger()->warn("hsplit::configuration: {}", why);
        throw configuration_error("hsplit::configuration: " + why);
    }

    options _opts;
};

inline std::shared_ptr<const configuration> make_configuration(options opts = {}) {
    return std::make_shared<const configuration>(std::move(opts));
}

} // namespace hsplit

#endif // HSPLIT_CONFIGURATION_HPP
