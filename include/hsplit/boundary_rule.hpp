// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_BOUNDARY_RULE_HPP
#define HSPLIT_BOUNDARY_RULE_HPP

// Boundary classification: digest -> "no boundary" or a boundary level.
//
// boundary_rule is the pluggable predicate. level_classifier binds a rule to
// a configuration's max_level. Level 0 closes the current chunk only; level
// L also closes the open nodes of levels 1..L.

#include <bit>
#include <optional>
#include <stdexcept>
#include <string>
#include "hsplit/config.hpp"
#include "hsplit/hashers.hpp"

namespace hsplit {

using boundary_level = std::optional<unsigned>;

// Abstract digest classifier. Implementations must be pure: the same digest
// always yields the same answer, and the result never exceeds max_level().
class boundary_rule {
public:
    virtual ~boundary_rule() = default;

    // std::nullopt when digest is not a boundary, otherwise the largest
    // level whose predicate holds.
    virtual boundary_level classify(digest_type digest) const noexcept = 0;

    // Highest level this rule can ever report.
    virtual unsigned max_level() const noexcept = 0;

    // Short identifier used in configuration names.
    virtual std::string tag() const = 0;
};

// Boundary when the digest has at least threshold_bits trailing zero bits;
// every further level_bits zero bits raise the level by one. With
// level_bits == 1 each level is half as likely as the one below it.
class trailing_zeros_rule final : public boundary_rule {
public:
    explicit trailing_zeros_rule(unsigned threshold_bits = HSPLIT_DEFAULT_THRESHOLD_BITS,
                                 unsigned level_bits = HSPLIT_DEFAULT_LEVEL_BITS)
        : _threshold(threshold_bits), _level_bits(level_bits) {
        if (threshold_bits > 32) {
            throw std::invalid_argument("hsplit::trailing_zeros_rule: threshold exceeds digest width");
        }
        if (level_bits == 0) {
            throw std::invalid_argument("hsplit::trailing_zeros_rule: level_bits must be positive");
        }
    }

    boundary_level classify(digest_type digest) const noexcept override {
        // std::countr_zero(0) is 32.
        unsigned tz = static_cast<unsigned>(std::countr_zero(digest));
        if (tz < _threshold) return std::nullopt;
        return (tz - _threshold) / _level_bits;
    }

    unsigned max_level() const noexcept override { return (32 - _threshold) / _level_bits; }

    std::string tag() const override {
        std::string t = std::to_string(_threshold);
        if (_level_bits != 1) {
            t += 'f';
            t += std::to_string(_level_bits);
        }
        return t;
    }

    HSPLIT_NODISCARD unsigned threshold_bits() const noexcept { return _threshold; }
    HSPLIT_NODISCARD unsigned level_bits() const noexcept { return _level_bits; }

private:
    unsigned _threshold;
    unsigned _level_bits;
};

// A rule capped at a configuration's max_level.
class level_classifier {
public:
    level_classifier(const boundary_rule& rule, unsigned max_level) noexcept
        : _rule(&rule), _max_level(max_level) {}

    boundary_level classify(digest_type digest) const noexcept {
        boundary_level level = _rule->classify(digest);
        if (level && *level > _max_level) return _max_level;
        return level;
    }

    HSPLIT_NODISCARD unsigned max_level() const noexcept { return _max_level; }
    HSPLIT_NODISCARD const boundary_rule& rule() const noexcept { return *_rule; }

private:
    const boundary_rule* _rule;
    unsigned _max_level;
};

} // namespace hsplit

#endif // HSPLIT_BOUNDARY_RULE_HPP
