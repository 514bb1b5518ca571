// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_ERRORS_HPP
#define HSPLIT_ERRORS_HPP

// Exception types thrown by hsplit. Every failure the engine can report is a
// subclass of hsplit::error, which carries an error_code so callers can
// dispatch without a chain of catch clauses.

#include <cstddef>
#include <stdexcept>
#include <string>

namespace hsplit {

enum class error_code {
    configuration = 1,  // Rejected at construction.
    capacity = 2,       // Fixed-capacity storage would overflow.
    sequence = 3,       // Call not valid in the driver's current state.
};

inline const char* to_string(error_code code) noexcept {
    switch (code) {
        case error_code::configuration: return "configuration";
        case error_code::capacity:      return "capacity";
        case error_code::sequence:      return "sequence";
    }
    return "unknown";
}

class error : public std::runtime_error {
public:
    error(error_code code, const std::string& what)
        : std::runtime_error(what), _code(code) {}

    error_code code() const noexcept { return _code; }

private:
    error_code _code;
};

// Invalid parameters: zero window, a rule that cannot represent max_level,
// inconsistent size limits, or limits beyond a fixed variant's capacities.
class configuration_error : public error {
public:
    explicit configuration_error(const std::string& what)
        : error(error_code::configuration, what) {}
};

// A fixed-capacity buffer would need more room than it was compiled with.
// The operation that raised it has had no effect.
class capacity_error : public error {
public:
    capacity_error(const std::string& what, unsigned level, std::size_t capacity)
        : error(error_code::capacity, what), _level(level), _capacity(capacity) {}

    // Tree level whose child list overflowed.
    unsigned level() const noexcept { return _level; }
    std::size_t capacity() const noexcept { return _capacity; }

private:
    unsigned _level;
    std::size_t _capacity;
};

// push/flush/prime in the wrong state (for example after flush()).
class sequence_error : public error {
public:
    explicit sequence_error(const std::string& what)
        : error(error_code::sequence, what) {}
};

} // namespace hsplit

#endif // HSPLIT_ERRORS_HPP
