// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_ROLLING_WINDOW_HPP
#define HSPLIT_ROLLING_WINDOW_HPP

// Ring buffer of the last window_size bytes feeding a rolling hasher.

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include "hsplit/config.hpp"
#include "hsplit/containers.hpp"
#include "hsplit/hashers.hpp"

namespace hsplit {

// The window starts out holding window_size zero bytes, so the digest after
// the first push is already well defined and always depends only on the
// window contents. push() is O(1).
template <rolling_hasher Hasher = rrs1, sequence_container Buffer = growable_vector<std::uint8_t>>
class rolling_window {
public:
    using hasher_type = Hasher;
    using buffer_type = Buffer;

    rolling_window(std::size_t window_size, std::uint32_t seed)
        : _hasher(window_size, seed), _ring(), _pos(0), _window_size(window_size) {
        if (window_size == 0) {
            throw std::invalid_argument("hsplit::rolling_window: window size must be positive");
        }
        if (window_size > _ring.max_size()) {
            throw std::length_error("hsplit::rolling_window: window size exceeds buffer capacity");
        }
        _ring.resize(window_size);
    }

    digest_type push(std::uint8_t byte) noexcept {
        std::uint8_t old = _ring[_pos];
        _ring[_pos] = byte;
        if (++_pos == _window_size) _pos = 0;
        return _hasher.roll(old, byte);
    }

    // Rolls every byte of bytes and returns the final digest.
    digest_type push(std::span<const std::uint8_t> bytes) noexcept {
        digest_type d = _hasher.digest();
        for (std::uint8_t b : bytes) d = push(b);
        return d;
    }

    // Digest of the current window contents.
    HSPLIT_NODISCARD digest_type digest() const noexcept { return _hasher.digest(); }

    HSPLIT_NODISCARD std::size_t window_size() const noexcept { return _window_size; }

    void reset() noexcept {
        for (std::size_t i = 0; i < _window_size; ++i) _ring[i] = 0;
        _pos = 0;
        _hasher.reset();
    }

private:
    Hasher _hasher;
    Buffer _ring;
    std::size_t _pos;
    std::size_t _window_size;
};

} // namespace hsplit

#endif // HSPLIT_ROLLING_WINDOW_HPP
