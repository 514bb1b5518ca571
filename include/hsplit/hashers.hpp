// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_HASHERS_HPP
#define HSPLIT_HASHERS_HPP

// Rolling hash functions. A hasher only sees the byte leaving the window and
// the byte entering it; the ring buffer that remembers the window lives in
// rolling_window. Both hashers start from the digest of an all-zero window,
// so every digest is a pure function of the last window_size bytes.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include "hsplit/config.hpp"

namespace hsplit {

using digest_type = std::uint32_t;

// The hashsplit rolling checksum (an rsync/bup style sum pair).
//
//   a  = sum(X_i + c)                mod 2^16
//   b  = sum((W - i)(X_i + c))       mod 2^16   (i = 0 is the oldest byte)
//   digest = b | a << 16
//
// c is the configuration seed. All arithmetic wraps.
class rrs1 {
public:
    static constexpr std::string_view name = "RRS1";

    rrs1(std::size_t window_size, std::uint32_t seed) noexcept
        : _w(static_cast<std::uint32_t>(window_size & 0xFFFFu)),
          _c(seed),
          _a0(zero_window_a(window_size, seed)),
          _b0(zero_window_b(window_size, seed)),
          _a(_a0),
          _b(_b0) {}

    HSPLIT_NODISCARD digest_type digest() const noexcept { return _b | (_a << 16); }

    digest_type roll(std::uint8_t old_byte, std::uint8_t new_byte) noexcept {
        _a = (_a - old_byte + new_byte) & 0xFFFFu;
        _b = (_b - _w * (old_byte + _c) + _a) & 0xFFFFu;
        return _b | (_a << 16);
    }

    void reset() noexcept {
        _a = _a0;
        _b = _b0;
    }

private:
    static std::uint32_t zero_window_a(std::size_t w, std::uint32_t c) noexcept {
        return static_cast<std::uint32_t>((static_cast<std::uint64_t>(w) * c) & 0xFFFFu);
    }

    // c * W(W+1)/2, halving the even factor before the product can wrap.
    static std::uint32_t zero_window_b(std::size_t w, std::uint32_t c) noexcept {
        std::uint64_t n = w;
        std::uint64_t tri = (n % 2 == 0) ? (n / 2) * (n + 1) : n * ((n + 1) / 2);
        return static_cast<std::uint32_t>((tri * c) & 0xFFFFu);
    }

    std::uint32_t _w;
    std::uint32_t _c;
    std::uint32_t _a0;
    std::uint32_t _b0;
    std::uint32_t _a;
    std::uint32_t _b;
};

// Polynomial rolling hash in wrapping 32-bit arithmetic with P = 65521.
// Ignores the seed.
class bozo32 {
public:
    static constexpr std::string_view name = "Bozo32";
    static constexpr std::uint32_t prime = 65521u;

    bozo32(std::size_t window_size, std::uint32_t /*seed*/) noexcept
        : _prime_pow_w(wrapping_pow(prime, window_size)), _state(0) {}

    HSPLIT_NODISCARD digest_type digest() const noexcept { return _state; }

    digest_type roll(std::uint8_t old_byte, std::uint8_t new_byte) noexcept {
        _state = _state * prime + new_byte - old_byte * _prime_pow_w;
        return _state;
    }

    void reset() noexcept { _state = 0; }

private:
    static std::uint32_t wrapping_pow(std::uint32_t base, std::size_t exp) noexcept {
        std::uint32_t result = 1;
        while (exp) {
            if (exp & 1) result *= base;
            base *= base;
            exp >>= 1;
        }
        return result;
    }

    std::uint32_t _prime_pow_w;
    std::uint32_t _state;
};

template <typename H>
concept rolling_hasher = std::copy_constructible<H> && requires(H h, const H& ch, std::uint8_t b) {
    { H::name } -> std::convertible_to<std::string_view>;
    { h.roll(b, b) } -> std::same_as<digest_type>;
    { ch.digest() } -> std::same_as<digest_type>;
    h.reset();
} && std::constructible_from<H, std::size_t, std::uint32_t>;

} // namespace hsplit

#endif // HSPLIT_HASHERS_HPP
