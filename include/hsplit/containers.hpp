// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_CONTAINERS_HPP
#define HSPLIT_CONTAINERS_HPP

// Sequence containers behind the storage policies: static_vector keeps its
// elements inline with a compile-time capacity and never touches the heap;
// growable_vector is a std::vector that allocates through the hsplit hooks.
// Both expose the same small interface so the tree builder is written once.

#include <array>
#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>
#include "hsplit/alloc_hooks.hpp"
#include "hsplit/config.hpp"

namespace hsplit {

// Fixed-capacity vector with inline storage. Elements beyond size() are
// value-initialized slots, so T must be default constructible. Copying
// copies the whole inline buffer.
template <typename T, std::size_t N>
class static_vector {
public:
    using value_type = T;
    using size_type = std::size_t;
    using iterator = T*;
    using const_iterator = const T*;

    static constexpr bool fixed_capacity = true;

    static_vector() noexcept(std::is_nothrow_default_constructible_v<T>) : _data{}, _size(0) {}

    HSPLIT_NODISCARD static constexpr size_type capacity() noexcept { return N; }
    HSPLIT_NODISCARD static constexpr size_type max_size() noexcept { return N; }
    HSPLIT_NODISCARD size_type size() const noexcept { return _size; }
    HSPLIT_NODISCARD bool empty() const noexcept { return _size == 0; }
    HSPLIT_NODISCARD bool full() const noexcept { return _size == N; }

    void push_back(const T& value) {
        if (_size == N) {
            throw std::length_error("hsplit::static_vector: capacity exceeded");
        }
        _data[_size++] = value;
    }

    // Appends unless full; reports whether the element was stored.
    bool try_push_back(const T& value) noexcept(std::is_nothrow_copy_assignable_v<T>) {
        if (_size == N) return false;
        _data[_size++] = value;
        return true;
    }

    void pop_back() noexcept {
        if (_size) _data[--_size] = T{};
    }

    // Grows with value-initialized elements or shrinks.
    void resize(size_type n) {
        if (n > N) {
            throw std::length_error("hsplit::static_vector: resize beyond capacity");
        }
        for (size_type i = n; i < _size; ++i) _data[i] = T{};
        for (size_type i = _size; i < n; ++i) _data[i] = T{};
        _size = n;
    }

    void clear() noexcept {
        for (size_type i = 0; i < _size; ++i) _data[i] = T{};
        _size = 0;
    }

    T& operator[](size_type i) noexcept { return _data[i]; }
    const T& operator[](size_type i) const noexcept { return _data[i]; }

    T& back() noexcept { return _data[_size - 1]; }
    const T& back() const noexcept { return _data[_size - 1]; }

    T* data() noexcept { return _data.data(); }
    const T* data() const noexcept { return _data.data(); }

    iterator begin() noexcept { return _data.data(); }
    iterator end() noexcept { return _data.data() + _size; }
    const_iterator begin() const noexcept { return _data.data(); }
    const_iterator end() const noexcept { return _data.data() + _size; }

private:
    std::array<T, N> _data;
    size_type _size;
};

// Heap-backed vector routed through the allocation hooks.
template <typename T>
class growable_vector {
public:
    using value_type = T;
    using size_type = std::size_t;
    using storage_type = std::vector<T, hook_allocator<T>>;
    using iterator = typename storage_type::iterator;
    using const_iterator = typename storage_type::const_iterator;

    static constexpr bool fixed_capacity = false;

    growable_vector() = default;

    HSPLIT_NODISCARD size_type capacity() const noexcept { return _data.capacity(); }
    HSPLIT_NODISCARD size_type max_size() const noexcept { return _data.max_size(); }
    HSPLIT_NODISCARD size_type size() const noexcept { return _data.size(); }
    HSPLIT_NODISCARD bool empty() const noexcept { return _data.empty(); }
    HSPLIT_NODISCARD bool full() const noexcept { return false; }

    void push_back(const T& value) { _data.push_back(value); }

    bool try_push_back(const T& value) {
        _data.push_back(value);
        return true;
    }

    void pop_back() noexcept {
        if (!_data.empty()) _data.pop_back();
    }

    void resize(size_type n) { _data.resize(n); }

    // Keeps the allocation so a level reused across nodes stops allocating
    // once it has seen its widest node.
    void clear() noexcept { _data.clear(); }

    void reserve(size_type n) { _data.reserve(n); }

    T& operator[](size_type i) noexcept { return _data[i]; }
    const T& operator[](size_type i) const noexcept { return _data[i]; }

    T& back() noexcept { return _data.back(); }
    const T& back() const noexcept { return _data.back(); }

    T* data() noexcept { return _data.data(); }
    const T* data() const noexcept { return _data.data(); }

    iterator begin() noexcept { return _data.begin(); }
    iterator end() noexcept { return _data.end(); }
    const_iterator begin() const noexcept { return _data.begin(); }
    const_iterator end() const noexcept { return _data.end(); }

private:
    storage_type _data;
};

// The interface the tree builder and rolling window rely on.
template <typename C>
concept sequence_container = requires(C c, const C& cc, const typename C::value_type& v, std::size_t n) {
    typename C::value_type;
    { C::fixed_capacity } -> std::convertible_to<bool>;
    { cc.size() } -> std::convertible_to<std::size_t>;
    { cc.max_size() } -> std::convertible_to<std::size_t>;
    { cc.empty() } -> std::convertible_to<bool>;
    { cc.full() } -> std::convertible_to<bool>;
    c.push_back(v);
    c.resize(n);
    c.clear();
    { c.data() } -> std::convertible_to<typename C::value_type*>;
    { c[n] } -> std::convertible_to<typename C::value_type&>;
};

} // namespace hsplit

#endif // HSPLIT_CONTAINERS_HPP
