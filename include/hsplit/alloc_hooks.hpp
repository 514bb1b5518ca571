// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_ALLOC_HOOKS_HPP
#define HSPLIT_ALLOC_HOOKS_HPP

// Allocator hooks and hook_allocator<T>.
//
// Every growable container in hsplit (the dynamic storage policy and
// chunk_tree) allocates through the function pointers below, so a host can
// meter, cap, or redirect the dynamic variant's memory. The fixed-capacity
// storage policy never reaches this layer.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <new>
#if defined(_MSC_VER)
# include <malloc.h>  // _aligned_malloc / _aligned_free
#endif

namespace hsplit {

using allocate_fn = void*(*)(std::size_t size, std::size_t align);
using deallocate_fn = void(*)(void* p, std::size_t size, std::size_t align);

namespace alloc_hooks {

    inline void* default_allocate(std::size_t n, std::size_t align) {
        if (n == 0) return nullptr;
#ifdef _WIN32
        return _aligned_malloc(n, align);
#else
        if (align <= alignof(std::max_align_t)) {
            // malloc already guarantees alignof(max_align_t).
            return std::malloc(n);
        }
        std::size_t adj = ((n + align - 1) / align) * align;
        return std::aligned_alloc(align, adj);
#endif
    }

    inline void default_deallocate(void* p, std::size_t, std::size_t) {
        if (!p) return;
#ifdef _WIN32
        _aligned_free(p);
#else
        std::free(p);
#endif
    }

    inline std::atomic<bool>& hooks_customised() noexcept {
        static std::atomic<bool> customised{false};
        return customised;
    }

    inline std::atomic<allocate_fn>& get_allocate_ptr() noexcept {
        static std::atomic<allocate_fn> ptr{default_allocate};
        return ptr;
    }

    inline std::atomic<deallocate_fn>& get_deallocate_ptr() noexcept {
        static std::atomic<deallocate_fn> ptr{default_deallocate};
        return ptr;
    }

    // Running totals over every allocation routed through the hooks.
    struct alloc_stats {
        std::uint64_t allocations = 0;
        std::uint64_t deallocations = 0;
        std::uint64_t bytes_allocated = 0;
    };

    inline std::atomic<std::uint64_t>& allocation_count() noexcept {
        static std::atomic<std::uint64_t> a{0};
        return a;
    }
    inline std::atomic<std::uint64_t>& deallocation_count() noexcept {
        static std::atomic<std::uint64_t> a{0};
        return a;
    }
    inline std::atomic<std::uint64_t>& allocated_bytes() noexcept {
        static std::atomic<std::uint64_t> a{0};
        return a;
    }

    inline alloc_stats get_stats() noexcept {
        alloc_stats s;
        s.allocations = allocation_count().load(std::memory_order_relaxed);
        s.deallocations = deallocation_count().load(std::memory_order_relaxed);
        s.bytes_allocated = allocated_bytes().load(std::memory_order_relaxed);
        return s;
    }

    inline void reset_stats() noexcept {
        allocation_count().store(0, std::memory_order_relaxed);
        deallocation_count().store(0, std::memory_order_relaxed);
        allocated_bytes().store(0, std::memory_order_relaxed);
    }

    inline void* allocate_bytes(std::size_t n, std::size_t align) noexcept {
        allocation_count().fetch_add(1, std::memory_order_relaxed);
        allocated_bytes().fetch_add(n, std::memory_order_relaxed);
        if (!hooks_customised().load(std::memory_order_relaxed)) {
            return default_allocate(n, align);
        }
        return get_allocate_ptr().load(std::memory_order_relaxed)(n, align);
    }

    inline void deallocate_bytes(void* p, std::size_t n, std::size_t align) noexcept {
        if (!p) return;
        deallocation_count().fetch_add(1, std::memory_order_relaxed);
        if (!hooks_customised().load(std::memory_order_relaxed)) {
            default_deallocate(p, n, align);
            return;
        }
        get_deallocate_ptr().load(std::memory_order_relaxed)(p, n, align);
    }

    // Installs custom hooks. Both must be provided together; passing nullptr
    // for both restores the defaults.
    inline void set_hooks(allocate_fn a, deallocate_fn d) noexcept {
        hooks_customised().store(a != nullptr && d != nullptr, std::memory_order_relaxed);
        get_allocate_ptr().store(a && d ? a : default_allocate, std::memory_order_relaxed);
        get_deallocate_ptr().store(a && d ? d : default_deallocate, std::memory_order_relaxed);
    }

}  // namespace alloc_hooks

inline void set_allocation_hooks(allocate_fn a, deallocate_fn d) noexcept { alloc_hooks::set_hooks(a, d); }
inline void reset_allocation_hooks() noexcept { alloc_hooks::set_hooks(nullptr, nullptr); }

// Standard allocator that routes through the hsplit hooks.
template <typename T>
struct hook_allocator {
    using value_type = T;

    hook_allocator() noexcept = default;
    template <typename U> hook_allocator(const hook_allocator<U>&) noexcept {}

    T* allocate(std::size_t n) {
        void* p = alloc_hooks::allocate_bytes(n * sizeof(T), alignof(T));
        if (!p) throw std::bad_alloc{};
        return static_cast<T*>(p);
    }

    void deallocate(T* p, std::size_t n) noexcept {
        alloc_hooks::deallocate_bytes(p, n * sizeof(T), alignof(T));
    }

    template <typename U> bool operator==(const hook_allocator<U>&) const noexcept { return true; }
    template <typename U> bool operator!=(const hook_allocator<U>&) const noexcept { return false; }
};

}  // namespace hsplit

#endif  // HSPLIT_ALLOC_HOOKS_HPP
