// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_STORAGE_HPP
#define HSPLIT_STORAGE_HPP

// Storage policies for the rolling window and the tree builder.
//
// A policy names three container types: the window ring buffer, the child
// id list of one open node, and the stack of open levels. fixed_storage
// keeps all of them inline (a driver built on it never allocates while
// pushing into a caller-supplied sink); dynamic_storage grows on demand
// through the allocation hooks.

#include <cstddef>
#include <cstdint>
#include <limits>
#include "hsplit/config.hpp"
#include "hsplit/containers.hpp"
#include "hsplit/node.hpp"

namespace hsplit {

template <std::size_t WindowCapacity, std::size_t ChildCapacity, std::size_t LevelCapacity>
struct fixed_storage {
    static_assert(WindowCapacity > 0, "fixed_storage needs room for at least one window byte");
    static_assert(ChildCapacity > 1, "fixed_storage child capacity must be at least 2");

    static constexpr bool fixed_capacity = true;
    static constexpr std::size_t window_capacity = WindowCapacity;
    static constexpr std::size_t child_capacity = ChildCapacity;
    static constexpr std::size_t level_capacity = LevelCapacity;

    using window_buffer = static_vector<std::uint8_t, WindowCapacity>;
    using child_list = static_vector<node_id, ChildCapacity>;
    template <typename Slot> using level_stack = static_vector<Slot, LevelCapacity>;
};

using default_fixed_storage = fixed_storage<HSPLIT_FIXED_WINDOW_CAPACITY,
                                            HSPLIT_FIXED_CHILD_CAPACITY,
                                            HSPLIT_FIXED_LEVEL_CAPACITY>;

struct dynamic_storage {
    static constexpr bool fixed_capacity = false;
    static constexpr std::size_t window_capacity = std::numeric_limits<std::size_t>::max();
    static constexpr std::size_t child_capacity = std::numeric_limits<std::size_t>::max();
    static constexpr std::size_t level_capacity = std::numeric_limits<std::size_t>::max();

    using window_buffer = growable_vector<std::uint8_t>;
    using child_list = growable_vector<node_id>;
    template <typename Slot> using level_stack = growable_vector<Slot>;
};

template <typename S>
concept storage_policy = requires {
    { S::fixed_capacity } -> std::convertible_to<bool>;
    { S::window_capacity } -> std::convertible_to<std::size_t>;
    { S::child_capacity } -> std::convertible_to<std::size_t>;
    { S::level_capacity } -> std::convertible_to<std::size_t>;
} && sequence_container<typename S::window_buffer>
  && sequence_container<typename S::child_list>;

} // namespace hsplit

#endif // HSPLIT_STORAGE_HPP
