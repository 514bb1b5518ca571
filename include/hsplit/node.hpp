// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_NODE_HPP
#define HSPLIT_NODE_HPP

// Value types describing the chunk tree: byte ranges, closure causes and the
// transient node_view handed to sinks.

#include <cstddef>
#include <cstdint>
#include <span>
#include "hsplit/config.hpp"

namespace hsplit {

// Sequential per-driver node identifier, starting at 0.
using node_id = std::uint64_t;

// Half-open stream range [start, end).
struct byte_range {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    HSPLIT_NODISCARD constexpr std::uint64_t size() const noexcept { return end - start; }
    HSPLIT_NODISCARD constexpr bool empty() const noexcept { return end == start; }

    friend constexpr bool operator==(const byte_range&, const byte_range&) noexcept = default;
};

enum class closure_kind : std::uint8_t {
    content,        // A natural boundary found by the classifier.
    forced,         // Span or fan-out safety valve.
    end_of_stream,  // Closed by flush().
};

inline const char* to_string(closure_kind kind) noexcept {
    switch (kind) {
        case closure_kind::content:       return "content";
        case closure_kind::forced:        return "forced";
        case closure_kind::end_of_stream: return "end_of_stream";
    }
    return "unknown";
}

// Why a node was closed. For content closures level is the boundary level
// that triggered it; otherwise it is the level of the node itself.
struct closure {
    closure_kind kind = closure_kind::content;
    unsigned level = 0;

    friend constexpr bool operator==(const closure&, const closure&) noexcept = default;
};

// A node at the moment it is emitted. children is empty for level-0 chunks
// and only valid for the duration of the sink callback.
struct node_view {
    node_id id = 0;
    unsigned level = 0;
    byte_range range;
    closure cause;
    std::span<const node_id> children;
    bool root = false;

    HSPLIT_NODISCARD bool is_chunk() const noexcept { return level == 0; }
};

} // namespace hsplit

#endif // HSPLIT_NODE_HPP
