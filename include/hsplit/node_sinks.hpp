// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_NODE_SINKS_HPP
#define HSPLIT_NODE_SINKS_HPP

// Consumers of emitted nodes. The tree builder reports every closed node to
// a node_sink in closing order; what the sink does with it (store it, hash
// it, count it, drop it) is up to the caller.

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include "hsplit/node.hpp"

namespace hsplit {

// Abstract base class for node destinations. The view, including its child
// span, is only valid inside consume().
class node_sink {
public:
    virtual ~node_sink() = default;

    virtual void consume(const node_view& node) = 0;
};

// Discards every node.
class null_node_sink final : public node_sink {
public:
    void consume(const node_view&) override {}
};

// Tallies nodes per level without storing them. Levels above the tracked
// range are folded into the last bucket.
class counting_node_sink final : public node_sink {
public:
    static constexpr std::size_t tracked_levels = 32;

    void consume(const node_view& node) override {
        ++_nodes;
        if (node.root) ++_roots;
        if (node.cause.kind == closure_kind::forced) ++_forced;
        std::size_t bucket = node.level < tracked_levels ? node.level : tracked_levels - 1;
        ++_per_level[bucket];
        if (node.level == 0) _chunk_bytes += node.range.size();
    }

    std::uint64_t nodes() const noexcept { return _nodes; }
    std::uint64_t roots() const noexcept { return _roots; }
    std::uint64_t forced() const noexcept { return _forced; }
    std::uint64_t chunks() const noexcept { return _per_level[0]; }
    std::uint64_t chunk_bytes() const noexcept { return _chunk_bytes; }
    std::uint64_t at_level(unsigned level) const noexcept {
        return level < tracked_levels ? _per_level[level] : 0;
    }

    void reset() noexcept { *this = counting_node_sink{}; }

private:
    std::uint64_t _nodes = 0;
    std::uint64_t _roots = 0;
    std::uint64_t _forced = 0;
    std::uint64_t _chunk_bytes = 0;
    std::array<std::uint64_t, tracked_levels> _per_level{};
};

// Forwards each node to a callable.
class function_node_sink final : public node_sink {
public:
    using callback_type = std::function<void(const node_view&)>;

    explicit function_node_sink(callback_type fn) : _fn(std::move(fn)) {}

    void consume(const node_view& node) override {
        if (_fn) _fn(node);
    }

private:
    callback_type _fn;
};

template <typename Fn>
function_node_sink make_function_sink(Fn&& fn) {
    return function_node_sink(function_node_sink::callback_type(std::forward<Fn>(fn)));
}

} // namespace hsplit

#endif // HSPLIT_NODE_SINKS_HPP
