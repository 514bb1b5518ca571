// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_CHUNK_TREE_HPP
#define HSPLIT_CHUNK_TREE_HPP

// Owning node_sink that records every node it is given, so callers can walk
// the finished tree. Nodes must arrive with contiguous ids, which is what a
// single driver produces between resets.

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>
#include "hsplit/alloc_hooks.hpp"
#include "hsplit/config.hpp"
#include "hsplit/node.hpp"
#include "hsplit/node_sinks.hpp"

namespace hsplit {

// A stored node. Children are looked up through chunk_tree::children().
struct tree_node {
    node_id id = 0;
    unsigned level = 0;
    byte_range range;
    closure cause;
    bool root = false;
};

class chunk_tree final : public node_sink {
public:
    template <typename T> using vector_type = std::vector<T, hook_allocator<T>>;

    chunk_tree() = default;

    void consume(const node_view& node) override {
        if (_records.empty()) {
            _base = node.id;
        } else if (node.id != _base + _records.size()) {
            throw std::invalid_argument("hsplit::chunk_tree: node id " + std::to_string(node.id)
                                        + " is not contiguous with the recorded nodes");
        }
        record r;
        r.node = tree_node{node.id, node.level, node.range, node.cause, node.root};
        r.first_child = _edges.size();
        r.child_count = node.children.size();
        _edges.insert(_edges.end(), node.children.begin(), node.children.end());
        _records.push_back(r);
        if (node.root) _roots.push_back(node.id);
    }

    HSPLIT_NODISCARD std::size_t size() const noexcept { return _records.size(); }
    HSPLIT_NODISCARD bool empty() const noexcept { return _records.empty(); }

    HSPLIT_NODISCARD bool contains(node_id id) const noexcept {
        return !_records.empty() && id >= _base && id - _base < _records.size();
    }

    const tree_node& at(node_id id) const {
        if (!contains(id)) {
            throw std::out_of_range("hsplit::chunk_tree: unknown node id " + std::to_string(id));
        }
        return _records[static_cast<std::size_t>(id - _base)].node;
    }

    // Unchecked.
    const tree_node& operator[](node_id id) const noexcept {
        return _records[static_cast<std::size_t>(id - _base)].node;
    }

    std::span<const node_id> children(node_id id) const {
        if (!contains(id)) {
            throw std::out_of_range("hsplit::chunk_tree: unknown node id " + std::to_string(id));
        }
        const record& r = _records[static_cast<std::size_t>(id - _base)];
        return std::span<const node_id>(_edges.data() + r.first_child, r.child_count);
    }

    // Roots in stream order.
    HSPLIT_NODISCARD const vector_type<node_id>& roots() const noexcept { return _roots; }

    // Level-0 ranges reachable from the roots, depth first, left to right.
    std::vector<byte_range> leaves() const {
        std::vector<byte_range> out;
        std::vector<node_id> stack;
        for (auto it = _roots.rbegin(); it != _roots.rend(); ++it) stack.push_back(*it);
        while (!stack.empty()) {
            node_id id = stack.back();
            stack.pop_back();
            const tree_node& n = at(id);
            if (n.level == 0) {
                out.push_back(n.range);
                continue;
            }
            auto kids = children(id);
            for (auto it = kids.rbegin(); it != kids.rend(); ++it) stack.push_back(*it);
        }
        return out;
    }

    // Number of levels spanned by the tallest root; 0 for an empty tree.
    HSPLIT_NODISCARD unsigned height() const noexcept {
        unsigned h = 0;
        for (node_id id : _roots) {
            unsigned l = (*this)[id].level + 1;
            if (l > h) h = l;
        }
        return h;
    }

    HSPLIT_NODISCARD std::uint64_t total_bytes() const noexcept {
        std::uint64_t total = 0;
        for (node_id id : _roots) total += (*this)[id].range.size();
        return total;
    }

    // True when the leaves are non-empty and cover [0, total_bytes())
    // back to back, and every parent's range is the union of its children.
    HSPLIT_NODISCARD bool tiles() const {
        std::uint64_t cursor = 0;
        for (const byte_range& r : leaves()) {
            if (r.start != cursor || r.empty()) return false;
            cursor = r.end;
        }
        if (cursor != total_bytes()) return false;

        for (const record& r : _records) {
            if (r.node.level == 0) {
                if (r.child_count != 0) return false;
                continue;
            }
            if (r.child_count == 0) return false;
            auto kids = children(r.node.id);
            if (at(kids.front()).range.start != r.node.range.start) return false;
            if (at(kids.back()).range.end != r.node.range.end) return false;
            for (std::size_t i = 0; i < kids.size(); ++i) {
                const tree_node& k = at(kids[i]);
                if (k.level >= r.node.level || k.root) return false;
                if (i && at(kids[i - 1]).range.end != k.range.start) return false;
            }
        }
        return true;
    }

    void clear() noexcept {
        _records.clear();
        _edges.clear();
        _roots.clear();
        _base = 0;
    }

private:
    struct record {
        tree_node node;
        std::size_t first_child = 0;
        std::size_t child_count = 0;
    };

    vector_type<record> _records;
    vector_type<node_id> _edges;
    vector_type<node_id> _roots;
    node_id _base = 0;
};

} // namespace hsplit

#endif // HSPLIT_CHUNK_TREE_HPP
