// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_TREE_BUILDER_HPP
#define HSPLIT_TREE_BUILDER_HPP

// Streaming construction of the chunk tree.
//
// The builder is fed one boundary decision per byte and keeps a pending
// level-0 span plus one open node per level 1..max_level. A boundary of
// level L closes the span (the triggering byte is its last byte) and then
// the open nodes of levels 1..L, each closed node being appended to the
// level above. A node closed at max_level has no parent and is emitted as a
// root straight away, so memory stays bounded however long the stream is.
//
// Two safety valves bound pathological input: a span reaching
// max_chunk_size is closed as a forced chunk, and an open node reaching
// max_children children is closed as a forced node. Either valve is off
// when its limit is 0.
//
// The builder itself gives the basic exception guarantee only: when a sink
// or a fixed-capacity child list throws, nodes emitted earlier in the same
// call stay emitted. basic_stream_driver layers the strong guarantee on top.

#include <cstddef>
#include <cstdint>
#include <span>
#include <fmt/format.h>
#include "hsplit/boundary_rule.hpp"
#include "hsplit/config.hpp"
#include "hsplit/configuration.hpp"
#include "hsplit/errors.hpp"
#include "hsplit/logging.hpp"
#include "hsplit/node.hpp"
#include "hsplit/node_sinks.hpp"
#include "hsplit/storage.hpp"

namespace hsplit {

template <storage_policy Storage = dynamic_storage>
class tree_builder {
public:
    using storage_type = Storage;
    using child_list = typename Storage::child_list;

    // One open node: the ids appended so far and the bytes they cover.
    struct level_slot {
        child_list children;
        byte_range range;
    };

    using level_stack = typename Storage::template level_stack<level_slot>;

    explicit tree_builder(const configuration& cfg) : _cfg(&cfg) {
        if (cfg.max_level() > Storage::level_capacity) {
            throw configuration_error(fmt::format(
                "hsplit::tree_builder: max_level {} exceeds the storage level capacity {}",
                cfg.max_level(), Storage::level_capacity));
        }
        _levels.resize(cfg.max_level());
    }

    // Accounts for one more byte. Returns the number of roots emitted.
    std::size_t advance(boundary_level level, node_sink& sink) {
        ++_offset;
        const std::uint64_t span = _offset - _span_start;
        if (level && span >= _cfg->min_chunk_size()) {
            const unsigned top = *level < max_level() ? *level : max_level();
            return close_chunk(closure{closure_kind::content, top}, top, sink);
        }
        if (HSPLIT_UNLIKELY(_cfg->max_chunk_size() != 0 && span >= _cfg->max_chunk_size())) {
            if (!_quiet) {
                log::logger()->debug("hsplit::tree_builder: forced chunk at offset {} after {} bytes",
                                     _offset, span);
            }
            return close_chunk(closure{closure_kind::forced, 0}, 0, sink);
        }
        return 0;
    }

    // Emits every open node as a partial root, highest level first, then the
    // pending chunk. Returns the number of roots emitted.
    std::size_t finish(node_sink& sink) {
        std::size_t roots = 0;
        for (unsigned k = max_level(); k > 0; --k) {
            level_slot& slot = _levels[k - 1];
            if (slot.children.empty()) continue;
            emit(k, slot.range, closure{closure_kind::end_of_stream, k},
                 std::span<const node_id>(slot.children.data(), slot.children.size()), true, sink);
            slot.children.clear();
            ++roots;
        }
        if (_offset > _span_start) {
            emit(0, byte_range{_span_start, _offset}, closure{closure_kind::end_of_stream, 0},
                 {}, true, sink);
            _span_start = _offset;
            ++roots;
        }
        return roots;
    }

    void reset() noexcept {
        for (std::size_t i = 0; i < _levels.size(); ++i) {
            _levels[i].children.clear();
            _levels[i].range = byte_range{};
        }
        _offset = 0;
        _span_start = 0;
        _next_id = 0;
    }

    // Suppresses diagnostics; used while rehearsing a push on a copy.
    void set_quiet(bool quiet) noexcept { _quiet = quiet; }

    HSPLIT_NODISCARD const configuration& config() const noexcept { return *_cfg; }
    HSPLIT_NODISCARD unsigned max_level() const noexcept { return _cfg->max_level(); }
    HSPLIT_NODISCARD std::uint64_t offset() const noexcept { return _offset; }
    HSPLIT_NODISCARD std::uint64_t pending_bytes() const noexcept { return _offset - _span_start; }
    HSPLIT_NODISCARD node_id next_id() const noexcept { return _next_id; }

    // Number of levels with an open, non-empty node.
    HSPLIT_NODISCARD unsigned open_levels() const noexcept {
        unsigned n = 0;
        for (std::size_t i = 0; i < _levels.size(); ++i) {
            if (!_levels[i].children.empty()) ++n;
        }
        return n;
    }

    // Children collected so far by the open node of level (1..max_level).
    HSPLIT_NODISCARD std::size_t open_children(unsigned level) const noexcept {
        if (level == 0 || level > _levels.size()) return 0;
        return _levels[level - 1].children.size();
    }

private:
    std::size_t close_chunk(closure cause, unsigned natural_top, node_sink& sink) {
        const byte_range range{_span_start, _offset};
        const bool root = max_level() == 0;
        node_id id = emit(0, range, cause, {}, root, sink);
        _span_start = _offset;
        return (root ? 1 : 0) + promote(id, 0, range, natural_top, cause, sink);
    }

    // Appends a freshly closed node to the level above and keeps closing
    // upwards while the boundary level or the fan-out valve says so.
    std::size_t promote(node_id id, unsigned from, byte_range range, unsigned natural_top,
                        closure cause, node_sink& sink) {
        std::size_t roots = 0;
        const std::size_t max_children = _cfg->max_children();
        while (from < max_level()) {
            const unsigned k = from + 1;
            level_slot& slot = _levels[k - 1];
            if (HSPLIT_UNLIKELY(slot.children.size() >= slot.children.max_size())) {
                overflow(k, slot.children.max_size());
            }
            if (slot.children.empty()) {
                slot.range = range;
            } else {
                slot.range.end = range.end;
            }
            slot.children.push_back(id);

            closure c;
            if (k <= natural_top) {
                c = cause;
            } else if (max_children != 0 && slot.children.size() >= max_children) {
                c = closure{closure_kind::forced, k};
                if (!_quiet) {
                    log::logger()->debug("hsplit::tree_builder: forced level-{} node over [{}, {})",
                                         k, slot.range.start, slot.range.end);
                }
            } else {
                break;
            }

            const bool root = k == max_level();
            id = emit(k, slot.range, c,
                      std::span<const node_id>(slot.children.data(), slot.children.size()), root, sink);
            range = slot.range;
            slot.children.clear();
            if (root) ++roots;
            from = k;
        }
        return roots;
    }

    node_id emit(unsigned level, byte_range range, closure cause, std::span<const node_id> children,
                 bool root, node_sink& sink) {
        node_view view{_next_id, level, range, cause, children, root};
        sink.consume(view);
        if (root && !_quiet) {
            log::logger()->trace("hsplit::tree_builder: root {} level {} [{}, {})",
                                 view.id, level, range.start, range.end);
        }
        return _next_id++;
    }

    [[noreturn]] void overflow(unsigned level, std::size_t capacity) const {
        if (!_quiet) {
            log::logger()->warn("hsplit::tree_builder: level {} is full at {} children", level, capacity);
        }
        throw capacity_error(fmt::format("hsplit::tree_builder: level {} child list is full ({} children)",
                                         level, capacity),
                             level, capacity);
    }

    const configuration* _cfg;
    level_stack _levels;
    std::uint64_t _offset = 0;
    std::uint64_t _span_start = 0;
    node_id _next_id = 0;
    bool _quiet = false;
};

} // namespace hsplit

#endif // HSPLIT_TREE_BUILDER_HPP
