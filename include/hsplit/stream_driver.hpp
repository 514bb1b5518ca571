// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_STREAM_DRIVER_HPP
#define HSPLIT_STREAM_DRIVER_HPP

// Push/flush front end of the chunking engine.
//
// A driver owns one rolling window and one tree builder wired to a shared
// configuration. Bytes may be pushed in chunks of any size; the tree that
// comes out depends only on the concatenated input. flush() closes the
// stream; after it only reset() is accepted.
//
//   hsplit::stream_driver driver;
//   driver.push(first_block);
//   driver.push(second_block);
//   auto roots = driver.flush();
//   for (auto r : driver.tree().leaves()) { ... }
//
// Callers that want no allocation at all use fixed_stream_driver and pass
// their own node_sink to push()/flush().

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include "hsplit/boundary_rule.hpp"
#include "hsplit/chunk_tree.hpp"
#include "hsplit/config.hpp"
#include "hsplit/configuration.hpp"
#include "hsplit/errors.hpp"
#include "hsplit/hashers.hpp"
#include "hsplit/logging.hpp"
#include "hsplit/node.hpp"
#include "hsplit/node_sinks.hpp"
#include "hsplit/profiling.hpp"
#include "hsplit/rolling_window.hpp"
#include "hsplit/storage.hpp"
#include "hsplit/tree_builder.hpp"

namespace hsplit {

template <rolling_hasher Hasher = rrs1, storage_policy Storage = dynamic_storage>
class basic_stream_driver {
public:
    using hasher_type = Hasher;
    using storage_type = Storage;
    using window_type = rolling_window<Hasher, typename Storage::window_buffer>;
    using builder_type = tree_builder<Storage>;

    explicit basic_stream_driver(std::shared_ptr<const configuration> cfg)
        : _cfg(checked(std::move(cfg))),
          _classifier(_cfg->classifier()),
          _state{window_type(_cfg->window_size(), _cfg->seed()), builder_type(*_cfg)} {}

    explicit basic_stream_driver(options opts = {})
        : basic_stream_driver(make_configuration(std::move(opts))) {}

    basic_stream_driver(const basic_stream_driver&) = delete;
    basic_stream_driver& operator=(const basic_stream_driver&) = delete;
    basic_stream_driver(basic_stream_driver&&) noexcept = default;
    basic_stream_driver& operator=(basic_stream_driver&&) noexcept = default;

    // Feeds bytes and reports closed nodes to sink in closing order.
    // Returns the number of roots emitted. If the fixed-capacity storage
    // would overflow, throws capacity_error without touching the driver or
    // the sink.
    std::size_t push(std::span<const std::uint8_t> bytes, node_sink& sink) {
        profiler p("hsplit::stream_driver::push");
        ensure_open("push");
        if (bytes.empty()) return 0;
        if (may_overflow()) rehearse(bytes);
        return run(_state, bytes, sink);
    }

    std::size_t push(std::string_view text, node_sink& sink) {
        return push(as_bytes(text), sink);
    }

    // Feeds bytes into the driver's own chunk_tree; returns the ids of the
    // roots this call produced.
    std::vector<node_id> push(std::span<const std::uint8_t> bytes) {
        const std::size_t before = _tree.roots().size();
        push(bytes, _tree);
        return roots_since(before);
    }

    std::vector<node_id> push(std::string_view text) { return push(as_bytes(text)); }

    // Ends the stream: emits the open nodes as partial roots, highest level
    // first, then the pending chunk. A second flush() is a sequence_error.
    std::size_t flush(node_sink& sink) {
        profiler p("hsplit::stream_driver::flush");
        ensure_open("flush");
        const std::size_t roots = _state.builder.finish(sink);
        _finished = true;
        log::logger()->debug("hsplit::stream_driver: flushed {} bytes, {} nodes, {} final roots",
                             _state.builder.offset(), _state.builder.next_id(), roots);
        return roots;
    }

    std::vector<node_id> flush() {
        const std::size_t before = _tree.roots().size();
        flush(_tree);
        return roots_since(before);
    }

    // Rolls a preamble through the window without making it part of the
    // stream, so a region can be chunked exactly as it would be in the
    // middle of a larger stream. Only valid before the first byte.
    void prime(std::span<const std::uint8_t> preamble) {
        ensure_open("prime");
        if (_state.builder.offset() != 0) {
            log::logger()->warn("hsplit::stream_driver: prime() after {} bytes were pushed",
                                _state.builder.offset());
            throw sequence_error("hsplit::stream_driver: prime() must precede the first push()");
        }
        _state.window.push(preamble);
    }

    void prime(std::string_view preamble) { prime(as_bytes(preamble)); }

    // Returns the driver to its freshly constructed state. Unflushed data
    // and the recorded tree are discarded; node ids restart at 0.
    void reset() noexcept {
        _state.window.reset();
        _state.builder.reset();
        _tree.clear();
        _finished = false;
    }

    HSPLIT_NODISCARD std::uint64_t bytes_seen() const noexcept { return _state.builder.offset(); }
    HSPLIT_NODISCARD std::uint64_t pending_bytes() const noexcept { return _state.builder.pending_bytes(); }
    HSPLIT_NODISCARD unsigned open_levels() const noexcept { return _state.builder.open_levels(); }
    HSPLIT_NODISCARD node_id nodes_emitted() const noexcept { return _state.builder.next_id(); }
    HSPLIT_NODISCARD bool finished() const noexcept { return _finished; }
    HSPLIT_NODISCARD digest_type digest() const noexcept { return _state.window.digest(); }

    // Nodes recorded by the sink-less push()/flush() overloads. A stream fed
    // through both kinds of overload has node ids missing from this tree, and
    // recording the first one after the gap throws std::invalid_argument.
    HSPLIT_NODISCARD const chunk_tree& tree() const noexcept { return _tree; }

    HSPLIT_NODISCARD const configuration& config() const noexcept { return *_cfg; }
    HSPLIT_NODISCARD std::shared_ptr<const configuration> shared_config() const noexcept { return _cfg; }
    HSPLIT_NODISCARD std::string name() const { return _cfg->template name<Hasher>(); }

private:
    struct engine_state {
        window_type window;
        builder_type builder;
    };

    static std::shared_ptr<const configuration> checked(std::shared_ptr<const configuration> cfg) {
        if (!cfg) {
            throw configuration_error("hsplit::stream_driver: configuration is null");
        }
        if (cfg->window_size() > Storage::window_capacity) {
            throw configuration_error(fmt::format(
                "hsplit::stream_driver: window_size {} exceeds the storage window capacity {}",
                cfg->window_size(), Storage::window_capacity));
        }
        return cfg;
    }

    static std::span<const std::uint8_t> as_bytes(std::string_view text) noexcept {
        return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    }

    // Only a fixed child list whose fan-out valve cannot keep it in bounds
    // can run out of room.
    bool may_overflow() const noexcept {
        if constexpr (!Storage::fixed_capacity) {
            return false;
        } else {
            const std::size_t limit = _cfg->max_children();
            return _cfg->max_level() > 0 && (limit == 0 || limit > Storage::child_capacity);
        }
    }

    // Runs bytes against a copy of the engine with output discarded, so an
    // overflow surfaces before anything observable happens.
    void rehearse(std::span<const std::uint8_t> bytes) const {
        engine_state copy = _state;
        copy.builder.set_quiet(true);
        null_node_sink discard;
        try {
            run(copy, bytes, discard);
        } catch (const capacity_error& e) {
            log::logger()->warn("hsplit::stream_driver: rejected push of {} bytes: {}", bytes.size(), e.what());
            throw;
        }
    }

    std::size_t run(engine_state& state, std::span<const std::uint8_t> bytes, node_sink& sink) const {
        std::size_t roots = 0;
        for (std::uint8_t b : bytes) {
            roots += state.builder.advance(_classifier.classify(state.window.push(b)), sink);
        }
        return roots;
    }

    void ensure_open(const char* op) const {
        if (HSPLIT_UNLIKELY(_finished)) {
            log::logger()->warn("hsplit::stream_driver: {}() after flush()", op);
            throw sequence_error(fmt::format("hsplit::stream_driver: {}() after flush(); call reset() first", op));
        }
    }

    std::vector<node_id> roots_since(std::size_t before) const {
        const auto& roots = _tree.roots();
        return std::vector<node_id>(roots.begin() + static_cast<std::ptrdiff_t>(before), roots.end());
    }

    std::shared_ptr<const configuration> _cfg;
    level_classifier _classifier;
    engine_state _state;
    chunk_tree _tree;
    bool _finished = false;
};

using stream_driver = basic_stream_driver<rrs1, dynamic_storage>;
using fixed_stream_driver = basic_stream_driver<rrs1, default_fixed_storage>;

} // namespace hsplit

#endif // HSPLIT_STREAM_DRIVER_HPP
