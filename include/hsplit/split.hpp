// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_SPLIT_HPP
#define HSPLIT_SPLIT_HPP

// One-shot chunking of an in-memory buffer into level-0 extents.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>
#include "hsplit/configuration.hpp"
#include "hsplit/hashers.hpp"
#include "hsplit/node.hpp"
#include "hsplit/node_sinks.hpp"
#include "hsplit/stream_driver.hpp"

namespace hsplit {

// A chunk of the input and the reason it ended.
struct extent {
    byte_range range;
    closure cause;

    friend bool operator==(const extent&, const extent&) noexcept = default;
};

namespace detail {

    class extent_sink final : public node_sink {
    public:
        explicit extent_sink(std::vector<extent>& out) noexcept : _out(&out) {}

        void consume(const node_view& node) override {
            if (node.level == 0) _out->push_back(extent{node.range, node.cause});
        }

    private:
        std::vector<extent>* _out;
    };

} // namespace detail

// Chunk boundaries of data under cfg, in order. The extents tile
// [0, data.size()) and match the leaves a streaming driver would produce.
template <rolling_hasher Hasher = rrs1>
std::vector<extent> split(std::shared_ptr<const configuration> cfg, std::span<const std::uint8_t> data) {
    std::vector<extent> out;
    detail::extent_sink sink(out);
    basic_stream_driver<Hasher, dynamic_storage> driver(std::move(cfg));
    driver.push(data, sink);
    driver.flush(sink);
    return out;
}

template <rolling_hasher Hasher = rrs1>
std::vector<extent> split(const configuration& cfg, std::span<const std::uint8_t> data) {
    return split<Hasher>(std::make_shared<const configuration>(cfg), data);
}

template <rolling_hasher Hasher = rrs1>
std::vector<extent> split(const configuration& cfg, std::string_view text) {
    return split<Hasher>(cfg, std::span<const std::uint8_t>(
                                  reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

} // namespace hsplit

#endif // HSPLIT_SPLIT_HPP
