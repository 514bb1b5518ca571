#include <hsplit.hpp>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <random>
#include <span>
#include <string>
#include <utility>
#include <vector>

#define TEST(condition, name) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << name << "\n"; \
        return 1; \
    } else { \
        std::cout << "PASS: " << name << "\n"; \
    }

namespace {

struct recorded {
    hsplit::node_id id;
    unsigned level;
    hsplit::byte_range range;
    hsplit::closure cause;
    std::vector<hsplit::node_id> children;
    bool root;

    bool operator==(const recorded&) const = default;
};

class recording_sink final : public hsplit::node_sink {
public:
    void consume(const hsplit::node_view& n) override {
        nodes.push_back(recorded{n.id, n.level, n.range, n.cause,
                                 std::vector<hsplit::node_id>(n.children.begin(), n.children.end()), n.root});
    }
    std::vector<recorded> nodes;
};

using bytes = std::vector<std::uint8_t>;

bytes random_bytes(std::size_t n, unsigned seed) {
    std::mt19937 rng(seed);
    bytes out(n);
    for (auto& b : out) b = static_cast<std::uint8_t>(rng() & 0xFF);
    return out;
}

std::span<const std::uint8_t> view(const bytes& b) { return std::span<const std::uint8_t>(b); }

// Runs data through a fresh driver in pieces of the given sizes (cycled).
template <typename Driver>
std::vector<recorded> run(std::shared_ptr<const hsplit::configuration> cfg, const bytes& data,
                          const std::vector<std::size_t>& pieces = {}) {
    Driver driver(std::move(cfg));
    recording_sink sink;
    if (pieces.empty()) {
        driver.push(view(data), sink);
    } else {
        std::size_t pos = 0;
        std::size_t i = 0;
        while (pos < data.size()) {
            std::size_t n = std::min(pieces[i++ % pieces.size()], data.size() - pos);
            driver.push(view(data).subspan(pos, n), sink);
            pos += n;
        }
    }
    driver.flush(sink);
    return sink.nodes;
}

std::vector<hsplit::byte_range> leaves_of(std::shared_ptr<const hsplit::configuration> cfg, const bytes& data) {
    hsplit::stream_driver driver(std::move(cfg));
    driver.push(view(data));
    driver.flush();
    return driver.tree().leaves();
}

// Leaves that differ between two chunkings once the common prefix and the
// common (shifted) suffix are removed.
std::pair<std::size_t, std::size_t> changed_leaves(const std::vector<hsplit::byte_range>& a,
                                                   const std::vector<hsplit::byte_range>& b,
                                                   std::int64_t delta) {
    std::size_t p = 0;
    while (p < a.size() && p < b.size() && a[p] == b[p]) ++p;
    std::size_t s = 0;
    while (s < a.size() - p && s < b.size() - p) {
        const auto& x = a[a.size() - 1 - s];
        const auto& y = b[b.size() - 1 - s];
        if (x.start + delta != y.start || x.end + delta != y.end) break;
        ++s;
    }
    return {a.size() - p - s, b.size() - p - s};
}

constexpr auto content = hsplit::closure_kind::content;
constexpr auto eos = hsplit::closure_kind::end_of_stream;

} // namespace

int main() {
    hsplit::log::set_level(spdlog::level::off);

    // Window 4, two levels, one zero bit per level, "abcdefgh"
    {
        auto cfg = hsplit::make_configuration({.window_size = 4,
                                               .max_level = 2,
                                               .rule = std::make_shared<hsplit::trailing_zeros_rule>(2, 1)});
        hsplit::stream_driver driver(cfg);
        const std::string input = "abcdefgh";
        auto pushed_roots = driver.push(input);
        auto flushed_roots = driver.flush();
        const auto& tree = driver.tree();

        std::string rebuilt;
        bool none_empty = true;
        for (const auto& r : tree.leaves()) {
            none_empty = none_empty && !r.empty();
            rebuilt += input.substr(r.start, r.size());
        }
        TEST(rebuilt == input, "abcdefgh: leaves concatenate to the input");
        TEST(none_empty, "abcdefgh: no empty chunk");
        TEST(!tree.roots().empty(), "abcdefgh: at least one root");
        TEST(pushed_roots.size() == 1 && flushed_roots.size() == 2, "abcdefgh: one root on push, two on flush");

        recording_sink sink;
        hsplit::stream_driver again(cfg);
        again.push(input, sink);
        again.flush(sink);
        const std::vector<recorded> expected = {
            {0, 0, {0, 3}, {content, 2}, {}, false},
            {1, 1, {0, 3}, {content, 2}, {0}, false},
            {2, 2, {0, 3}, {content, 2}, {1}, true},
            {3, 0, {3, 5}, {content, 0}, {}, false},
            {4, 0, {5, 7}, {content, 1}, {}, false},
            {5, 1, {3, 7}, {content, 1}, {3, 4}, false},
            {6, 2, {3, 7}, {eos, 2}, {5}, true},
            {7, 0, {7, 8}, {eos, 0}, {}, true},
        };
        TEST(sink.nodes == expected, "abcdefgh: exact node sequence");
    }

    const auto cfg = hsplit::make_configuration({.max_level = 3,
                                                 .rule = std::make_shared<hsplit::trailing_zeros_rule>(9, 2)});
    const bytes data = random_bytes(200000, 2024);

    // Determinism
    {
        auto a = run<hsplit::stream_driver>(cfg, data);
        auto b = run<hsplit::stream_driver>(cfg, data);
        TEST(!a.empty() && a == b, "independent drivers produce identical trees");

        auto c = run<hsplit::stream_driver>(cfg, data, {1, 7, 4096, 333, 65536});
        TEST(a == c, "push granularity does not change the tree");

        auto d = run<hsplit::fixed_stream_driver>(cfg, data);
        auto e = run<hsplit::fixed_stream_driver>(cfg, data, {13, 1000});
        TEST(a == d && a == e, "fixed and dynamic drivers produce identical trees");
    }

    // Reconstruction
    {
        hsplit::stream_driver driver(cfg);
        driver.push(view(data));
        driver.flush();
        const auto& tree = driver.tree();
        bytes rebuilt;
        for (const auto& r : tree.leaves()) {
            rebuilt.insert(rebuilt.end(), data.begin() + r.start, data.begin() + r.end);
        }
        TEST(rebuilt == data, "leaves reconstruct the input");
        TEST(tree.tiles() && tree.total_bytes() == data.size(), "tree tiles the input");
        TEST(driver.bytes_seen() == data.size() && driver.pending_bytes() == 0, "all bytes consumed");

        hsplit::stream_driver empty(cfg);
        auto roots = empty.flush();
        TEST(roots.empty() && empty.tree().empty(), "empty input yields no nodes");
        TEST(empty.tree().tiles() && empty.tree().leaves().empty(), "empty input reconstructs to nothing");

        hsplit::basic_stream_driver<hsplit::bozo32> bozo(cfg);
        bozo.push(view(data));
        bozo.flush();
        TEST(bozo.tree().tiles() && bozo.tree().total_bytes() == data.size(), "bozo32 driver tiles the input");
    }

    // Locality of small edits
    {
        auto loc = hsplit::make_configuration({.max_level = 3,
                                               .rule = std::make_shared<hsplit::trailing_zeros_rule>(10, 2)});
        const bytes base = random_bytes(1 << 18, 7);
        const std::size_t pos = 100000;
        const auto original = leaves_of(loc, base);

        bytes inserted = base;
        inserted.insert(inserted.begin() + pos, std::uint8_t{0x5A});
        bytes deleted = base;
        deleted.erase(deleted.begin() + pos);
        bytes modified = base;
        modified[pos] ^= 0xFF;

        auto [ia, ib] = changed_leaves(original, leaves_of(loc, inserted), 1);
        auto [da, db] = changed_leaves(original, leaves_of(loc, deleted), -1);
        auto [ma, mb] = changed_leaves(original, leaves_of(loc, modified), 0);
        TEST(original.size() > 100, "locality: input spans many chunks");
        TEST(ia <= 2 && ib <= 2, "locality: single-byte insert touches at most two chunks");
        TEST(da <= 2 && db <= 2, "locality: single-byte delete touches at most two chunks");
        TEST(ma <= 2 && mb <= 2, "locality: single-byte modify touches at most two chunks");
    }

    // Level distribution with one bit per level
    {
        auto dist = hsplit::make_configuration({.max_level = 8,
                                                .rule = std::make_shared<hsplit::trailing_zeros_rule>(6, 1)});
        std::vector<std::uint64_t> per_level(9, 0);
        auto sink = hsplit::make_function_sink([&](const hsplit::node_view& n) {
            if (n.level == 0 && n.cause.kind == hsplit::closure_kind::content) ++per_level[n.cause.level];
        });
        hsplit::stream_driver driver(dist);
        const bytes stream = random_bytes(1 << 20, 1234);
        driver.push(view(stream), sink);
        driver.flush(sink);

        bool close_to_two = true;
        for (unsigned l = 0; l < 4; ++l) {
            const double ratio = static_cast<double>(per_level[l]) / static_cast<double>(per_level[l + 1]);
            if (ratio < 1.7 || ratio > 2.3) close_to_two = false;
        }
        TEST(per_level[0] > 5000, "distribution: enough level-0 boundaries to measure");
        TEST(close_to_two, "distribution: each level about half as frequent as the one below");
    }

    // Forced closure on a boundary-free stream
    {
        const bytes zeros(10000, 0);
        auto span_cfg = hsplit::make_configuration({.max_level = 2, .max_chunk_size = 1000});
        hsplit::stream_driver driver(span_cfg);
        recording_sink sink;
        driver.push(view(zeros), sink);
        TEST(driver.pending_bytes() == 0, "valve: no unbounded pending span");
        driver.flush(sink);

        std::size_t chunks = 0;
        bool bounded = true;
        bool all_forced = true;
        for (const auto& n : sink.nodes) {
            if (n.level != 0) continue;
            ++chunks;
            bounded = bounded && n.range.size() <= 1000;
            all_forced = all_forced && n.cause.kind == hsplit::closure_kind::forced;
        }
        TEST(chunks == 10 && bounded, "valve: ten chunks of at most max_chunk_size");
        TEST(all_forced, "valve: chunks are marked forced");
        TEST(sink.nodes.size() == 11 && sink.nodes.back().level == 1 && sink.nodes.back().root,
             "valve: one partial level-1 root on flush");

        auto fan_cfg = hsplit::make_configuration({.max_level = 2, .max_chunk_size = 100, .max_children = 4});
        hsplit::counting_node_sink counts;
        hsplit::basic_stream_driver<hsplit::rrs1, hsplit::fixed_storage<64, 4, 4>> small(fan_cfg);
        small.push(view(zeros), counts);
        small.flush(counts);
        TEST(counts.at_level(0) == 100 && counts.at_level(1) == 25 && counts.at_level(2) == 7,
             "valve: fan-out limit bounds every level");
        TEST(counts.roots() == 7, "valve: seven level-2 roots");
        TEST((run<hsplit::stream_driver>(fan_cfg, zeros)
                  == run<hsplit::basic_stream_driver<hsplit::rrs1, hsplit::fixed_storage<64, 4, 4>>>(fan_cfg, zeros)),
             "valve: fixed and dynamic agree under forced closures");
    }

    // Flush is terminal until reset
    {
        hsplit::stream_driver driver(cfg);
        driver.push(view(data).first(5000));
        auto first = driver.flush();
        TEST(driver.finished() && !first.empty(), "flush: emits the remaining roots");

        bool threw = false;
        try {
            driver.flush();
        } catch (const hsplit::sequence_error& e) {
            threw = e.code() == hsplit::error_code::sequence;
        }
        TEST(threw, "flush: second flush is a sequence error");
        TEST(driver.tree().roots().size() == first.size(), "flush: nothing re-emitted");

        threw = false;
        try {
            driver.push("more");
        } catch (const hsplit::sequence_error&) {
            threw = true;
        }
        TEST(threw, "flush: push after flush is a sequence error");

        threw = false;
        try {
            driver.prime("more");
        } catch (const hsplit::sequence_error&) {
            threw = true;
        }
        TEST(threw, "flush: prime after flush is a sequence error");

        driver.reset();
        TEST(!driver.finished() && driver.bytes_seen() == 0 && driver.tree().empty(), "reset: fresh state");
        driver.push(view(data).first(5000));
        auto again = driver.flush();
        TEST(again == first, "reset: replay produces the same roots and ids");
    }

    // Roots returned by push/flush match the recorded tree
    {
        hsplit::stream_driver driver(cfg);
        std::vector<hsplit::node_id> returned;
        for (std::size_t pos = 0; pos < data.size(); pos += 40000) {
            auto r = driver.push(view(data).subspan(pos, std::min<std::size_t>(40000, data.size() - pos)));
            returned.insert(returned.end(), r.begin(), r.end());
            TEST(driver.open_levels() <= 3, "push: open levels bounded by max_level");
        }
        auto r = driver.flush();
        returned.insert(returned.end(), r.begin(), r.end());
        TEST(std::equal(returned.begin(), returned.end(), driver.tree().roots().begin(), driver.tree().roots().end()),
             "push/flush: returned roots are the recorded roots");
        TEST(driver.nodes_emitted() == driver.tree().size(), "push/flush: every node recorded");
    }

    // Fixed-capacity overflow is rejected without side effects
    {
        using tiny_driver = hsplit::basic_stream_driver<hsplit::rrs1, hsplit::fixed_storage<64, 4, 4>>;
        tiny_driver driver({.window_size = 16, .max_level = 2, .max_chunk_size = 10, .max_children = 0});
        hsplit::counting_node_sink sink;
        const bytes zeros(64, 0);

        driver.push(view(zeros).first(45), sink);
        TEST(sink.nodes() == 4 && driver.bytes_seen() == 45, "capacity: four forced chunks fit");

        const auto digest_before = driver.digest();
        bool threw = false;
        try {
            driver.push(view(zeros).first(10), sink);
        } catch (const hsplit::capacity_error& e) {
            threw = e.level() == 1 && e.capacity() == 4;
        }
        TEST(threw, "capacity: fifth child raises capacity_error");
        TEST(sink.nodes() == 4, "capacity: sink untouched by the failed push");
        TEST(driver.bytes_seen() == 45 && driver.pending_bytes() == 5 && driver.nodes_emitted() == 4
                 && driver.digest() == digest_before,
             "capacity: driver state untouched by the failed push");

        driver.push(view(zeros).first(4), sink);
        TEST(driver.bytes_seen() == 49 && sink.nodes() == 4, "capacity: shorter push still accepted");

        threw = false;
        try {
            driver.push(view(zeros).first(1), sink);
        } catch (const hsplit::capacity_error&) {
            threw = true;
        }
        TEST(threw, "capacity: overflow byte rejected again");
        TEST(driver.flush(sink) == 2 && sink.chunk_bytes() == 49, "capacity: flush still completes");
    }

    // Priming with the preceding bytes reproduces boundaries mid-stream
    {
        const std::size_t split_at = 10000;
        auto content_ends = [](const std::vector<recorded>& nodes, std::uint64_t shift, std::uint64_t after) {
            std::vector<std::uint64_t> ends;
            for (const auto& n : nodes) {
                if (n.level == 0 && n.cause.kind == hsplit::closure_kind::content && n.range.end + shift > after) {
                    ends.push_back(n.range.end + shift);
                }
            }
            return ends;
        };

        auto whole = run<hsplit::stream_driver>(cfg, data);

        hsplit::stream_driver tail(cfg);
        recording_sink sink;
        tail.prime(view(data).first(split_at));
        tail.push(view(data).subspan(split_at), sink);
        tail.flush(sink);

        auto expected = content_ends(whole, 0, split_at);
        auto got = content_ends(sink.nodes, split_at, split_at);
        TEST(!expected.empty() && expected == got, "prime: boundaries match the unsplit stream");
        TEST(tail.bytes_seen() == data.size() - split_at, "prime: preamble is not part of the stream");

        bool threw = false;
        try {
            tail.reset();
            tail.push("x");
            tail.prime("y");
        } catch (const hsplit::sequence_error&) {
            threw = true;
        }
        TEST(threw, "prime: after the first push is a sequence error");
    }

    // Moving a driver mid-stream
    {
        hsplit::stream_driver first(cfg);
        recording_sink sink;
        first.push(view(data).first(100000), sink);
        hsplit::stream_driver moved(std::move(first));
        moved.push(view(data).subspan(100000), sink);
        moved.flush(sink);
        TEST(sink.nodes == run<hsplit::stream_driver>(cfg, data), "move: driver continues after a move");
    }

    std::cout << "\nAll stream driver tests passed!\n";
    return 0;
}
