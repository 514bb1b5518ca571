#include <iostream>
#include <random>
#include <string>
#include <vector>
#include "../include/hsplit.hpp"

// Prints each node as it closes, indented by level.
class printing_sink final : public hsplit::node_sink {
public:
    void consume(const hsplit::node_view& node) override {
        if (node.level == 0 && !node.root) return;
        std::cout << "  " << std::string(2 * node.level, ' ') << "L" << node.level << " #" << node.id << " ["
                  << node.range.start << ", " << node.range.end << ") children=" << node.children.size()
                  << " cause=" << hsplit::to_string(node.cause.kind) << (node.root ? " (root)" : "") << std::endl;
    }
};

/// Fixed-capacity driver and custom sinks
int main() {
    std::mt19937 rng(7);
    std::vector<std::uint8_t> data(256 * 1024);
    for (auto& b : data) b = static_cast<std::uint8_t>(rng() & 0xFF);

    // Example 1: Interior nodes as they close
    {
        std::cout << "1. Fixed-capacity driver with a printing sink:" << std::endl;

        hsplit::fixed_stream_driver driver({.max_level = 2,
                                            .rule = std::make_shared<hsplit::trailing_zeros_rule>(11, 3),
                                            .max_chunk_size = 16384,
                                            .max_children = 16});
        printing_sink sink;
        driver.push(std::span<const std::uint8_t>(data), sink);
        driver.flush(sink);
        std::cout << std::endl;
    }

    // Example 2: Counting without recording
    {
        std::cout << "2. Counting sink:" << std::endl;

        hsplit::fixed_stream_driver driver;
        hsplit::counting_node_sink sink;
        driver.push(std::span<const std::uint8_t>(data), sink);
        driver.flush(sink);
        std::cout << "  Chunks: " << sink.chunks() << " (" << sink.chunk_bytes() << " bytes)" << std::endl;
        for (unsigned level = 1; level <= driver.config().max_level(); ++level) {
            std::cout << "  Level " << level << " nodes: " << sink.at_level(level) << std::endl;
        }
        std::cout << "  Forced closures: " << sink.forced() << std::endl << std::endl;
    }

    // Example 3: Capacity errors leave the driver usable
    {
        std::cout << "3. Capacity errors:" << std::endl;

        hsplit::basic_stream_driver<hsplit::rrs1, hsplit::fixed_storage<64, 4, 4>> driver(
            {.window_size = 16, .max_level = 2, .max_chunk_size = 10, .max_children = 0});
        hsplit::null_node_sink sink;
        std::size_t accepted = 0;
        for (std::size_t pos = 0; pos < 200; pos += 10) {
            try {
                driver.push(std::span<const std::uint8_t>(data.data() + pos, 10), sink);
                accepted += 10;
            } catch (const hsplit::capacity_error& e) {
                std::cout << "  " << e.what() << std::endl;
                break;
            }
        }
        std::cout << "  Accepted " << accepted << " bytes, driver still at " << driver.bytes_seen() << std::endl;
        driver.flush(sink);
    }

    return 0;
}
