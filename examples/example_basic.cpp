#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include "../include/hsplit.hpp"

/// Basic hsplit usage examples
int main() {
    std::cout << "=== hsplit library version " << hsplit::version() << " ===" << std::endl << std::endl;

    std::mt19937 rng(42);
    std::vector<std::uint8_t> data(1 << 20);
    for (auto& b : data) b = static_cast<std::uint8_t>(rng() & 0xFF);

    // Example 1: One-shot split of a buffer
    {
        std::cout << "1. One-shot split:" << std::endl;

        hsplit::configuration cfg({.min_chunk_size = 2048, .max_chunk_size = 65536});
        const auto extents = hsplit::split(cfg, std::span<const std::uint8_t>(data));
        std::cout << "  Configuration: " << cfg.name() << std::endl;
        std::cout << "  Chunks: " << extents.size() << std::endl;
        std::cout << "  Mean chunk size: " << data.size() / extents.size() << " bytes" << std::endl;
        std::cout << "  First chunk: [" << extents.front().range.start << ", " << extents.front().range.end
                  << ")" << std::endl << std::endl;
    }

    // Example 2: Streaming with a recorded tree
    {
        std::cout << "2. Streaming driver:" << std::endl;

        hsplit::stream_driver driver({.max_level = 3});
        std::size_t roots = 0;
        for (std::size_t pos = 0; pos < data.size(); pos += 4096) {
            const std::size_t n = std::min<std::size_t>(4096, data.size() - pos);
            roots += driver.push(std::span<const std::uint8_t>(data.data() + pos, n)).size();
        }
        roots += driver.flush().size();

        const auto& tree = driver.tree();
        std::cout << "  Bytes seen: " << driver.bytes_seen() << std::endl;
        std::cout << "  Nodes: " << tree.size() << ", roots: " << roots << std::endl;
        std::cout << "  Height: " << tree.height() << std::endl;
        std::cout << "  Tree tiles the input: " << (tree.tiles() ? "true" : "false") << std::endl << std::endl;
    }

    // Example 3: Edits stay local
    {
        std::cout << "3. Edit locality:" << std::endl;

        hsplit::configuration cfg;
        auto edited = data;
        edited[data.size() / 2] ^= 0xFF;
        const auto before = hsplit::split(cfg, std::span<const std::uint8_t>(data));
        const auto after = hsplit::split(cfg, std::span<const std::uint8_t>(edited));

        std::size_t shared = 0;
        for (const auto& e : after) {
            for (const auto& o : before) {
                if (o == e) {
                    ++shared;
                    break;
                }
            }
        }
        std::cout << "  Chunks before: " << before.size() << ", after: " << after.size() << std::endl;
        std::cout << "  Unchanged chunks: " << shared << std::endl << std::endl;
    }

    // Example 4: Configuration errors
    {
        std::cout << "4. Error handling:" << std::endl;

        try {
            hsplit::configuration bad({.min_chunk_size = 4096, .max_chunk_size = 1024});
        } catch (const hsplit::configuration_error& e) {
            std::cout << "  Rejected: " << e.what() << std::endl;
        }

        hsplit::stream_driver driver;
        driver.push(std::string_view("hello"));
        driver.flush();
        try {
            driver.push(std::string_view("world"));
        } catch (const hsplit::sequence_error& e) {
            std::cout << "  Rejected: " << e.what() << std::endl;
        }
    }

    return 0;
}
