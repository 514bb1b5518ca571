// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_HPP
#define HSPLIT_HPP

// Umbrella header for the hsplit library. Including this single header pulls
// in the whole chunking engine: hashers, the rolling window, boundary rules,
// configuration, the tree builder, stream drivers, node sinks and split().

#include "hsplit/config.hpp"
#include "hsplit/errors.hpp"
#include "hsplit/logging.hpp"
#include "hsplit/alloc_hooks.hpp"
#include "hsplit/containers.hpp"
#include "hsplit/storage.hpp"
#include "hsplit/hashers.hpp"
#include "hsplit/rolling_window.hpp"
#include "hsplit/boundary_rule.hpp"
#include "hsplit/configuration.hpp"
#include "hsplit/node.hpp"
#include "hsplit/node_sinks.hpp"
#include "hsplit/chunk_tree.hpp"
#include "hsplit/tree_builder.hpp"
#include "hsplit/stream_driver.hpp"
#include "hsplit/split.hpp"

namespace hsplit {
    constexpr int MAJOR_VERSION = 0;
    constexpr int MINOR_VERSION = 3;
    constexpr int PATCH_VERSION = 0;

    // Returns the library version as a human-readable string.
    inline const char* version() noexcept {
        return "0.3.0";
    }
}

#endif  // HSPLIT_HPP
