// Copyright © 2025 Cadell Richard Anderson

// Aggregator.h

#pragma once

#include "types.h"
#include <vector>

namespace tempmap {

    class Aggregator {
    public:
        // Per-channel mean over the blocks that contain the channel.
        // Channels seen in no block are absent, never zero.
        static AverageMap average(const std::vector<Block>& blocks);
    };

} // namespace tempmap
