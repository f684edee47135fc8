// Copyright © 2025 Cadell Richard Anderson

// Aggregator.cpp

#include "Aggregator.h"
#include <map>

namespace tempmap {

    AverageMap Aggregator::average(const std::vector<Block>& blocks) {
        struct Accum {
            f64 sum = 0.0;
            size_t count = 0;
        };
        std::map<channel_id, Accum> totals;
        for (const auto& block : blocks) {
            for (const auto& [channel, temp] : block.readings) {
                auto& acc = totals[channel];
                acc.sum += temp;
                ++acc.count;
            }
        }

        AverageMap averages;
        for (const auto& [channel, acc] : totals) {
            averages.emplace(channel, acc.sum / static_cast<f64>(acc.count));
        }
        return averages;
    }

} // namespace tempmap
