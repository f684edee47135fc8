// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// GridComposer.h
// Stacks the average map and every block into one output grid.
// =================================================================
#pragma once

#include "types.h"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace tempmap {

    class GridComposer {
    public:
        static constexpr const char* kAverageTitle = "Average Temperature Map";

        // Called after block `number` (1-based) of `total` has been written.
        using BlockWrittenFn = std::function<void(size_t number, size_t total, const Block& block)>;

        // "Block 3 (#####17#####)"
        static std::string blockTitle(size_t number, const Block& block);

        // Last row the layout occupies for `blockCount` blocks plus the average section.
        static u64 rowsNeeded(u32 maxRow, size_t blockCount);

        /**
         * @brief Lays out the average section followed by one section per block.
         *
         * Each section is a title row spanning columns 1..maxCol followed by maxRow
         * mapped rows; sections are separated by one blank row, so section N's
         * title sits maxRow + 2 rows below section N-1's. Positions whose channel
         * has no value in a section stay absent from the grid. Sections that
         * would end past kMaxSheetRows are not written.
         */
        static OutputGrid compose(
            const std::map<CellRef, channel_id>& positions, u32 maxRow, u32 maxCol,
            const AverageMap& averages, const std::vector<Block>& blocks,
            const BlockWrittenFn& onBlockWritten = nullptr);

        static OutputGrid compose(
            const TemplateMapping& mapping, const AverageMap& averages,
            const std::vector<Block>& blocks, const BlockWrittenFn& onBlockWritten = nullptr);
    };

} // namespace tempmap
