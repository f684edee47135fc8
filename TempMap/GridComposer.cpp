// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// GridComposer.cpp
// =================================================================
#include "GridComposer.h"
#include <algorithm>

namespace tempmap {

    namespace {
        static void write_title(OutputGrid& grid, u32 row, std::string text, u32 maxCol) {
            grid.titles.push_back(TitleRow{ row, std::move(text), 1, std::max<u32>(1, maxCol) });
        }

        // Writes one section body whose first mapped row is `startRow`.
        static void write_section(OutputGrid& grid,
            const std::map<CellRef, channel_id>& positions,
            const std::map<channel_id, f64>& values,
            u32 startRow)
        {
            for (const auto& [pos, channel] : positions) {
                auto it = values.find(channel);
                if (it == values.end()) continue;
                grid.cells[CellRef{ startRow + pos.row - 1, pos.col }] = it->second;
                grid.writtenValues.push_back(it->second);
            }
        }
    }

    std::string GridComposer::blockTitle(size_t number, const Block& block) {
        return "Block " + std::to_string(number) + " (#####" + block.title + "#####)";
    }

    u64 GridComposer::rowsNeeded(u32 maxRow, size_t blockCount) {
        return (static_cast<u64>(blockCount) + 1) * (static_cast<u64>(maxRow) + 2) - 1;
    }

    OutputGrid GridComposer::compose(
        const std::map<CellRef, channel_id>& positions, u32 maxRow, u32 maxCol,
        const AverageMap& averages, const std::vector<Block>& blocks,
        const BlockWrittenFn& onBlockWritten)
    {
        OutputGrid grid;
        u64 cursor = 1;
        auto fits = [&cursor, maxRow] { return cursor + maxRow <= kMaxSheetRows; };

        if (!fits()) return grid;
        write_title(grid, static_cast<u32>(cursor), kAverageTitle, maxCol);
        cursor += 1;
        write_section(grid, positions, averages, static_cast<u32>(cursor));
        cursor += static_cast<u64>(maxRow) + 1;

        for (size_t i = 0; i < blocks.size(); ++i) {
            if (!fits()) break;
            const Block& block = blocks[i];
            write_title(grid, static_cast<u32>(cursor), blockTitle(i + 1, block), maxCol);
            cursor += 1;
            write_section(grid, positions, block.readings, static_cast<u32>(cursor));
            cursor += static_cast<u64>(maxRow) + 1;

            if (onBlockWritten) onBlockWritten(i + 1, blocks.size(), block);
        }
        return grid;
    }

    OutputGrid GridComposer::compose(
        const TemplateMapping& mapping, const AverageMap& averages,
        const std::vector<Block>& blocks, const BlockWrittenFn& onBlockWritten)
    {
        return compose(mapping.positions, mapping.maxRow, mapping.maxCol, averages, blocks, onBlockWritten);
    }

} // namespace tempmap
