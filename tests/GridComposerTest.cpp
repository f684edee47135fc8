// Copyright © 2025 Cadell Richard Anderson

/*
 * GridComposer layout tests.
 */

#include <gtest/gtest.h>
#include "GridComposer.h"

using namespace tempmap;

namespace {
    Block block(std::string title, std::map<channel_id, f64> readings) {
        Block b;
        b.title = std::move(title);
        b.readings = std::move(readings);
        return b;
    }
}

TEST(GridComposer, BlockTitleFormat)
{
    EXPECT_EQ("Block 3 (#####17#####)", GridComposer::blockTitle(3, block("17", {})));
    EXPECT_EQ("Block 1 (#####unknown#####)", GridComposer::blockTitle(1, Block{}));
}

// Title rows advance by maxRow + 2: one title row, maxRow body rows, one blank row.
TEST(GridComposer, SectionsStackWithOneBlankRow)
{
    const std::map<CellRef, channel_id> positions = {
        { CellRef{ 1, 1 }, 1 }, { CellRef{ 3, 2 }, 2 },
    };
    const std::vector<Block> blocks = {
        block("1", { { 1, 1.0 } }), block("2", { { 2, 2.0 } }), block("3", { { 1, 3.0 } }),
    };

    const auto grid = GridComposer::compose(positions, 3, 2, AverageMap{ { 1, 2.0 } }, blocks);
    ASSERT_EQ(4u, grid.titles.size());
    for (size_t n = 0; n < grid.titles.size(); ++n) {
        EXPECT_EQ(1u + n * 5u, grid.titles[n].row) << "section " << n;
        EXPECT_EQ(1u, grid.titles[n].mergeFirstCol);
        EXPECT_EQ(2u, grid.titles[n].mergeLastCol);
    }
    EXPECT_EQ(GridComposer::kAverageTitle, grid.titles[0].text);
    EXPECT_EQ("Block 2 (#####2#####)", grid.titles[2].text);

    // Body row r of a section sits r rows below its title.
    EXPECT_EQ(2.0, grid.valueAt(2, 1));
    EXPECT_EQ(1.0, grid.valueAt(7, 1));
    EXPECT_EQ(2.0, grid.valueAt(14, 2));
    EXPECT_EQ(3.0, grid.valueAt(17, 1));
}

TEST(GridComposer, MissingChannelLeavesCellAbsent)
{
    const std::map<CellRef, channel_id> positions = {
        { CellRef{ 1, 1 }, 1 }, { CellRef{ 1, 2 }, 2 },
    };
    const std::vector<Block> blocks = { block("1", { { 1, 0.0 } }) };

    const auto grid = GridComposer::compose(positions, 1, 2, AverageMap{}, blocks);
    EXPECT_FALSE(grid.valueAt(2, 1).has_value());
    EXPECT_FALSE(grid.valueAt(2, 2).has_value());
    ASSERT_TRUE(grid.valueAt(5, 1).has_value());
    EXPECT_EQ(0.0, *grid.valueAt(5, 1));
    EXPECT_FALSE(grid.valueAt(5, 2).has_value());
    EXPECT_EQ(std::vector<f64>{ 0.0 }, grid.writtenValues);
}

TEST(GridComposer, EmptyMappingProducesTitleOnlySections)
{
    const std::vector<Block> blocks = { block("1", { { 1, 5.0 } }), block("2", { { 1, 6.0 } }) };

    const auto grid = GridComposer::compose({}, 0, 0, AverageMap{ { 1, 5.5 } }, blocks);
    ASSERT_EQ(3u, grid.titles.size());
    EXPECT_EQ(1u, grid.titles[0].row);
    EXPECT_EQ(3u, grid.titles[1].row);
    EXPECT_EQ(5u, grid.titles[2].row);
    EXPECT_EQ(1u, grid.titles[0].mergeLastCol);
    EXPECT_TRUE(grid.cells.empty());
    EXPECT_TRUE(grid.writtenValues.empty());
}

TEST(GridComposer, ReportsEachBlockInOrder)
{
    const std::map<CellRef, channel_id> positions = { { CellRef{ 1, 1 }, 1 } };
    const std::vector<Block> blocks = { block("8", { { 1, 1.0 } }), block("9", { { 1, 2.0 } }) };

    std::vector<std::pair<size_t, std::string>> seen;
    GridComposer::compose(positions, 1, 1, AverageMap{}, blocks,
        [&seen](size_t number, size_t total, const Block& b) {
            EXPECT_EQ(2u, total);
            seen.emplace_back(number, b.title);
        });

    ASSERT_EQ(2u, seen.size());
    EXPECT_EQ(1u, seen[0].first);
    EXPECT_EQ("8", seen[0].second);
    EXPECT_EQ(2u, seen[1].first);
    EXPECT_EQ("9", seen[1].second);
}

TEST(GridComposer, DuplicateChannelWrittenAtEveryPosition)
{
    TemplateMapping mapping;
    mapping.positions = { { CellRef{ 1, 1 }, 4 }, { CellRef{ 2, 2 }, 4 } };
    mapping.channelPositions = { { 4, CellRef{ 2, 2 } } };
    mapping.maxRow = 2;
    mapping.maxCol = 2;

    const auto grid = GridComposer::compose(mapping, AverageMap{ { 4, 9.0 } }, {});
    EXPECT_EQ(9.0, grid.valueAt(2, 1));
    EXPECT_EQ(9.0, grid.valueAt(3, 2));
    EXPECT_EQ(2u, grid.writtenValues.size());
}

TEST(GridComposer, RowsNeeded)
{
    // Average section plus three blocks of maxRow 3: last body row is 19.
    EXPECT_EQ(19u, GridComposer::rowsNeeded(3, 3));
    EXPECT_EQ(1u, GridComposer::rowsNeeded(0, 0));
    EXPECT_EQ(5000u * (static_cast<u64>(kMaxSheetRows) + 2) - 1,
              GridComposer::rowsNeeded(kMaxSheetRows, 4999));
}

// Sections that would end past the last worksheet row are left out, and no
// row number wraps around.
TEST(GridComposer, StopsAtWorksheetRowLimit)
{
    const u32 maxRow = 600000;
    const std::map<CellRef, channel_id> positions = { { CellRef{ maxRow, 1 }, 1 } };
    const std::vector<Block> blocks = { block("1", { { 1, 5.0 } }), block("2", { { 1, 6.0 } }) };

    size_t written = 0;
    const auto grid = GridComposer::compose(positions, maxRow, 1, AverageMap{ { 1, 5.5 } }, blocks,
        [&written](size_t, size_t, const Block&) { ++written; });

    ASSERT_EQ(1u, grid.titles.size());
    EXPECT_EQ(0u, written);
    ASSERT_EQ(1u, grid.cells.size());
    EXPECT_DOUBLE_EQ(5.5, grid.valueAt(maxRow + 1, 1).value());
    EXPECT_LE(grid.occupiedExtent().row, kMaxSheetRows);
}
