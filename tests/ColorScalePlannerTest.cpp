// Copyright © 2025 Cadell Richard Anderson

/*
 * ColorScalePlanner tests.
 */

#include <gtest/gtest.h>
#include <vector>
#include "ColorScalePlanner.h"

using namespace tempmap;

TEST(ColorScalePlanner, NoValuesNoScale)
{
    const std::vector<f64> none;
    EXPECT_FALSE(ColorScalePlanner::plan(std::span<const f64>(none)).has_value());
    EXPECT_FALSE(ColorScalePlanner::plan(OutputGrid{}).has_value());
}

TEST(ColorScalePlanner, MidIsMeanOfExtremes)
{
    const std::vector<f64> values{ 5.0, 15.0 };
    const auto spec = ColorScalePlanner::plan(std::span<const f64>(values));
    ASSERT_TRUE(spec.has_value());
    EXPECT_DOUBLE_EQ(5.0, spec->minValue);
    EXPECT_DOUBLE_EQ(10.0, spec->midValue);
    EXPECT_DOUBLE_EQ(15.0, spec->maxValue);

    EXPECT_EQ(0x00FF00u, spec->lowColor.value);
    EXPECT_EQ(0xFFFF00u, spec->midColor.value);
    EXPECT_EQ(0xFF0000u, spec->highColor.value);
}

// Not the mean of the values: skewed input still centres on (min + max) / 2.
TEST(ColorScalePlanner, SkewedValues)
{
    const std::vector<f64> values{ 1.0, 1.0, 1.0, 9.0, -3.0 };
    const auto spec = ColorScalePlanner::plan(std::span<const f64>(values));
    ASSERT_TRUE(spec.has_value());
    EXPECT_DOUBLE_EQ(-3.0, spec->minValue);
    EXPECT_DOUBLE_EQ(3.0, spec->midValue);
    EXPECT_DOUBLE_EQ(9.0, spec->maxValue);
}

TEST(ColorScalePlanner, RangeCoversOccupiedRectangle)
{
    OutputGrid grid;
    grid.titles.push_back(TitleRow{ 1, "Average Temperature Map", 1, 4 });
    grid.cells[CellRef{ 2, 2 }] = 20.0;
    grid.cells[CellRef{ 6, 1 }] = 30.0;
    grid.writtenValues = { 20.0, 30.0 };

    const auto spec = ColorScalePlanner::plan(grid);
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ((CellRef{ 1, 1 }), spec->rangeFirst);
    EXPECT_EQ((CellRef{ 6, 4 }), spec->rangeLast);
    EXPECT_DOUBLE_EQ(25.0, spec->midValue);
}
