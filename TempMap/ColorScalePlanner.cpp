// Copyright © 2025 Cadell Richard Anderson

// ColorScalePlanner.cpp

#include "ColorScalePlanner.h"
#include <algorithm>

namespace tempmap {

    std::optional<ColorScaleSpec> ColorScalePlanner::plan(std::span<const f64> values) {
        if (values.empty()) return std::nullopt;

        const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
        ColorScaleSpec spec;
        spec.minValue = *lo;
        spec.maxValue = *hi;
        spec.midValue = (spec.minValue + spec.maxValue) / 2.0;
        return spec;
    }

    std::optional<ColorScaleSpec> ColorScalePlanner::plan(const OutputGrid& grid) {
        auto spec = plan(std::span<const f64>(grid.writtenValues));
        if (!spec) return std::nullopt;

        const CellRef extent = grid.occupiedExtent();
        spec->rangeFirst = CellRef{ 1, 1 };
        spec->rangeLast = CellRef{ std::max<u32>(1, extent.row), std::max<u32>(1, extent.col) };
        return spec;
    }

} // namespace tempmap
