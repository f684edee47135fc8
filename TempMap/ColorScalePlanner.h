// Copyright © 2025 Cadell Richard Anderson

// ColorScalePlanner.h

#pragma once

#include "types.h"
#include <optional>
#include <span>

namespace tempmap {

    class ColorScalePlanner {
    public:
        // min/max of the values, mid = (min + max) / 2, anchors green/yellow/red.
        // No values, no scale.
        static std::optional<ColorScaleSpec> plan(std::span<const f64> values);

        // Same, with the range set to the grid's occupied rectangle from A1.
        static std::optional<ColorScaleSpec> plan(const OutputGrid& grid);
    };

} // namespace tempmap
