// Copyright © 2025 Cadell Richard Anderson

// XlsxWriter.h
// Renders a composed OutputGrid into a single-sheet workbook.

#pragma once

#include "TempMapError.h"
#include "types.h"
#include <expected>
#include <filesystem>
#include <optional>

namespace tempmap::XlsxWriter {

    inline constexpr const char* kSheetName = "result";

    // Writes a workbook with the single sheet "result": merged bold 12pt centered
    // titles, the numeric cells and the optional 3-color scale. Replaces any
    // existing file at `path`; SaveFailed when it cannot be written.
    std::expected<void, PipelineFailure> save(
        const OutputGrid& grid, const std::optional<ColorScaleSpec>& colorScale,
        const std::filesystem::path& path);

} // namespace tempmap::XlsxWriter
