// Copyright © 2025 Cadell Richard Anderson

// XlsxReader.h
// Loads the populated cells of a workbook's first worksheet.

#pragma once

#include "TempMapError.h"
#include "types.h"
#include <expected>
#include <filesystem>

namespace tempmap::XlsxReader {

    // Reads the first sheet in workbook order. MissingTemplate if the file cannot be
    // read, InvalidTemplate if it is not a workbook or its first sheet is not a worksheet.
    std::expected<TemplateGrid, TempMapError> readFirstSheet(const std::filesystem::path& path);

} // namespace tempmap::XlsxReader
