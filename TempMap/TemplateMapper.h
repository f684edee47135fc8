// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// TemplateMapper.h
// Channel layout taken from a template worksheet.
// =================================================================
#pragma once

#include "TempMapError.h"
#include "types.h"
#include <expected>
#include <filesystem>
#include <optional>

namespace tempmap {

    class TemplateMapper {
    public:
        // Maps every integer cell to its position. Cells outside the worksheet
        // bounds are skipped. An empty template yields a zero-extent mapping
        // rather than an error.
        static TemplateMapping buildMapping(const TemplateGrid& grid);

        // Channel held by a cell: numbers truncate toward zero, text must be a
        // decimal integer, booleans read as 0/1, errors never map.
        static std::optional<channel_id> cellChannel(const TemplateCell& cell);

        // MissingTemplate when absent, InvalidTemplate when unreadable.
        static std::expected<TemplateGrid, PipelineFailure> loadTemplate(const std::filesystem::path& path);
    };

} // namespace tempmap
