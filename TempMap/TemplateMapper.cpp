// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// TemplateMapper.cpp
// =================================================================
#include "TemplateMapper.h"
#include "XlsxReader.h"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <string_view>
#include <vector>

namespace tempmap {

    namespace {
        static std::string_view trim(std::string_view s) {
            constexpr std::string_view ws = " \t\r\n";
            const auto first = s.find_first_not_of(ws);
            if (first == std::string_view::npos) return {};
            return s.substr(first, s.find_last_not_of(ws) - first + 1);
        }
    }

    std::optional<channel_id> TemplateMapper::cellChannel(const TemplateCell& cell) {
        switch (cell.kind) {
        case CellKind::Number: {
            if (!std::isfinite(cell.number)) return std::nullopt;
            const f64 truncated = std::trunc(cell.number);
            if (truncated < static_cast<f64>(std::numeric_limits<channel_id>::min()) ||
                truncated > static_cast<f64>(std::numeric_limits<channel_id>::max())) {
                return std::nullopt;
            }
            return static_cast<channel_id>(truncated);
        }
        case CellKind::Text: {
            std::string_view s = trim(cell.text);
            if (!s.empty() && s.front() == '+') s.remove_prefix(1);
            if (s.empty()) return std::nullopt;
            channel_id value = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
            if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
            return value;
        }
        case CellKind::Boolean:
            return cell.number != 0.0 ? 1 : 0;
        case CellKind::Error:
            break;
        }
        return std::nullopt;
    }

    TemplateMapping TemplateMapper::buildMapping(const TemplateGrid& grid) {
        // Row-major visit order makes "last write wins" deterministic.
        std::vector<const TemplateCell*> ordered;
        ordered.reserve(grid.cells.size());
        for (const auto& cell : grid.cells) ordered.push_back(&cell);
        std::stable_sort(ordered.begin(), ordered.end(),
            [](const TemplateCell* a, const TemplateCell* b) { return a->ref < b->ref; });

        TemplateMapping mapping;
        for (const TemplateCell* cell : ordered) {
            if (cell->ref.row == 0 || cell->ref.col == 0) continue;
            if (cell->ref.row > kMaxSheetRows || cell->ref.col > kMaxSheetCols) continue;
            const auto channel = cellChannel(*cell);
            if (!channel) continue;

            mapping.positions[cell->ref] = *channel;
            mapping.channelPositions[*channel] = cell->ref;
            mapping.maxRow = std::max(mapping.maxRow, cell->ref.row);
            mapping.maxCol = std::max(mapping.maxCol, cell->ref.col);
        }
        return mapping;
    }

    std::expected<TemplateGrid, PipelineFailure> TemplateMapper::loadTemplate(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return std::unexpected(PipelineFailure{ TempMapError::MissingTemplate,
                "template file not found: " + path.string() });
        }
        auto grid = XlsxReader::readFirstSheet(path);
        if (!grid) {
            return std::unexpected(PipelineFailure{ grid.error(),
                grid.error() == TempMapError::MissingTemplate
                    ? "cannot open template: " + path.string()
                    : "not a readable workbook: " + path.string() });
        }
        return std::move(*grid);
    }

} // namespace tempmap
