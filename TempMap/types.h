// Copyright © 2025 Cadell Richard Anderson

// types.h

#pragma once
#include <cstdint>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

using f64 = double;
using i32 = int32_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// =========================================================
// Log side: channels, readings and blocks
// =========================================================
namespace tempmap {

    using channel_id = i32;

    // Title used for a block whose delimiter never supplied one.
    inline constexpr const char* kUnknownBlockTitle = "unknown";

    struct Reading {
        channel_id channel = 0;
        f64 temperature = 0.0;
    };

    // One test block: channel -> temperature, one reading per channel.
    struct Block {
        std::string title = kUnknownBlockTitle;
        std::map<channel_id, f64> readings;

        bool empty() const noexcept { return readings.empty(); }
    };

    using AverageMap = std::map<channel_id, f64>;

    struct ParseDiagnostics {
        size_t totalLines = 0;
        size_t delimiterLines = 0;
        size_t acceptedReadings = 0;
        size_t invalidReadings = 0;    // valid flag != 1
        size_t overwrittenReadings = 0; // same channel repeated in one block
        size_t ignoredLines = 0;
        size_t droppedEmptyBlocks = 0;
    };

    struct ParseResult {
        std::vector<Block> blocks;
        ParseDiagnostics diagnostics;
    };

} // namespace tempmap

// =========================================================
// Template side: raw workbook cells and the channel layout
// =========================================================
namespace tempmap {

    // 1-based spreadsheet coordinate.
    struct CellRef {
        u32 row = 0;
        u32 col = 0;

        bool operator==(const CellRef& other) const { return row == other.row && col == other.col; }
        bool operator<(const CellRef& other) const {
            return row != other.row ? row < other.row : col < other.col;
        }
    };

    // Largest worksheet an xlsx workbook can hold.
    inline constexpr u32 kMaxSheetRows = 1048576;
    inline constexpr u32 kMaxSheetCols = 16384;

    enum class CellKind {
        Number,
        Text,
        Boolean,
        Error
    };

    struct TemplateCell {
        CellRef ref;
        CellKind kind = CellKind::Text;
        std::string text;  // raw cell text
        f64 number = 0.0;  // valid when kind == Number or Boolean (0/1)
    };

    // First worksheet of a template workbook, populated cells only.
    struct TemplateGrid {
        std::vector<TemplateCell> cells;
    };

    struct TemplateMapping {
        std::map<CellRef, channel_id> positions;        // (row, col) -> channel
        std::map<channel_id, CellRef> channelPositions; // channel -> (row, col), last write wins
        u32 maxRow = 0;
        u32 maxCol = 0;

        // EmptyTemplate: no integer cell was found.
        bool empty() const noexcept { return positions.empty(); }
    };

} // namespace tempmap

// =========================================================
// Output side: the composed grid and its color scale
// =========================================================
namespace tempmap {

    struct TitleRow {
        u32 row = 0;
        std::string text;
        u32 mergeFirstCol = 1;
        u32 mergeLastCol = 1;
    };

    struct OutputGrid {
        std::map<CellRef, f64> cells; // sparse; absent == never written
        std::vector<TitleRow> titles;
        std::vector<f64> writtenValues; // every value written, in write order

        std::optional<f64> valueAt(u32 row, u32 col) const {
            auto it = cells.find(CellRef{ row, col });
            if (it == cells.end()) return std::nullopt;
            return it->second;
        }

        // Bottom-right corner of everything written, titles and their merge spans included.
        CellRef occupiedExtent() const {
            CellRef extent{ 0, 0 };
            for (const auto& [ref, value] : cells) {
                if (ref.row > extent.row) extent.row = ref.row;
                if (ref.col > extent.col) extent.col = ref.col;
            }
            for (const auto& t : titles) {
                if (t.row > extent.row) extent.row = t.row;
                const u32 lastCol = t.mergeLastCol > t.mergeFirstCol ? t.mergeLastCol : t.mergeFirstCol;
                if (lastCol > extent.col) extent.col = lastCol;
            }
            return extent;
        }

        bool operator==(const OutputGrid& other) const {
            if (cells != other.cells || writtenValues != other.writtenValues) return false;
            if (titles.size() != other.titles.size()) return false;
            for (size_t i = 0; i < titles.size(); ++i) {
                const auto& a = titles[i];
                const auto& b = other.titles[i];
                if (a.row != b.row || a.text != b.text ||
                    a.mergeFirstCol != b.mergeFirstCol || a.mergeLastCol != b.mergeLastCol) {
                    return false;
                }
            }
            return true;
        }
    };

    // 0xRRGGBB
    struct RgbColor {
        u32 value = 0;
    };

    inline constexpr RgbColor kColorScaleLow{ 0x00FF00 };
    inline constexpr RgbColor kColorScaleMid{ 0xFFFF00 };
    inline constexpr RgbColor kColorScaleHigh{ 0xFF0000 };

    struct ColorScaleSpec {
        f64 minValue = 0.0;
        f64 midValue = 0.0;
        f64 maxValue = 0.0;
        RgbColor lowColor = kColorScaleLow;
        RgbColor midColor = kColorScaleMid;
        RgbColor highColor = kColorScaleHigh;
        CellRef rangeFirst{ 1, 1 };
        CellRef rangeLast{ 1, 1 };
    };

} // namespace tempmap
