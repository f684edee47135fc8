// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// Pipeline.h
// Log + template in, colored result workbook out.
// =================================================================
#pragma once

#include "TempMapError.h"
#include "types.h"
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tempmap {

    enum class PipelineStage {
        ParseStart,
        MappingRead,
        Aggregation,
        BlockWritten,
        Save,
        Done
    };

    const char* toString(PipelineStage stage) noexcept;

    struct ProgressEvent {
        PipelineStage stage = PipelineStage::ParseStart;
        size_t current = 0; // BlockWritten: 1-based block number
        size_t total = 0;   // BlockWritten: number of blocks
        std::string message;
    };

    // Invoked synchronously on the pipeline's thread.
    using ProgressFn = std::function<void(const ProgressEvent&)>;

    // Everything one run derives, kept for callers and tests.
    struct Report {
        ParseResult parse;
        TemplateMapping mapping;
        AverageMap averages;
        OutputGrid grid;
        std::optional<ColorScaleSpec> colorScale;
    };

    class Pipeline {
    public:
        static constexpr const char* kResultFileName = "result.xlsx";

        // In-memory part of the run: parse, map, aggregate, compose, plan.
        static Report buildReport(std::string_view logText, const TemplateGrid& templateGrid,
            const ProgressFn& progress = nullptr);

        // Full run. Returns the path of the written workbook (<outputDir>/result.xlsx).
        // Without a progress callback, progress lines go to stdout.
        static std::expected<std::filesystem::path, PipelineFailure> run(
            const std::filesystem::path& logPath,
            const std::filesystem::path& templatePath,
            const std::filesystem::path& outputDir,
            const ProgressFn& progress = nullptr);
    };

} // namespace tempmap
