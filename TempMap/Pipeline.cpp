// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// Pipeline.cpp
// =================================================================
#include "Pipeline.h"
#include "Aggregator.h"
#include "ColorScalePlanner.h"
#include "GridComposer.h"
#include "LogParser.h"
#include "TemplateMapper.h"
#include "XlsxWriter.h"
#include <iostream>
#include <sstream>

namespace tempmap {

    namespace {
        // Routes progress to the caller's callback, or to stdout when there is none.
        class Reporter {
        public:
            explicit Reporter(const ProgressFn& fn) : fn_(fn) {}

            void operator()(PipelineStage stage, std::string message, size_t current = 0, size_t total = 0) const {
                if (fn_) {
                    fn_(ProgressEvent{ stage, current, total, std::move(message) });
                }
                else {
                    std::cout << message << std::endl;
                }
            }
        private:
            const ProgressFn& fn_;
        };
    }

    const char* toString(PipelineStage stage) noexcept {
        switch (stage) {
        case PipelineStage::ParseStart:   return "ParseStart";
        case PipelineStage::MappingRead:  return "MappingRead";
        case PipelineStage::Aggregation:  return "Aggregation";
        case PipelineStage::BlockWritten: return "BlockWritten";
        case PipelineStage::Save:         return "Save";
        case PipelineStage::Done:         return "Done";
        }
        return "Unknown";
    }

    Report Pipeline::buildReport(std::string_view logText, const TemplateGrid& templateGrid,
        const ProgressFn& progress)
    {
        Reporter report(progress);
        Report out;

        report(PipelineStage::ParseStart, "[*] Parsing log...");
        out.parse = LogParser::parse(logText);
        {
            const auto& d = out.parse.diagnostics;
            std::ostringstream msg;
            msg << "    Found " << out.parse.blocks.size() << " blocks ("
                << d.acceptedReadings << " readings, " << d.invalidReadings << " invalid, "
                << d.ignoredLines << " lines ignored)";
            report(PipelineStage::ParseStart, msg.str());
        }

        out.mapping = TemplateMapper::buildMapping(templateGrid);
        if (out.mapping.empty()) {
            report(PipelineStage::MappingRead,
                "[Warning] Template has no channel cells; sections will be empty.");
        }
        else {
            std::ostringstream msg;
            msg << "[*] Template " << out.mapping.maxRow << " rows x " << out.mapping.maxCol
                << " cols, " << out.mapping.positions.size() << " channel positions";
            report(PipelineStage::MappingRead, msg.str());
        }

        out.averages = Aggregator::average(out.parse.blocks);
        report(PipelineStage::Aggregation,
            "[*] Averaged " + std::to_string(out.averages.size()) + " channels");

        out.grid = GridComposer::compose(out.mapping, out.averages, out.parse.blocks,
            [&report](size_t number, size_t total, const Block& block) {
                report(PipelineStage::BlockWritten,
                    "    Wrote " + GridComposer::blockTitle(number, block), number, total);
            });

        out.colorScale = ColorScalePlanner::plan(out.grid);
        return out;
    }

    std::expected<std::filesystem::path, PipelineFailure> Pipeline::run(
        const std::filesystem::path& logPath,
        const std::filesystem::path& templatePath,
        const std::filesystem::path& outputDir,
        const ProgressFn& progress)
    {
        Reporter report(progress);
        std::error_code ec;

        // Both sources must exist before any processing starts.
        if (!std::filesystem::is_regular_file(logPath, ec)) {
            return std::unexpected(PipelineFailure{ TempMapError::MissingFile,
                "log file not found: " + logPath.string() });
        }
        if (!std::filesystem::is_regular_file(templatePath, ec)) {
            return std::unexpected(PipelineFailure{ TempMapError::MissingTemplate,
                "template file not found: " + templatePath.string() });
        }

        auto logText = LogParser::readFile(logPath);
        if (!logText) return std::unexpected(logText.error());

        auto templateGrid = TemplateMapper::loadTemplate(templatePath);
        if (!templateGrid) return std::unexpected(templateGrid.error());

        std::filesystem::create_directories(outputDir, ec);
        if (ec) {
            return std::unexpected(PipelineFailure{ TempMapError::OutputDirectory,
                outputDir.string() + ": " + ec.message() });
        }
        const std::filesystem::path outputFile = outputDir / kResultFileName;

        const Report built = buildReport(*logText, *templateGrid, progress);

        const u64 rows = GridComposer::rowsNeeded(built.mapping.maxRow, built.parse.blocks.size());
        if (rows > kMaxSheetRows) {
            return std::unexpected(PipelineFailure{ TempMapError::SaveFailed,
                "result needs " + std::to_string(rows) + " rows, a worksheet holds "
                + std::to_string(kMaxSheetRows) });
        }

        if (built.colorScale) {
            std::ostringstream msg;
            msg << "[*] Temperature range " << built.colorScale->minValue
                << " ~ " << built.colorScale->maxValue;
            report(PipelineStage::Save, msg.str());
        }
        report(PipelineStage::Save, "[*] Saving " + outputFile.string());

        auto saved = XlsxWriter::save(built.grid, built.colorScale, outputFile);
        if (!saved) return std::unexpected(saved.error());

        report(PipelineStage::Done, "[+] Done: " + outputFile.string());
        return outputFile;
    }

} // namespace tempmap
