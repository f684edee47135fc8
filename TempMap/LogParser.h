// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// LogParser.h
// Splits a sensor log into test blocks of valid channel readings.
// =================================================================
#pragma once

#include "TempMapError.h"
#include "types.h"
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace tempmap {

    class LogParser {
    public:
        // Never fails: unrecognized lines are counted in diagnostics and skipped.
        static ParseResult parse(std::string_view logText);

        // Whole log as text. MissingFile when it cannot be opened.
        static std::expected<std::string, PipelineFailure> readFile(const std::filesystem::path& path);

        static std::expected<ParseResult, PipelineFailure> parseFile(const std::filesystem::path& path);
    };

} // namespace tempmap
