// Copyright © 2025 Cadell Richard Anderson

// TempMapError.h

#pragma once

#include <string>

namespace tempmap {

    // The single, authoritative definition for all pipeline errors.
    enum class TempMapError {
        Success = 0,
        MissingFile = -1,      // log source absent or unreadable
        MissingTemplate = -2,  // template source absent or unreadable
        InvalidTemplate = -3,  // template exists but is not a readable workbook
        OutputDirectory = -4,  // output directory cannot be created
        SaveFailed = -5,       // workbook serialization or write failed
        IOError = -6,
        Unknown = -100
    };

    const char* toString(TempMapError err) noexcept;

    // Error code plus the verbatim reason, surfaced unchanged to callers.
    struct PipelineFailure {
        TempMapError code = TempMapError::Unknown;
        std::string detail;

        std::string describe() const {
            return detail.empty() ? std::string(toString(code))
                                  : std::string(toString(code)) + ": " + detail;
        }
    };

} // namespace tempmap
