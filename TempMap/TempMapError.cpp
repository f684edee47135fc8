// Copyright © 2025 Cadell Richard Anderson

// TempMapError.cpp

#include "TempMapError.h"

namespace tempmap {

    const char* toString(TempMapError err) noexcept {
        switch (err) {
        case TempMapError::Success:         return "Success";
        case TempMapError::MissingFile:     return "MissingFile";
        case TempMapError::MissingTemplate: return "MissingTemplate";
        case TempMapError::InvalidTemplate: return "InvalidTemplate";
        case TempMapError::OutputDirectory: return "OutputDirectory";
        case TempMapError::SaveFailed:      return "SaveFailed";
        case TempMapError::IOError:         return "IOError";
        case TempMapError::Unknown:         break;
        }
        return "Unknown";
    }

} // namespace tempmap
