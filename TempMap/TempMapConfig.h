// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// TempMapConfig.h
// =================================================================
#pragma once
#include <string>

namespace tempmap {

    // Holds all settings loaded from TempMapConfig.xml
    struct ConfigState {
        std::string dataFile = "data/data1.txt";
        std::string templateFile = "template/template.xlsx";
        std::string outputDir = "result";
        bool quiet = false;

        std::string loadedFrom; // empty when defaults are in use
    };

    namespace TempMapConfigNS {
        // Load config file into provided ConfigState. Elements absent from the file keep their values.
        bool load(const std::string& configFilePath, ConfigState& outConfig);

        // Tries an explicit path first, then TEMPMAP_CONFIG, exe-relative, working dir
        bool load_with_fallback(ConfigState& outConfig,
            const std::string& explicitPath = "");
    }

} // namespace tempmap
