// Copyright © 2025 Cadell Richard Anderson

//TempMapConfig.cpp

#include "TempMapConfig.h"
#include "tinyxml2.h"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <vector>

namespace tempmap::TempMapConfigNS {

    namespace {
        void read_text(tinyxml2::XMLElement* root, const char* name, std::string& out) {
            if (tinyxml2::XMLElement* elem = root->FirstChildElement(name)) {
                if (const char* text = elem->GetText()) out = text;
            }
        }

        std::filesystem::path get_exe_dir() {
            std::error_code ec;
            auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
            if (!ec && exe.has_parent_path()) return exe.parent_path();
            return std::filesystem::current_path(ec);
        }

        std::string get_env_str(const char* var) {
            const char* v = std::getenv(var);
            return v ? std::string(v) : std::string{};
        }
    }

    bool load(const std::string& configFilePath, ConfigState& config) {
        tinyxml2::XMLDocument doc;

        if (doc.LoadFile(configFilePath.c_str()) != tinyxml2::XML_SUCCESS) {
            std::cerr << "[Warning] Could not load " << configFilePath
                << ". Using default settings." << std::endl;
            return false;
        }

        tinyxml2::XMLElement* root = doc.FirstChildElement("TempMap");
        if (!root) {
            std::cerr << "[Warning] Malformed " << configFilePath << ". Using default settings."
                << std::endl;
            return false;
        }

        read_text(root, "DataFile", config.dataFile);
        read_text(root, "TemplateFile", config.templateFile);
        read_text(root, "OutputDir", config.outputDir);
        if (tinyxml2::XMLElement* elem = root->FirstChildElement("Quiet")) {
            elem->QueryBoolText(&config.quiet);
        }

        config.loadedFrom = configFilePath;
        return true;
    }

    bool load_with_fallback(ConfigState& outConfig, const std::string& explicitPath) {
        // An explicit path that fails is reported, not silently replaced.
        if (!explicitPath.empty())
            return load(explicitPath, outConfig);

        std::vector<std::filesystem::path> candidates;

        if (auto envPath = get_env_str("TEMPMAP_CONFIG"); !envPath.empty()) {
            candidates.emplace_back(envPath);
        }

        auto exeDir = get_exe_dir();
        candidates.emplace_back(exeDir / "TempMapConfig.xml");
        candidates.emplace_back(exeDir / "config" / "TempMapConfig.xml");

        std::error_code ec;
        candidates.emplace_back(std::filesystem::current_path(ec) / "TempMapConfig.xml");

        for (const auto& c : candidates) {
            if (!std::filesystem::exists(c, ec)) continue;
            if (load(c.string(), outConfig)) {
                return true;
            }
        }
        // No config anywhere is normal; defaults apply.
        return false;
    }

} // namespace tempmap::TempMapConfigNS
