#pragma once

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace flit {
    using json = nlohmann::json;

    // Reads a JSON object from disk. Problems are reported on std::cerr under
    // the caller's tag and yield an empty optional.
    inline std::optional<json> loadJsonConfig(const std::string& path, const char* tag = "Config") {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "[" << tag << "] Cannot open " << path << std::endl;
            return std::nullopt;
        }

        json document;
        try {
            file >> document;
        } catch (const json::parse_error& e) {
            std::cerr << "[" << tag << "] Invalid JSON in " << path << ": " << e.what() << std::endl;
            return std::nullopt;
        }

        if (!document.is_object()) {
            std::cerr << "[" << tag << "] Expected an object at the top of " << path << std::endl;
            return std::nullopt;
        }
        return document;
    }
}
