/**
 * @file config.cpp
 * @brief Implementation of the configuration utilities
 */

#include "jt808_codec/config.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace jt808_codec {

namespace {

template<typename T>
void readOption(const nlohmann::json& section, const std::string& sectionName, const char* key, T& target) {
    if (!section.contains(key)) {
        return;
    }

    try {
        target = section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid value for " + sectionName + "." + key + ": " + e.what());
    }
}

} // namespace

Parser::Config Config::loadParserConfig(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    return parseParserConfig(json);
}

Validator::Config Config::loadValidatorConfig(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    return parseValidatorConfig(json);
}

Parser::Config Config::parseParserConfig(const nlohmann::json& json) {
    Parser::Config config;

    if (json.contains("parser")) {
        const auto& parserJson = json.at("parser");

        readOption(parserJson, "parser", "validateChecksum", config.validateChecksum);
        readOption(parserJson, "parser", "decodeBody", config.decodeBody);
        readOption(parserJson, "parser", "validateOnBuild", config.validateOnBuild);
        readOption(parserJson, "parser", "logRawFrames", config.logRawFrames);

        // Read signed so a negative limit is reported instead of wrapping
        int64_t maxFrameSize = static_cast<int64_t>(config.maxFrameSize);
        readOption(parserJson, "parser", "maxFrameSize", maxFrameSize);
        if (maxFrameSize <= 0) {
            throw std::runtime_error("Invalid value for parser.maxFrameSize: must be positive, got " +
                                     std::to_string(maxFrameSize));
        }
        config.maxFrameSize = static_cast<size_t>(maxFrameSize);
    }

    return config;
}

Validator::Config Config::parseValidatorConfig(const nlohmann::json& json) {
    Validator::Config config;

    if (json.contains("validator")) {
        readOption(json.at("validator"), "validator", "strictMode", config.strictMode);
    }

    return config;
}

nlohmann::json Config::loadJsonFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + filepath);
    }

    try {
        nlohmann::json json;
        file >> json;
        return json;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse configuration file: " + std::string(e.what()));
    }
}

} // namespace jt808_codec
