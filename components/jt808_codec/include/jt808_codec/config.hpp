/**
 * @file config.hpp
 * @brief Configuration utilities for the codec
 *
 * This file provides utilities for loading configuration from JSON files.
 */

#pragma once

#include "jt808_codec/parser.hpp"
#include "jt808_codec/validator.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace jt808_codec {

/**
 * @brief Configuration utilities
 *
 * Expected layout:
 * @code
 * {
 *   "parser":    { "validateChecksum": true, "decodeBody": true, "validateOnBuild": true,
 *                  "logRawFrames": false, "maxFrameSize": 4096 },
 *   "validator": { "strictMode": false }
 * }
 * @endcode
 * Missing sections or keys keep their defaults.
 */
class Config {
public:
    /**
     * @brief Load parser configuration from JSON file
     * @param filepath Path to JSON configuration file
     * @return Parser configuration
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static Parser::Config loadParserConfig(const std::string& filepath);

    /**
     * @brief Load validator configuration from JSON file
     * @param filepath Path to JSON configuration file
     * @return Validator configuration
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static Validator::Config loadValidatorConfig(const std::string& filepath);

    /**
     * @brief Parse parser configuration from JSON
     * @param json JSON document
     * @return Parser configuration
     * @throws std::runtime_error if a key holds a value of the wrong type
     */
    static Parser::Config parseParserConfig(const nlohmann::json& json);

    /**
     * @brief Parse validator configuration from JSON
     * @param json JSON document
     * @return Validator configuration
     * @throws std::runtime_error if a key holds a value of the wrong type
     */
    static Validator::Config parseValidatorConfig(const nlohmann::json& json);

private:
    /**
     * @brief Load JSON from file
     * @param filepath Path to JSON file
     * @return JSON object
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static nlohmann::json loadJsonFromFile(const std::string& filepath);
};

} // namespace jt808_codec
