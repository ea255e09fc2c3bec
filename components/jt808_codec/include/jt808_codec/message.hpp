#pragma once

#include "jt808_codec/types.hpp"
#include "jt808_codec/error.hpp"
#include "jt808_codec/header.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace jt808_codec {

// Forward declarations
class Parser;

/**
 * @brief Outcome of parsing one frame
 *
 * On success the header is set, the raw body is kept and, when the message
 * id is registered, the decoded fields are available. On failure only the
 * raw frame and the error are meaningful.
 */
class ParsedMessage {
public:
    /**
     * @brief Default constructor - creates a failed message with no error kind
     */
    ParsedMessage() = default;

    /**
     * @brief Successful message with decoded fields
     */
    ParsedMessage(const MessageHeader& header, const FieldMap& fields, const Bytes& rawBody);

    /**
     * @brief Failed message
     */
    static ParsedMessage failure(ParseErrorCode code, const std::string& message, const Bytes& rawFrame = {});

    // Basic accessors
    bool isSuccess() const { return success_; }
    const MessageHeader& getHeader() const { return header_; }
    uint16_t getMessageId() const { return header_.messageId; }
    const std::string& getDeviceId() const { return header_.deviceId; }
    uint16_t getSequenceNumber() const { return header_.sequenceNumber; }
    ProtocolVersion getProtocolVersion() const { return header_.protocolVersion; }
    const Bytes& getRawBody() const { return rawBody_; }
    const Bytes& getRawFrame() const { return rawFrame_; }

    // Error information
    ParseErrorCode getErrorCode() const { return errorCode_; }
    const std::string& getErrorMessage() const { return errorMessage_; }

    /**
     * @brief True when the body was decoded through a registered schema
     */
    bool isDecoded() const { return decoded_; }

    // Field access
    bool hasField(const std::string& name) const {
        return fields_.find(name) != fields_.end();
    }

    template<typename T>
    T getField(const std::string& name) const {
        auto it = fields_.find(name);
        if (it == fields_.end()) {
            throw FieldAccessError("Field '" + name + "' not found in message");
        }
        return convertValue<T>(it->second);
    }

    template<typename T>
    std::optional<T> tryGetField(const std::string& name) const {
        auto it = fields_.find(name);
        if (it == fields_.end()) {
            return std::nullopt;
        }
        try {
            return convertValue<T>(it->second);
        } catch (const TypeConversionError&) {
            return std::nullopt;
        }
    }

    // Get all field names, sorted
    std::vector<std::string> getFieldNames() const;

    const FieldMap& getFields() const { return fields_; }

    /**
     * @brief Render as JSON: header object, fields, raw body hex and error
     *
     * Strings that are not valid UTF-8 (GBK plate numbers) are rendered as
     * lowercase hex so the document can always be dumped.
     */
    nlohmann::json toJson() const;

private:
    bool success_ = false;
    bool decoded_ = false;
    MessageHeader header_;
    FieldMap fields_;
    Bytes rawBody_;
    Bytes rawFrame_;
    ParseErrorCode errorCode_ = ParseErrorCode::NONE;
    std::string errorMessage_;

    // Type conversion helper
    template<typename T>
    static T convertValue(const FieldValue& value) {
        if constexpr (std::is_arithmetic_v<T>) {
            const auto* number = std::get_if<int64_t>(&value);
            if (!number) {
                throw TypeConversionError("Cannot convert to requested numeric type");
            }
            return static_cast<T>(*number);
        } else {
            const auto* exact = std::get_if<T>(&value);
            if (!exact) {
                throw TypeConversionError("Cannot convert field value to requested type");
            }
            return *exact;
        }
    }

    friend class Parser;
};

/**
 * @brief JSON rendering of a single field value
 */
nlohmann::json fieldValueToJson(const FieldValue& value);

/**
 * @brief JSON rendering of a header
 */
nlohmann::json headerToJson(const MessageHeader& header);

} // namespace jt808_codec
