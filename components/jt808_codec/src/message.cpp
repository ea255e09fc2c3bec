#include "jt808_codec/message.hpp"
#include "jt808_codec/buffer.hpp"
#include "jt808_codec/schema.hpp"
#include <algorithm>

namespace jt808_codec {

namespace {

nlohmann::json locationToJson(const LocationRecord& record) {
    return nlohmann::json{
        {"alarmFlag", record.alarmFlag},
        {"statusFlag", record.statusFlag},
        {"latitude", record.latitude},
        {"longitude", record.longitude},
        {"altitude", record.altitude},
        {"speed", record.speed},
        {"direction", record.direction},
        {"timestamp", record.timestamp}
    };
}

// GBK text from terminals is not valid UTF-8 and is rendered as hex instead
bool isValidUtf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t continuation = 0;
        if (lead < 0x80) {
            continuation = 0;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            continuation = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            continuation = 2;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            continuation = 3;
        } else {
            return false;
        }

        if (i + continuation >= text.size()) {
            return false;
        }
        for (size_t k = 1; k <= continuation; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
        }

        // Overlong three/four byte forms, surrogates and code points above U+10FFFF
        if (continuation >= 2) {
            const auto second = static_cast<unsigned char>(text[i + 1]);
            if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
                (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
                return false;
            }
        }

        i += continuation + 1;
    }
    return true;
}

} // namespace

ParsedMessage::ParsedMessage(const MessageHeader& header, const FieldMap& fields, const Bytes& rawBody)
    : success_(true)
    , header_(header)
    , fields_(fields)
    , rawBody_(rawBody)
{
}

ParsedMessage ParsedMessage::failure(ParseErrorCode code, const std::string& message, const Bytes& rawFrame) {
    ParsedMessage parsed;
    parsed.success_ = false;
    parsed.errorCode_ = code;
    parsed.errorMessage_ = message;
    parsed.rawFrame_ = rawFrame;
    return parsed;
}

std::vector<std::string> ParsedMessage::getFieldNames() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& [name, value] : fields_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

nlohmann::json ParsedMessage::toJson() const {
    nlohmann::json json;

    json["success"] = success_;

    if (!success_) {
        json["error"] = {
            {"code", errorToString(errorCode_)},
            {"message", errorMessage_}
        };
        return json;
    }

    json["header"] = headerToJson(header_);
    json["decoded"] = decoded_;

    // Fields in name order for stable output
    nlohmann::json fieldsJson = nlohmann::json::object();
    for (const auto& name : getFieldNames()) {
        fieldsJson[name] = fieldValueToJson(fields_.at(name));
    }
    json["fields"] = fieldsJson;
    json["rawBody"] = toHex(rawBody_);

    return json;
}

nlohmann::json fieldValueToJson(const FieldValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return toHex(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (!isValidUtf8(v)) {
                return toHex(Bytes(v.begin(), v.end()));
            }
            return v;
        } else if constexpr (std::is_same_v<T, LocationRecord>) {
            return locationToJson(v);
        } else if constexpr (std::is_same_v<T, LocationList>) {
            nlohmann::json records = nlohmann::json::array();
            for (const auto& record : v) {
                records.push_back(locationToJson(record));
            }
            return records;
        } else if constexpr (std::is_same_v<T, ParameterList>) {
            nlohmann::json parameters = nlohmann::json::array();
            for (const auto& parameter : v) {
                parameters.push_back({
                    {"id", parameter.id},
                    {"length", parameter.length},
                    {"value", toHex(parameter.value)}
                });
            }
            return parameters;
        } else {
            return v;
        }
    }, value);
}

nlohmann::json headerToJson(const MessageHeader& header) {
    nlohmann::json json = {
        {"messageId", messageIdToString(header.messageId)},
        {"bodyLength", header.bodyLength()},
        {"encryptionType", header.encryptionType()},
        {"fragmented", header.isFragmented()},
        {"protocolVersion", protocolVersionToString(header.protocolVersion)},
        {"deviceId", header.deviceId},
        {"sequenceNumber", header.sequenceNumber}
    };

    if (header.fragmentInfo) {
        json["fragmentInfo"] = {
            {"totalPackages", header.fragmentInfo->totalPackages},
            {"currentPackage", header.fragmentInfo->currentPackage}
        };
    }

    return json;
}

} // namespace jt808_codec
