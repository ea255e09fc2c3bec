#include "jt808_codec/schema.hpp"
#include "jt808_codec/protocol.hpp"
#include <iomanip>
#include <set>
#include <sstream>
#include <type_traits>

namespace jt808_codec {

FieldType FieldSchema::type() const {
    return std::visit([](const auto& kind) -> FieldType {
        using K = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<K, Uint8Field>) {
            return FieldType::UINT8;
        } else if constexpr (std::is_same_v<K, Uint16Field>) {
            return FieldType::UINT16;
        } else if constexpr (std::is_same_v<K, Uint32Field>) {
            return FieldType::UINT32;
        } else if constexpr (std::is_same_v<K, BcdField>) {
            return FieldType::BCD;
        } else if constexpr (std::is_same_v<K, StringField>) {
            return FieldType::STRING;
        } else if constexpr (std::is_same_v<K, BytesField>) {
            return FieldType::BYTES;
        } else if constexpr (std::is_same_v<K, LocationField>) {
            return FieldType::LOCATION;
        } else {
            static_assert(std::is_same_v<K, ArrayField>, "unhandled field kind");
            return FieldType::ARRAY;
        }
    }, kind);
}

bool FieldSchema::isVariableLength() const {
    if (const auto* str = std::get_if<StringField>(&kind)) {
        return str->variableLength;
    }
    if (const auto* bytes = std::get_if<BytesField>(&kind)) {
        return bytes->variableLength;
    }
    if (const auto* array = std::get_if<ArrayField>(&kind)) {
        return array->itemType == ArrayItemType::PARAMETER;
    }
    return false;
}

FieldSchema& FieldSchema::withRange(int64_t minValue, int64_t maxValue) {
    constraints.min = minValue;
    constraints.max = maxValue;
    return *this;
}

FieldSchema& FieldSchema::withMin(int64_t minValue) {
    constraints.min = minValue;
    return *this;
}

FieldSchema& FieldSchema::withMax(int64_t maxValue) {
    constraints.max = maxValue;
    return *this;
}

FieldSchema& FieldSchema::withEnum(std::vector<int64_t> values) {
    constraints.enumValues = std::move(values);
    return *this;
}

FieldSchema& FieldSchema::withPattern(const std::string& regex) {
    constraints.pattern = regex;
    return *this;
}

FieldSchema& FieldSchema::asOptional() {
    optional = true;
    return *this;
}

namespace field {

namespace {
FieldSchema make(const std::string& name, FieldKind kind, const std::string& description) {
    FieldSchema schema;
    schema.name = name;
    schema.kind = std::move(kind);
    schema.description = description;
    return schema;
}
} // namespace

FieldSchema uint8(const std::string& name, const std::string& description) {
    return make(name, Uint8Field{}, description);
}

FieldSchema uint16(const std::string& name, const std::string& description) {
    return make(name, Uint16Field{}, description);
}

FieldSchema uint32(const std::string& name, const std::string& description) {
    return make(name, Uint32Field{}, description);
}

FieldSchema bcd(const std::string& name, size_t length, const std::string& description) {
    return make(name, BcdField{length}, description);
}

FieldSchema fixedString(const std::string& name, size_t length, const std::string& description) {
    return make(name, StringField{length, false}, description);
}

FieldSchema variableString(const std::string& name, const std::string& description) {
    return make(name, StringField{0, true}, description);
}

FieldSchema fixedBytes(const std::string& name, size_t length, const std::string& description) {
    return make(name, BytesField{length, false}, description);
}

FieldSchema variableBytes(const std::string& name, const std::string& description) {
    return make(name, BytesField{0, true}, description);
}

FieldSchema location(const std::string& name, const std::string& description) {
    return make(name, LocationField{}, description);
}

FieldSchema locationArray(const std::string& name, bool countPrefixed, const std::string& description) {
    return make(name, ArrayField{ArrayItemType::LOCATION, countPrefixed}, description);
}

FieldSchema parameterArray(const std::string& name, const std::string& description) {
    return make(name, ArrayField{ArrayItemType::PARAMETER, false}, description);
}

} // namespace field

const FieldSchema* MessageStructure::findField(const std::string& fieldName) const {
    for (const auto& f : fields) {
        if (f.name == fieldName) {
            return &f;
        }
    }
    return nullptr;
}

size_t MessageStructure::minimumBodySize() const {
    size_t total = 0;
    for (const auto& f : fields) {
        if (f.optional) {
            continue;
        }
        total += std::visit([](const auto& kind) -> size_t {
            using K = std::decay_t<decltype(kind)>;
            if constexpr (std::is_same_v<K, Uint8Field>) {
                return 1;
            } else if constexpr (std::is_same_v<K, Uint16Field>) {
                return 2;
            } else if constexpr (std::is_same_v<K, Uint32Field>) {
                return 4;
            } else if constexpr (std::is_same_v<K, BcdField>) {
                return kind.length;
            } else if constexpr (std::is_same_v<K, StringField> || std::is_same_v<K, BytesField>) {
                return kind.variableLength ? 0 : kind.length;
            } else if constexpr (std::is_same_v<K, LocationField>) {
                return Constants::LOCATION_RECORD_SIZE;
            } else {
                if (kind.itemType == ArrayItemType::PARAMETER) {
                    return 0;
                }
                return kind.countPrefixed ? 2 : Constants::LOCATION_RECORD_SIZE;
            }
        }, f.kind);
    }
    return total;
}

SchemaRegistry::SchemaRegistry(std::vector<MessageStructure> structures) {
    for (auto& structure : structures) {
        checkStructure(structure);
        const uint16_t id = structure.messageId;
        if (!structures_.emplace(id, std::move(structure)).second) {
            throw SchemaError("duplicate message id " + messageIdToString(id));
        }
    }
}

const SchemaRegistry& SchemaRegistry::instance() {
    static const SchemaRegistry registry(defaultMessageStructures());
    return registry;
}

const MessageStructure* SchemaRegistry::lookup(uint16_t messageId) const {
    auto it = structures_.find(messageId);
    if (it == structures_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<uint16_t> SchemaRegistry::messageIds() const {
    std::vector<uint16_t> ids;
    ids.reserve(structures_.size());
    for (const auto& [id, structure] : structures_) {
        ids.push_back(id);
    }
    return ids;
}

void SchemaRegistry::checkStructure(const MessageStructure& structure) {
    const std::string where = messageIdToString(structure.messageId);
    std::set<std::string> names;

    for (size_t i = 0; i < structure.fields.size(); ++i) {
        const FieldSchema& f = structure.fields[i];

        if (f.name.empty()) {
            throw SchemaError(where + ": field " + std::to_string(i) + " has no name");
        }
        if (!names.insert(f.name).second) {
            throw SchemaError(where + ": duplicate field '" + f.name + "'");
        }

        if (const auto* bcd = std::get_if<BcdField>(&f.kind)) {
            if (bcd->length == 0) {
                throw SchemaError(where + ": bcd field '" + f.name + "' needs a length");
            }
        }
        if (const auto* str = std::get_if<StringField>(&f.kind)) {
            if (!str->variableLength && str->length == 0) {
                throw SchemaError(where + ": string field '" + f.name + "' needs a length or the variable flag");
            }
        }
        if (const auto* bytes = std::get_if<BytesField>(&f.kind)) {
            if (!bytes->variableLength && bytes->length == 0) {
                throw SchemaError(where + ": bytes field '" + f.name + "' needs a length or the variable flag");
            }
        }
        if (const auto* array = std::get_if<ArrayField>(&f.kind)) {
            if (array->itemType == ArrayItemType::PARAMETER && array->countPrefixed) {
                throw SchemaError(where + ": parameter array '" + f.name + "' cannot be count prefixed");
            }
        }

        if (f.isVariableLength() && i + 1 != structure.fields.size()) {
            throw SchemaError(where + ": variable-length field '" + f.name + "' must be the last field");
        }
    }
}

std::vector<MessageStructure> defaultMessageStructures() {
    namespace id = protocol::message_id;
    std::vector<MessageStructure> table;

    table.push_back({id::TERMINAL_GENERAL_RESPONSE, "Terminal General Response", Direction::UPLINK, {
        field::uint16("sequenceNumber", "Sequence number of the platform message"),
        field::uint16("messageId", "Id of the platform message"),
        field::uint8("result", "0=success, 1=failure, 2=message error, 3=not supported, 4=alarm ack")
            .withEnum({0, 1, 2, 3, 4}),
    }});

    table.push_back({id::TERMINAL_HEARTBEAT, "Terminal Heartbeat", Direction::UPLINK, {}});

    table.push_back({id::TERMINAL_UNREGISTER, "Terminal Unregister", Direction::UPLINK, {}});

    table.push_back({id::TERMINAL_REGISTRATION, "Terminal Registration", Direction::UPLINK, {
        field::uint16("provinceId", "Province ID"),
        field::uint16("cityId", "City ID"),
        field::fixedString("manufacturerId", 5, "Manufacturer ID"),
        field::fixedString("deviceModel", 8, "Device model"),
        field::fixedString("deviceId", 7, "Device ID"),
        field::uint8("plateColor", "Plate color"),
        field::variableString("plateNumber", "Plate number"),
    }});

    table.push_back({id::TERMINAL_AUTH, "Terminal Authentication", Direction::UPLINK, {
        field::variableString("authCode", "Authentication code from the registration response"),
    }});

    table.push_back({id::LOCATION_REPORT, "Location Information Report", Direction::UPLINK, {
        field::uint32("alarmFlag", "Alarm flag"),
        field::uint32("statusFlag", "Status flag"),
        field::uint32("latitude", "Latitude (degrees * 10^6)"),
        field::uint32("longitude", "Longitude (degrees * 10^6)"),
        field::uint16("altitude", "Altitude (meters)"),
        field::uint16("speed", "Speed (0.1 km/h)"),
        field::uint16("direction", "Direction (0-359 degrees)").withMax(Constants::MAX_DIRECTION),
        field::bcd("timestamp", 6, "Time (YYMMDDHHMMSS)"),
        field::variableBytes("additionalInfo", "Additional information items").asOptional(),
    }});

    table.push_back({id::LOCATION_BATCH_REPORT, "Location Batch Report", Direction::UPLINK, {
        field::uint8("dataType", "0=normal, 1=blind area supplement").withEnum({0, 1}),
        field::uint16("itemCount", "Number of location items"),
        field::locationArray("locationItems", false, "Location data"),
    }});

    table.push_back({id::MULTIMEDIA_EVENT_UPLOAD, "Multimedia Event Upload", Direction::UPLINK, {
        field::uint32("multimediaId", "Multimedia ID"),
        field::uint8("multimediaType", "0=image, 1=audio, 2=video").withEnum({0, 1, 2}),
        field::uint8("multimediaFormat", "Multimedia format"),
        field::uint8("eventCode", "Event code"),
        field::uint8("channelId", "Channel ID"),
        field::location("locationInfo", "Location at capture time"),
        field::variableBytes("multimediaData", "Multimedia data").asOptional(),
    }});

    table.push_back({id::PLATFORM_GENERAL_RESPONSE, "Platform General Response", Direction::DOWNLINK, {
        field::uint16("sequenceNumber", "Sequence number of the terminal message"),
        field::uint16("messageId", "Id of the terminal message"),
        field::uint8("result", "0=success, 1=failure, 2=message error, 3=not supported, 4=alarm ack")
            .withEnum({0, 1, 2, 3, 4}),
    }});

    table.push_back({id::TERMINAL_REGISTRATION_RESPONSE, "Terminal Registration Response", Direction::DOWNLINK, {
        field::uint16("sequenceNumber", "Sequence number of the registration message"),
        field::uint8("result", "0=success, 1=vehicle registered, 2=no vehicle, 3=terminal registered, 4=no terminal")
            .withEnum({0, 1, 2, 3, 4}),
        field::variableString("authCode", "Authentication code (only if result=0)").asOptional(),
    }});

    table.push_back({id::SET_TERMINAL_PARAMETERS, "Set Terminal Parameters", Direction::DOWNLINK, {
        field::uint8("parameterCount", "Number of parameters"),
        field::parameterArray("parameters", "Parameter list"),
    }});

    table.push_back({id::QUERY_TERMINAL_PARAMETERS, "Query Terminal Parameters", Direction::DOWNLINK, {}});

    table.push_back({id::TERMINAL_CONTROL, "Terminal Control", Direction::DOWNLINK, {
        field::uint8("commandFlag", "Command flag"),
        field::variableString("commandParameter", "Command parameter").asOptional(),
    }});

    table.push_back({id::CAMERA_SHOT_COMMAND, "Camera Shot Command", Direction::DOWNLINK, {
        field::uint8("channelId", "Channel ID"),
        field::uint16("shotCommand", "0=stop, 0xFFFF=record video, otherwise photo count"),
        field::uint16("shotInterval", "Shot interval (seconds)"),
        field::uint16("shotCount", "Shot count"),
        field::uint8("saveFlag", "1=save, 0=upload").withEnum({0, 1}),
        field::uint8("resolution", "Resolution"),
        field::uint8("quality", "Image quality (1-10)").withRange(1, 10),
        field::uint8("brightness", "Brightness (0-255)"),
        field::uint8("contrast", "Contrast (0-127)").withMax(127),
        field::uint8("saturation", "Saturation (0-127)").withMax(127),
        field::uint8("chroma", "Chroma (0-255)"),
    }});

    return table;
}

std::string messageIdToString(uint16_t messageId) {
    std::stringstream ss;
    ss << "0x" << std::hex << std::setw(4) << std::setfill('0') << messageId;
    return ss.str();
}

} // namespace jt808_codec
