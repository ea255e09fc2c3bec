#include "jt808_codec/serializer.hpp"
#include <algorithm>
#include <limits>
#include <type_traits>

namespace jt808_codec {

namespace {

using DecodeResult = Result<FieldValue, DecodeError>;
using EncodeResult = VoidResult<EncodeError>;

DecodeResult truncated(const FieldSchema& schema, size_t needed, const ByteReader& reader) {
    return DecodeResult::error(
        DecodeError::TRUNCATED,
        "Truncated field '" + schema.name + "': need " + std::to_string(needed) +
        " bytes at offset " + std::to_string(reader.offset()) +
        ", " + std::to_string(reader.remaining()) + " remaining",
        schema.name);
}

EncodeResult typeMismatch(const FieldSchema& schema) {
    return makeErrorResult<EncodeError>(
        EncodeError::TYPE_MISMATCH,
        "Field '" + schema.name + "' expects a " + fieldTypeToString(schema.type()) + " value",
        schema.name);
}

EncodeResult outOfRange(const FieldSchema& schema, const std::string& detail) {
    return makeErrorResult<EncodeError>(
        EncodeError::VALUE_OUT_OF_RANGE,
        "Field '" + schema.name + "' out of range: " + detail,
        schema.name);
}

// Checks that an integer fits [0, maxValue] before it is narrowed onto the wire
bool fitsWidth(int64_t value, uint64_t maxValue) {
    return value >= 0 && static_cast<uint64_t>(value) <= maxValue;
}

} // namespace

Serializer::Serializer(const SchemaRegistry& registry) : registry_(registry) {
}

Result<FieldMap, DecodeError> Serializer::decode(uint16_t messageId, const Bytes& body) const {
    const MessageStructure* structure = registry_.lookup(messageId);
    if (!structure) {
        return Result<FieldMap, DecodeError>::error(
            DecodeError::UNKNOWN_MESSAGE_ID,
            "Unknown message ID: " + messageIdToString(messageId));
    }

    ByteReader reader(body);
    return decodeFields(structure->fields, reader);
}

Result<Bytes, EncodeError> Serializer::encode(uint16_t messageId, const FieldMap& fields) const {
    const MessageStructure* structure = registry_.lookup(messageId);
    if (!structure) {
        return Result<Bytes, EncodeError>::error(
            EncodeError::UNKNOWN_MESSAGE_ID,
            "Unknown message ID: " + messageIdToString(messageId));
    }

    ByteWriter writer;
    auto result = encodeFields(structure->fields, fields, writer);
    if (!result) {
        return Result<Bytes, EncodeError>::error(result.errorCode, result.errorMessage, result.field);
    }

    return Result<Bytes, EncodeError>::ok(writer.release());
}

Result<FieldMap, DecodeError> Serializer::decodeFields(const std::vector<FieldSchema>& schemas, ByteReader& reader) {
    FieldMap fields;

    for (const auto& schema : schemas) {
        // Trailing optional fields may be absent from the body altogether
        if (schema.optional && reader.remaining() == 0) {
            continue;
        }

        auto decoded = decodeField(schema, reader);
        if (!decoded) {
            return Result<FieldMap, DecodeError>::error(decoded.errorCode, decoded.errorMessage, decoded.field);
        }
        fields[schema.name] = std::move(decoded.value);
    }

    return Result<FieldMap, DecodeError>::ok(std::move(fields));
}

VoidResult<EncodeError> Serializer::encodeFields(const std::vector<FieldSchema>& schemas,
                                                 const FieldMap& fields,
                                                 ByteWriter& writer) {
    for (const auto& schema : schemas) {
        auto it = fields.find(schema.name);
        bool absent = it == fields.end() || std::holds_alternative<std::monostate>(it->second);

        // Decode cannot tell an empty trailing value from a missing one
        if (!absent && schema.optional && schema.isVariableLength() && isEmptyValue(it->second)) {
            absent = true;
        }

        if (absent) {
            if (schema.optional) {
                continue;
            }
            return makeErrorResult<EncodeError>(
                EncodeError::MISSING_FIELD,
                "Missing required field: " + schema.name,
                schema.name);
        }

        auto result = encodeField(schema, it->second, writer);
        if (!result) {
            return result;
        }
    }

    return makeSuccessResult<EncodeError>();
}

Result<FieldValue, DecodeError> Serializer::decodeField(const FieldSchema& schema, ByteReader& reader) {
    return std::visit([&](const auto& kind) -> DecodeResult {
        using K = std::decay_t<decltype(kind)>;

        if constexpr (std::is_same_v<K, Uint8Field>) {
            uint8_t value = 0;
            if (!reader.readUint8(value)) {
                return truncated(schema, 1, reader);
            }
            return DecodeResult::ok(FieldValue(static_cast<int64_t>(value)));
        } else if constexpr (std::is_same_v<K, Uint16Field>) {
            uint16_t value = 0;
            if (!reader.readUint16(value)) {
                return truncated(schema, 2, reader);
            }
            return DecodeResult::ok(FieldValue(static_cast<int64_t>(value)));
        } else if constexpr (std::is_same_v<K, Uint32Field>) {
            uint32_t value = 0;
            if (!reader.readUint32(value)) {
                return truncated(schema, 4, reader);
            }
            return DecodeResult::ok(FieldValue(static_cast<int64_t>(value)));
        } else if constexpr (std::is_same_v<K, BcdField>) {
            std::string digits;
            if (!reader.readBcd(kind.length, digits)) {
                return truncated(schema, kind.length, reader);
            }
            return DecodeResult::ok(FieldValue(std::move(digits)));
        } else if constexpr (std::is_same_v<K, StringField>) {
            const size_t length = kind.variableLength ? reader.remaining() : kind.length;
            std::string text;
            if (!reader.readAscii(length, text)) {
                return truncated(schema, length, reader);
            }
            return DecodeResult::ok(FieldValue(std::move(text)));
        } else if constexpr (std::is_same_v<K, BytesField>) {
            const size_t length = kind.variableLength ? reader.remaining() : kind.length;
            Bytes raw;
            if (!reader.readBytes(length, raw)) {
                return truncated(schema, length, reader);
            }
            return DecodeResult::ok(FieldValue(std::move(raw)));
        } else if constexpr (std::is_same_v<K, LocationField>) {
            LocationRecord record;
            if (!readLocation(reader, record)) {
                return truncated(schema, Constants::LOCATION_RECORD_SIZE, reader);
            }
            return DecodeResult::ok(FieldValue(std::move(record)));
        } else {
            switch (kind.itemType) {
                case ArrayItemType::LOCATION: {
                    uint16_t count = 1;
                    if (kind.countPrefixed && !reader.readUint16(count)) {
                        return truncated(schema, 2, reader);
                    }

                    LocationList records;
                    records.reserve(count);
                    for (uint16_t i = 0; i < count; ++i) {
                        LocationRecord record;
                        if (!readLocation(reader, record)) {
                            return truncated(schema, Constants::LOCATION_RECORD_SIZE, reader);
                        }
                        records.push_back(std::move(record));
                    }
                    return DecodeResult::ok(FieldValue(std::move(records)));
                }

                case ArrayItemType::PARAMETER: {
                    ParameterList parameters;
                    while (reader.remaining() >= Constants::MIN_PARAMETER_RECORD_SIZE) {
                        ParameterRecord parameter;
                        if (!reader.readUint32(parameter.id) ||
                            !reader.readUint8(parameter.length) ||
                            !reader.readBytes(parameter.length, parameter.value)) {
                            return truncated(schema, parameter.length, reader);
                        }
                        parameters.push_back(std::move(parameter));
                    }
                    return DecodeResult::ok(FieldValue(std::move(parameters)));
                }

                default:
                    return DecodeResult::error(
                        DecodeError::UNSUPPORTED_TYPE,
                        "Unsupported array item type in field '" + schema.name + "'",
                        schema.name);
            }
        }
    }, schema.kind);
}

VoidResult<EncodeError> Serializer::encodeField(const FieldSchema& schema, const FieldValue& value, ByteWriter& writer) {
    return std::visit([&](const auto& kind) -> EncodeResult {
        using K = std::decay_t<decltype(kind)>;

        if constexpr (std::is_same_v<K, Uint8Field> ||
                      std::is_same_v<K, Uint16Field> ||
                      std::is_same_v<K, Uint32Field>) {
            const auto* number = std::get_if<int64_t>(&value);
            if (!number) {
                return typeMismatch(schema);
            }

            if constexpr (std::is_same_v<K, Uint8Field>) {
                if (!fitsWidth(*number, std::numeric_limits<uint8_t>::max())) {
                    return outOfRange(schema, std::to_string(*number) + " does not fit uint8");
                }
                writer.writeUint8(static_cast<uint8_t>(*number));
            } else if constexpr (std::is_same_v<K, Uint16Field>) {
                if (!fitsWidth(*number, std::numeric_limits<uint16_t>::max())) {
                    return outOfRange(schema, std::to_string(*number) + " does not fit uint16");
                }
                writer.writeUint16(static_cast<uint16_t>(*number));
            } else {
                if (!fitsWidth(*number, std::numeric_limits<uint32_t>::max())) {
                    return outOfRange(schema, std::to_string(*number) + " does not fit uint32");
                }
                writer.writeUint32(static_cast<uint32_t>(*number));
            }
            return makeSuccessResult<EncodeError>();
        } else if constexpr (std::is_same_v<K, BcdField>) {
            const auto* digits = std::get_if<std::string>(&value);
            if (!digits) {
                return typeMismatch(schema);
            }
            writer.writeBcd(*digits, kind.length);
            return makeSuccessResult<EncodeError>();
        } else if constexpr (std::is_same_v<K, StringField>) {
            const auto* text = std::get_if<std::string>(&value);
            if (!text) {
                return typeMismatch(schema);
            }
            if (kind.variableLength) {
                writer.writeAscii(*text);
            } else {
                writer.writeFixedAscii(*text, kind.length);
            }
            return makeSuccessResult<EncodeError>();
        } else if constexpr (std::is_same_v<K, BytesField>) {
            const auto* raw = std::get_if<Bytes>(&value);
            if (!raw) {
                return typeMismatch(schema);
            }
            if (kind.variableLength) {
                writer.writeBytes(*raw);
            } else {
                Bytes fixed(raw->begin(), raw->begin() + static_cast<std::ptrdiff_t>(std::min(raw->size(), kind.length)));
                fixed.resize(kind.length, 0x00);
                writer.writeBytes(fixed);
            }
            return makeSuccessResult<EncodeError>();
        } else if constexpr (std::is_same_v<K, LocationField>) {
            const auto* record = std::get_if<LocationRecord>(&value);
            if (!record) {
                return typeMismatch(schema);
            }
            writeLocation(*record, writer);
            return makeSuccessResult<EncodeError>();
        } else {
            if (kind.itemType == ArrayItemType::LOCATION) {
                const auto* records = std::get_if<LocationList>(&value);
                if (!records) {
                    return typeMismatch(schema);
                }
                if (kind.countPrefixed) {
                    if (records->size() > std::numeric_limits<uint16_t>::max()) {
                        return outOfRange(schema, std::to_string(records->size()) + " records exceed the u16 count");
                    }
                    writer.writeUint16(static_cast<uint16_t>(records->size()));
                }
                for (const auto& record : *records) {
                    writeLocation(record, writer);
                }
                return makeSuccessResult<EncodeError>();
            }

            const auto* parameters = std::get_if<ParameterList>(&value);
            if (!parameters) {
                return typeMismatch(schema);
            }
            for (const auto& parameter : *parameters) {
                if (static_cast<size_t>(parameter.length) != parameter.value.size()) {
                    return outOfRange(schema, "parameter " + std::to_string(parameter.id) +
                                      " declares length " + std::to_string(parameter.length) +
                                      " but carries " + std::to_string(parameter.value.size()) + " bytes");
                }
                writer.writeUint32(parameter.id);
                writer.writeUint8(parameter.length);
                writer.writeBytes(parameter.value);
            }
            return makeSuccessResult<EncodeError>();
        }
    }, schema.kind);
}

bool Serializer::readLocation(ByteReader& reader, LocationRecord& record) {
    // Check the whole record up front so a short buffer leaves the cursor untouched
    if (reader.remaining() < Constants::LOCATION_RECORD_SIZE) {
        return false;
    }

    return reader.readUint32(record.alarmFlag) &&
           reader.readUint32(record.statusFlag) &&
           reader.readUint32(record.latitude) &&
           reader.readUint32(record.longitude) &&
           reader.readUint16(record.altitude) &&
           reader.readUint16(record.speed) &&
           reader.readUint16(record.direction) &&
           reader.readBcd(Constants::LOCATION_TIMESTAMP_BCD_LENGTH, record.timestamp);
}

void Serializer::writeLocation(const LocationRecord& record, ByteWriter& writer) {
    writer.writeUint32(record.alarmFlag);
    writer.writeUint32(record.statusFlag);
    writer.writeUint32(record.latitude);
    writer.writeUint32(record.longitude);
    writer.writeUint16(record.altitude);
    writer.writeUint16(record.speed);
    writer.writeUint16(record.direction);
    writer.writeBcd(record.timestamp, Constants::LOCATION_TIMESTAMP_BCD_LENGTH);
}

} // namespace jt808_codec
