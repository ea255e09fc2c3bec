#include "jt808_codec/validator.hpp"
#include <algorithm>
#include <limits>
#include <regex>
#include <sstream>
#include <type_traits>

namespace jt808_codec {

namespace {

using CheckResult = VoidResult<ValidationError>;

CheckResult violation(ValidationError code, const FieldSchema& schema, const std::string& detail) {
    return makeErrorResult<ValidationError>(code, "Field " + schema.name + ": " + detail, schema.name);
}

CheckResult checkWidth(const FieldSchema& schema, const FieldValue& value, uint64_t maxValue) {
    const auto* number = std::get_if<int64_t>(&value);
    if (!number) {
        return violation(ValidationError::TYPE_MISMATCH, schema, "Must be integer");
    }
    if (*number < 0 || static_cast<uint64_t>(*number) > maxValue) {
        return violation(ValidationError::RANGE_VIOLATION, schema,
                         "Must be integer between 0-" + std::to_string(maxValue));
    }
    return makeSuccessResult<ValidationError>();
}

// Embedded records obey the same limits as the flat 0x0200 fields
CheckResult checkLocationRecord(const FieldSchema& schema, const LocationRecord& record, const std::string& prefix) {
    const size_t timestampDigits = Constants::LOCATION_TIMESTAMP_BCD_LENGTH * 2;
    if (!isDecimalString(record.timestamp)) {
        return violation(ValidationError::TYPE_MISMATCH, schema,
                         prefix + "timestamp must be numeric string for BCD");
    }
    if (record.timestamp.size() != timestampDigits) {
        return violation(ValidationError::RANGE_VIOLATION, schema,
                         prefix + "timestamp length must be " + std::to_string(timestampDigits) + " digits");
    }
    if (record.direction > Constants::MAX_DIRECTION) {
        return violation(ValidationError::RANGE_VIOLATION, schema,
                         prefix + "direction must be <= " + std::to_string(Constants::MAX_DIRECTION));
    }
    return makeSuccessResult<ValidationError>();
}

std::string joinValues(const std::vector<int64_t>& values) {
    std::stringstream ss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << values[i];
    }
    return ss.str();
}

} // namespace

Validator::Validator(const Config& config, const SchemaRegistry& registry)
    : config_(config)
    , registry_(registry)
{
}

VoidResult<ValidationError> Validator::validate(uint16_t messageId, const FieldMap& data) const {
    const MessageStructure* structure = registry_.lookup(messageId);
    if (!structure) {
        return makeErrorResult<ValidationError>(
            ValidationError::UNKNOWN_MESSAGE_ID,
            "Unknown message ID: " + messageIdToString(messageId));
    }

    return validateFields(structure->fields, data);
}

VoidResult<ValidationError> Validator::validateFields(const std::vector<FieldSchema>& schemas,
                                                      const FieldMap& data) const {
    for (const auto& schema : schemas) {
        auto it = data.find(schema.name);
        if (it == data.end() || std::holds_alternative<std::monostate>(it->second)) {
            if (!schema.optional) {
                return makeErrorResult<ValidationError>(
                    ValidationError::MISSING_FIELD,
                    "Missing required field: " + schema.name,
                    schema.name);
            }
            continue;
        }

        auto result = validateField(schema, it->second);
        if (!result) {
            return result;
        }
    }

    if (config_.strictMode) {
        // Sorted so the reported field does not depend on hash order
        std::vector<std::string> names;
        for (const auto& entry : data) {
            names.push_back(entry.first);
        }
        std::sort(names.begin(), names.end());

        for (const auto& name : names) {
            auto declared = std::find_if(schemas.begin(), schemas.end(),
                                         [&name](const FieldSchema& s) { return s.name == name; });
            if (declared == schemas.end()) {
                return makeErrorResult<ValidationError>(
                    ValidationError::TYPE_MISMATCH,
                    "Unexpected field: " + name,
                    name);
            }
        }
    }

    return makeSuccessResult<ValidationError>();
}

VoidResult<ValidationError> Validator::validateField(const FieldSchema& schema, const FieldValue& value) {
    if (schema.optional && schema.isVariableLength() && isEmptyValue(value)) {
        return violation(ValidationError::RANGE_VIOLATION, schema, "Optional field must be omitted rather than empty");
    }

    auto typeResult = validateType(schema, value);
    if (!typeResult) {
        return typeResult;
    }
    return validateConstraints(schema, value);
}

VoidResult<ValidationError> Validator::validateType(const FieldSchema& schema, const FieldValue& value) {
    return std::visit([&](const auto& kind) -> CheckResult {
        using K = std::decay_t<decltype(kind)>;

        if constexpr (std::is_same_v<K, Uint8Field>) {
            return checkWidth(schema, value, std::numeric_limits<uint8_t>::max());
        } else if constexpr (std::is_same_v<K, Uint16Field>) {
            return checkWidth(schema, value, std::numeric_limits<uint16_t>::max());
        } else if constexpr (std::is_same_v<K, Uint32Field>) {
            return checkWidth(schema, value, std::numeric_limits<uint32_t>::max());
        } else if constexpr (std::is_same_v<K, BcdField>) {
            const auto* digits = std::get_if<std::string>(&value);
            if (!digits || !isDecimalString(*digits)) {
                return violation(ValidationError::TYPE_MISMATCH, schema, "Must be numeric string for BCD");
            }
            if (digits->size() != kind.length * 2) {
                return violation(ValidationError::RANGE_VIOLATION, schema,
                                 "BCD string length must be " + std::to_string(kind.length * 2) + " digits");
            }
            return makeSuccessResult<ValidationError>();
        } else if constexpr (std::is_same_v<K, StringField>) {
            const auto* text = std::get_if<std::string>(&value);
            if (!text) {
                return violation(ValidationError::TYPE_MISMATCH, schema, "Must be string");
            }
            if (!kind.variableLength && text->size() > kind.length) {
                return violation(ValidationError::RANGE_VIOLATION, schema,
                                 "String too long, max length: " + std::to_string(kind.length));
            }
            return makeSuccessResult<ValidationError>();
        } else if constexpr (std::is_same_v<K, BytesField>) {
            const auto* raw = std::get_if<Bytes>(&value);
            if (!raw) {
                return violation(ValidationError::TYPE_MISMATCH, schema, "Must be byte array");
            }
            if (!kind.variableLength && raw->size() > kind.length) {
                return violation(ValidationError::RANGE_VIOLATION, schema,
                                 "Too many bytes, max length: " + std::to_string(kind.length));
            }
            return makeSuccessResult<ValidationError>();
        } else if constexpr (std::is_same_v<K, LocationField>) {
            const auto* record = std::get_if<LocationRecord>(&value);
            if (!record) {
                return violation(ValidationError::TYPE_MISMATCH, schema, "Must be location record");
            }
            return checkLocationRecord(schema, *record, "");
        } else {
            if (kind.itemType == ArrayItemType::LOCATION) {
                const auto* records = std::get_if<LocationList>(&value);
                if (!records) {
                    return violation(ValidationError::TYPE_MISMATCH, schema, "Must be array of location records");
                }
                if (kind.countPrefixed) {
                    if (records->size() > std::numeric_limits<uint16_t>::max()) {
                        return violation(ValidationError::RANGE_VIOLATION, schema, "Too many location records");
                    }
                } else if (records->size() != 1) {
                    // Without an inline count the wire layout holds exactly one record
                    return violation(ValidationError::RANGE_VIOLATION, schema,
                                     "Must hold exactly one location record, got " + std::to_string(records->size()));
                }
                for (size_t i = 0; i < records->size(); ++i) {
                    auto recordResult = checkLocationRecord(schema, (*records)[i], "record " + std::to_string(i) + " ");
                    if (!recordResult) {
                        return recordResult;
                    }
                }
                return makeSuccessResult<ValidationError>();
            }

            const auto* parameters = std::get_if<ParameterList>(&value);
            if (!parameters) {
                return violation(ValidationError::TYPE_MISMATCH, schema, "Must be array of parameters");
            }
            for (const auto& parameter : *parameters) {
                if (static_cast<size_t>(parameter.length) != parameter.value.size()) {
                    return violation(ValidationError::RANGE_VIOLATION, schema,
                                     "Parameter " + std::to_string(parameter.id) + " length " +
                                     std::to_string(parameter.length) + " does not match value size " +
                                     std::to_string(parameter.value.size()));
                }
            }
            return makeSuccessResult<ValidationError>();
        }
    }, schema.kind);
}

VoidResult<ValidationError> Validator::validateConstraints(const FieldSchema& schema, const FieldValue& value) {
    const FieldConstraints& constraints = schema.constraints;

    if (const auto* number = std::get_if<int64_t>(&value)) {
        if (constraints.min && *number < *constraints.min) {
            return violation(ValidationError::RANGE_VIOLATION, schema,
                             "Value must be >= " + std::to_string(*constraints.min));
        }
        if (constraints.max && *number > *constraints.max) {
            return violation(ValidationError::RANGE_VIOLATION, schema,
                             "Value must be <= " + std::to_string(*constraints.max));
        }
        if (!constraints.enumValues.empty() &&
            std::find(constraints.enumValues.begin(), constraints.enumValues.end(), *number) ==
                constraints.enumValues.end()) {
            return violation(ValidationError::ENUM_VIOLATION, schema,
                             "Value must be one of: " + joinValues(constraints.enumValues));
        }
    }

    if (const auto* text = std::get_if<std::string>(&value)) {
        if (constraints.pattern) {
            try {
                if (!std::regex_search(*text, std::regex(*constraints.pattern))) {
                    return violation(ValidationError::PATTERN_VIOLATION, schema,
                                     "Value does not match required pattern");
                }
            } catch (const std::regex_error& e) {
                return violation(ValidationError::PATTERN_VIOLATION, schema,
                                 "Invalid pattern '" + *constraints.pattern + "': " + e.what());
            }
        }
    }

    return makeSuccessResult<ValidationError>();
}

} // namespace jt808_codec
