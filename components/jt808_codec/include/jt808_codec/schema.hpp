#pragma once

#include "jt808_codec/types.hpp"
#include "jt808_codec/error.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jt808_codec {

// Field kinds. Each alternative carries only the modifiers valid for it.
struct Uint8Field {};
struct Uint16Field {};
struct Uint32Field {};

struct BcdField {
    size_t length = 0;          ///< Bytes on the wire (2 digits each)
};

struct StringField {
    size_t length = 0;          ///< Fixed byte count, unused when variableLength
    bool variableLength = false;
};

struct BytesField {
    size_t length = 0;
    bool variableLength = false;
};

struct LocationField {};

struct ArrayField {
    ArrayItemType itemType = ArrayItemType::LOCATION;
    bool countPrefixed = false; ///< Location arrays only: u16 count precedes the records
};

using FieldKind = std::variant<
    Uint8Field,
    Uint16Field,
    Uint32Field,
    BcdField,
    StringField,
    BytesField,
    LocationField,
    ArrayField
>;

/**
 * @brief Optional value constraints checked by the validator
 */
struct FieldConstraints {
    std::optional<int64_t> min;
    std::optional<int64_t> max;
    std::vector<int64_t> enumValues;
    std::optional<std::string> pattern;     ///< ECMAScript regular expression
};

/**
 * @brief Declaration of one body field
 */
struct FieldSchema {
    std::string name;
    FieldKind kind;
    bool optional = false;
    FieldConstraints constraints;
    std::string description;

    FieldType type() const;
    bool isVariableLength() const;

    // Fluent modifiers used by the schema table
    FieldSchema& withRange(int64_t minValue, int64_t maxValue);
    FieldSchema& withMin(int64_t minValue);
    FieldSchema& withMax(int64_t maxValue);
    FieldSchema& withEnum(std::vector<int64_t> values);
    FieldSchema& withPattern(const std::string& regex);
    FieldSchema& asOptional();
};

/**
 * @brief Field declaration helpers
 */
namespace field {
    FieldSchema uint8(const std::string& name, const std::string& description = "");
    FieldSchema uint16(const std::string& name, const std::string& description = "");
    FieldSchema uint32(const std::string& name, const std::string& description = "");
    FieldSchema bcd(const std::string& name, size_t length, const std::string& description = "");
    FieldSchema fixedString(const std::string& name, size_t length, const std::string& description = "");
    FieldSchema variableString(const std::string& name, const std::string& description = "");
    FieldSchema fixedBytes(const std::string& name, size_t length, const std::string& description = "");
    FieldSchema variableBytes(const std::string& name, const std::string& description = "");
    FieldSchema location(const std::string& name, const std::string& description = "");
    FieldSchema locationArray(const std::string& name, bool countPrefixed, const std::string& description = "");
    FieldSchema parameterArray(const std::string& name, const std::string& description = "");
}

/**
 * @brief Body layout of one message id
 */
struct MessageStructure {
    uint16_t messageId = 0;
    std::string name;
    Direction direction = Direction::UPLINK;
    std::vector<FieldSchema> fields;

    const FieldSchema* findField(const std::string& fieldName) const;

    /**
     * @brief Smallest body this layout can decode from
     */
    size_t minimumBodySize() const;
};

/**
 * @brief Read-only lookup from message id to body layout
 *
 * The table is checked once on construction; an inconsistent table throws
 * SchemaError. After that the registry is immutable and may be shared
 * between threads without locking.
 */
class SchemaRegistry {
public:
    /**
     * @brief Build a registry from an explicit table
     * @throws SchemaError on duplicate ids, duplicate field names, zero fixed
     *         lengths or variable-length fields that are not last
     */
    explicit SchemaRegistry(std::vector<MessageStructure> structures);

    /**
     * @brief Process-wide registry holding the built-in message table
     */
    static const SchemaRegistry& instance();

    const MessageStructure* lookup(uint16_t messageId) const;
    bool contains(uint16_t messageId) const { return lookup(messageId) != nullptr; }
    std::vector<uint16_t> messageIds() const;
    size_t size() const { return structures_.size(); }

private:
    std::map<uint16_t, MessageStructure> structures_;

    static void checkStructure(const MessageStructure& structure);
};

/**
 * @brief The built-in message table
 */
std::vector<MessageStructure> defaultMessageStructures();

/**
 * @brief "0x0200" style rendering used in diagnostics
 */
std::string messageIdToString(uint16_t messageId);

} // namespace jt808_codec
