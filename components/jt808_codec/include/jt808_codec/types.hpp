#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace jt808_codec {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Protocol revisions of the JT/T 808 family
 *
 * The envelope carries no explicit version for 2011/2013 terminals, so the
 * value attached to a parsed header is a best-effort guess.
 */
enum class ProtocolVersion : uint8_t {
    V2011 = 0,
    V2013 = 1,
    V2019 = 2
};

/**
 * @brief Direction of a message relative to the platform
 */
enum class Direction : uint8_t {
    UPLINK = 0,     ///< Terminal -> platform
    DOWNLINK = 1    ///< Platform -> terminal
};

/**
 * @brief Field data types supported by the schema table
 */
enum class FieldType : uint8_t {
    UINT8 = 0,
    UINT16 = 1,
    UINT32 = 2,
    BCD = 3,
    STRING = 4,
    BYTES = 5,
    LOCATION = 6,
    ARRAY = 7
};

/**
 * @brief Element kinds of array fields
 */
enum class ArrayItemType : uint8_t {
    LOCATION = 0,
    PARAMETER = 1
};

/**
 * @brief Fixed-layout position record (28 bytes on the wire)
 */
struct LocationRecord {
    uint32_t alarmFlag = 0;
    uint32_t statusFlag = 0;
    uint32_t latitude = 0;      ///< Degrees * 10^6
    uint32_t longitude = 0;     ///< Degrees * 10^6
    uint16_t altitude = 0;      ///< Meters
    uint16_t speed = 0;         ///< 0.1 km/h
    uint16_t direction = 0;     ///< Degrees, 0-359
    std::string timestamp = "000000000000";  ///< YYMMDDHHMMSS

    double latitudeDegrees() const { return static_cast<double>(latitude) / 1000000.0; }
    double longitudeDegrees() const { return static_cast<double>(longitude) / 1000000.0; }
    double speedKmh() const { return static_cast<double>(speed) / 10.0; }

    bool hasAlarm(uint32_t mask) const { return (alarmFlag & mask) != 0; }
    bool hasStatus(uint32_t mask) const { return (statusFlag & mask) != 0; }

    bool operator==(const LocationRecord& other) const {
        return alarmFlag == other.alarmFlag &&
               statusFlag == other.statusFlag &&
               latitude == other.latitude &&
               longitude == other.longitude &&
               altitude == other.altitude &&
               speed == other.speed &&
               direction == other.direction &&
               timestamp == other.timestamp;
    }

    bool operator!=(const LocationRecord& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Terminal parameter entry {id, length, value}
 */
struct ParameterRecord {
    uint32_t id = 0;
    uint8_t length = 0;
    Bytes value;

    ParameterRecord() = default;
    ParameterRecord(uint32_t paramId, const Bytes& paramValue)
        : id(paramId), length(static_cast<uint8_t>(paramValue.size())), value(paramValue) {}

    bool operator==(const ParameterRecord& other) const {
        return id == other.id && length == other.length && value == other.value;
    }

    bool operator!=(const ParameterRecord& other) const {
        return !(*this == other);
    }
};

using LocationList = std::vector<LocationRecord>;
using ParameterList = std::vector<ParameterRecord>;

/**
 * @brief Decoded value of a single body field
 *
 * Scalars are carried as int64_t regardless of their wire width so that
 * out-of-range values built by callers can be reported instead of wrapping.
 */
using FieldValue = std::variant<
    std::monostate,
    int64_t,
    std::string,
    Bytes,
    LocationRecord,
    LocationList,
    ParameterList
>;

using FieldMap = std::unordered_map<std::string, FieldValue>;

/**
 * @brief Protocol constants
 */
namespace Constants {
    constexpr uint8_t FRAME_DELIMITER = 0x7E;
    constexpr size_t MIN_FRAME_SIZE = 3;
    constexpr size_t CHECKSUM_SIZE = 1;

    constexpr size_t BASE_HEADER_SIZE = 12;
    constexpr size_t FRAGMENT_INFO_SIZE = 4;
    constexpr size_t DEVICE_ID_BCD_LENGTH = 6;

    constexpr size_t LOCATION_RECORD_SIZE = 28;
    constexpr size_t LOCATION_TIMESTAMP_BCD_LENGTH = 6;
    constexpr uint16_t MAX_DIRECTION = 359;
    constexpr size_t MIN_PARAMETER_RECORD_SIZE = 5;

    constexpr uint16_t BODY_LENGTH_MASK = 0x03FF;
    constexpr uint16_t ENCRYPTION_SHIFT = 10;
    constexpr uint16_t ENCRYPTION_MASK = 0x07;
    constexpr uint16_t FRAGMENT_SHIFT = 13;
    constexpr uint16_t RESERVED_SHIFT = 14;
    constexpr uint16_t RESERVED_MASK = 0x03;

    constexpr size_t DEFAULT_MAX_FRAME_SIZE = 4096;
}

/**
 * @brief Convert ProtocolVersion to string representation
 * @param version ProtocolVersion to convert
 * @return Publication year of the revision
 */
inline const char* protocolVersionToString(ProtocolVersion version) {
    switch (version) {
        case ProtocolVersion::V2011: return "2011";
        case ProtocolVersion::V2013: return "2013";
        case ProtocolVersion::V2019: return "2019";
        default: return "INVALID";
    }
}

inline const char* directionToString(Direction direction) {
    switch (direction) {
        case Direction::UPLINK: return "UPLINK";
        case Direction::DOWNLINK: return "DOWNLINK";
        default: return "INVALID";
    }
}

/**
 * @brief Convert FieldType to string representation
 * @param type FieldType to convert
 * @return Lower-case type name as used in diagnostics
 */
inline const char* fieldTypeToString(FieldType type) {
    switch (type) {
        case FieldType::UINT8: return "uint8";
        case FieldType::UINT16: return "uint16";
        case FieldType::UINT32: return "uint32";
        case FieldType::BCD: return "bcd";
        case FieldType::STRING: return "string";
        case FieldType::BYTES: return "bytes";
        case FieldType::LOCATION: return "location";
        case FieldType::ARRAY: return "array";
        default: return "invalid";
    }
}

/**
 * @brief True for an empty string or empty byte array
 *
 * An optional variable-length field holding an empty value carries no bytes
 * on the wire and is treated as absent.
 */
inline bool isEmptyValue(const FieldValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return text->empty();
    }
    if (const auto* raw = std::get_if<Bytes>(&value)) {
        return raw->empty();
    }
    return false;
}

/**
 * @brief Check if a string consists of decimal digits only
 * @param digits String to check
 * @return true if non-empty and every character is 0-9
 */
inline bool isDecimalString(const std::string& digits) {
    if (digits.empty()) {
        return false;
    }

    for (char c : digits) {
        if (c < '0' || c > '9') {
            return false;
        }
    }

    return true;
}

} // namespace jt808_codec
