#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace jt808_codec {

/**
 * @brief Base exception class for programmer errors in the codec
 *
 * Wire-level failures never throw; they are reported through Result.
 */
class ProtocolError : public std::exception {
public:
    explicit ProtocolError(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }

protected:
    std::string message_;
};

/**
 * @brief Exception thrown when the static schema table is inconsistent
 */
class SchemaError : public ProtocolError {
public:
    explicit SchemaError(const std::string& message) : ProtocolError("Schema error: " + message) {}
};

/**
 * @brief Exception thrown when field access fails
 */
class FieldAccessError : public ProtocolError {
public:
    explicit FieldAccessError(const std::string& message) : ProtocolError("Field access error: " + message) {}
};

/**
 * @brief Exception thrown when type conversion fails
 */
class TypeConversionError : public ProtocolError {
public:
    explicit TypeConversionError(const std::string& message) : ProtocolError("Type conversion error: " + message) {}
};

// Frame delimiter/checksum failures
enum class FrameError {
    NONE = 0,
    MALFORMED = 1,
    CHECKSUM_MISMATCH = 2
};

// Envelope failures
enum class HeaderError {
    NONE = 0,
    TRUNCATED = 1
};

// Body decode failures
enum class DecodeError {
    NONE = 0,
    TRUNCATED = 1,
    UNSUPPORTED_TYPE = 2,
    UNKNOWN_MESSAGE_ID = 3
};

// Body encode failures
enum class EncodeError {
    NONE = 0,
    MISSING_FIELD = 1,
    UNKNOWN_MESSAGE_ID = 2,
    TYPE_MISMATCH = 3,
    VALUE_OUT_OF_RANGE = 4
};

// Constraint violations reported by the validator
enum class ValidationError {
    NONE = 0,
    MISSING_FIELD = 1,
    TYPE_MISMATCH = 2,
    RANGE_VIOLATION = 3,
    ENUM_VIOLATION = 4,
    PATTERN_VIOLATION = 5,
    UNKNOWN_MESSAGE_ID = 6
};

// Failures of the complete frame -> message pipeline
enum class ParseErrorCode {
    NONE = 0,
    FRAME_TOO_LARGE = 1,
    FRAME_MALFORMED = 2,
    CHECKSUM_MISMATCH = 3,
    HEADER_TRUNCATED = 4,
    BODY_LENGTH_MISMATCH = 5,
    BODY_DECODE_FAILED = 6
};

inline std::string errorToString(FrameError code) {
    switch (code) {
        case FrameError::NONE:              return "NONE";
        case FrameError::MALFORMED:         return "MALFORMED";
        case FrameError::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
        default:                            return "UNKNOWN_ERROR";
    }
}

inline std::string errorToString(HeaderError code) {
    switch (code) {
        case HeaderError::NONE:      return "NONE";
        case HeaderError::TRUNCATED: return "TRUNCATED";
        default:                     return "UNKNOWN_ERROR";
    }
}

inline std::string errorToString(DecodeError code) {
    switch (code) {
        case DecodeError::NONE:               return "NONE";
        case DecodeError::TRUNCATED:          return "TRUNCATED";
        case DecodeError::UNSUPPORTED_TYPE:   return "UNSUPPORTED_TYPE";
        case DecodeError::UNKNOWN_MESSAGE_ID: return "UNKNOWN_MESSAGE_ID";
        default:                              return "UNKNOWN_ERROR";
    }
}

inline std::string errorToString(EncodeError code) {
    switch (code) {
        case EncodeError::NONE:               return "NONE";
        case EncodeError::MISSING_FIELD:      return "MISSING_FIELD";
        case EncodeError::UNKNOWN_MESSAGE_ID: return "UNKNOWN_MESSAGE_ID";
        case EncodeError::TYPE_MISMATCH:      return "TYPE_MISMATCH";
        case EncodeError::VALUE_OUT_OF_RANGE: return "VALUE_OUT_OF_RANGE";
        default:                              return "UNKNOWN_ERROR";
    }
}

inline std::string errorToString(ValidationError code) {
    switch (code) {
        case ValidationError::NONE:               return "NONE";
        case ValidationError::MISSING_FIELD:      return "MISSING_FIELD";
        case ValidationError::TYPE_MISMATCH:      return "TYPE_MISMATCH";
        case ValidationError::RANGE_VIOLATION:    return "RANGE_VIOLATION";
        case ValidationError::ENUM_VIOLATION:     return "ENUM_VIOLATION";
        case ValidationError::PATTERN_VIOLATION:  return "PATTERN_VIOLATION";
        case ValidationError::UNKNOWN_MESSAGE_ID: return "UNKNOWN_MESSAGE_ID";
        default:                                  return "UNKNOWN_ERROR";
    }
}

inline std::string errorToString(ParseErrorCode code) {
    switch (code) {
        case ParseErrorCode::NONE:                 return "NONE";
        case ParseErrorCode::FRAME_TOO_LARGE:      return "FRAME_TOO_LARGE";
        case ParseErrorCode::FRAME_MALFORMED:      return "FRAME_MALFORMED";
        case ParseErrorCode::CHECKSUM_MISMATCH:    return "CHECKSUM_MISMATCH";
        case ParseErrorCode::HEADER_TRUNCATED:     return "HEADER_TRUNCATED";
        case ParseErrorCode::BODY_LENGTH_MISMATCH: return "BODY_LENGTH_MISMATCH";
        case ParseErrorCode::BODY_DECODE_FAILED:   return "BODY_DECODE_FAILED";
        default:                                   return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Outcome of a codec operation
 *
 * On failure `errorCode` holds the kind, `errorMessage` a human readable
 * description and `field` the schema field involved (empty when not tied to
 * a field).
 */
template<typename T, typename E>
struct Result {
    bool success = false;
    E errorCode = E::NONE;
    std::string errorMessage;
    std::string field;
    T value{};

    static Result<T, E> ok(const T& value) {
        Result<T, E> result;
        result.success = true;
        result.value = value;
        return result;
    }

    static Result<T, E> ok(T&& value) {
        Result<T, E> result;
        result.success = true;
        result.value = std::move(value);
        return result;
    }

    static Result<T, E> error(E code, const std::string& message, const std::string& fieldName = "") {
        Result<T, E> result;
        result.success = false;
        result.errorCode = code;
        result.errorMessage = message;
        result.field = fieldName;
        return result;
    }

    explicit operator bool() const {
        return success;
    }
};

// Result for operations without return value
template<typename E>
using VoidResult = Result<bool, E>;

template<typename E>
inline VoidResult<E> makeSuccessResult() {
    return VoidResult<E>::ok(true);
}

template<typename E>
inline VoidResult<E> makeErrorResult(E code, const std::string& message, const std::string& fieldName = "") {
    return VoidResult<E>::error(code, message, fieldName);
}

} // namespace jt808_codec
