#include "jt808_codec/parser.hpp"
#include "jt808_codec/buffer.hpp"
#include "jt808_codec/frame.hpp"
#include "jt808_codec/header.hpp"
#include <spdlog/spdlog.h>

namespace jt808_codec {

namespace {

EncodeError toEncodeError(ValidationError code) {
    switch (code) {
        case ValidationError::MISSING_FIELD:      return EncodeError::MISSING_FIELD;
        case ValidationError::UNKNOWN_MESSAGE_ID: return EncodeError::UNKNOWN_MESSAGE_ID;
        case ValidationError::TYPE_MISMATCH:      return EncodeError::TYPE_MISMATCH;
        default:                                  return EncodeError::VALUE_OUT_OF_RANGE;
    }
}

} // namespace

Parser::Parser(const Config& config, const SchemaRegistry& registry)
    : config_(config)
    , serializer_(registry)
    , validator_(Validator::Config{}, registry)
{
}

ParsedMessage Parser::parse(const Bytes& frame) const {
    if (frame.size() > config_.maxFrameSize) {
        return fail(ParseErrorCode::FRAME_TOO_LARGE,
                    "Frame of " + std::to_string(frame.size()) + " bytes exceeds limit of " +
                    std::to_string(config_.maxFrameSize),
                    frame);
    }

    if (config_.logRawFrames) {
        spdlog::debug("RX frame ({} bytes): {}", frame.size(), toHex(frame, true));
    }

    auto unwrapped = frame::unwrap(frame, config_.validateChecksum);
    if (!unwrapped) {
        const ParseErrorCode code = unwrapped.errorCode == FrameError::CHECKSUM_MISMATCH
            ? ParseErrorCode::CHECKSUM_MISMATCH
            : ParseErrorCode::FRAME_MALFORMED;
        return fail(code, unwrapped.errorMessage, frame);
    }
    const Bytes& data = unwrapped.value;

    auto parsedHeader = header::parseHeader(data);
    if (!parsedHeader) {
        return fail(ParseErrorCode::HEADER_TRUNCATED, parsedHeader.errorMessage, frame);
    }
    const MessageHeader& messageHeader = parsedHeader.value;

    const size_t headerSize = header::headerLength(messageHeader);
    const size_t available = data.size() - headerSize;
    const size_t bodyLength = messageHeader.bodyLength();
    if (bodyLength > available) {
        return fail(ParseErrorCode::BODY_LENGTH_MISMATCH,
                    "Declared body length " + std::to_string(bodyLength) + " exceeds " +
                    std::to_string(available) + " available bytes",
                    frame);
    }
    if (bodyLength < available) {
        spdlog::debug("Ignoring {} trailing bytes after body of {}",
                      available - bodyLength, messageIdToString(messageHeader.messageId));
    }

    const auto bodyStart = data.begin() + static_cast<std::ptrdiff_t>(headerSize);
    Bytes body(bodyStart, bodyStart + static_cast<std::ptrdiff_t>(bodyLength));

    spdlog::debug("Parsed header: id={} device={} seq={} len={} version={}{}",
                  messageIdToString(messageHeader.messageId),
                  messageHeader.deviceId,
                  messageHeader.sequenceNumber,
                  bodyLength,
                  protocolVersionToString(messageHeader.protocolVersion),
                  messageHeader.fragmentInfo
                      ? " fragment " + std::to_string(messageHeader.fragmentInfo->currentPackage) + "/" +
                        std::to_string(messageHeader.fragmentInfo->totalPackages)
                      : std::string());

    ParsedMessage message(messageHeader, FieldMap{}, body);
    message.rawFrame_ = frame;

    // Encrypted bodies and single fragments cannot be decoded field by field
    const bool decodable = config_.decodeBody &&
                           serializer_.registry().contains(messageHeader.messageId) &&
                           messageHeader.encryptionType() == 0 &&
                           !messageHeader.isFragmented();
    if (!decodable) {
        return message;
    }

    auto decoded = serializer_.decode(messageHeader.messageId, body);
    if (!decoded) {
        return fail(ParseErrorCode::BODY_DECODE_FAILED,
                    "Failed to decode " + messageIdToString(messageHeader.messageId) + ": " + decoded.errorMessage,
                    frame);
    }

    message.fields_ = std::move(decoded.value);
    message.decoded_ = true;
    return message;
}

Result<Bytes, EncodeError> Parser::build(uint16_t messageId,
                                         const std::string& deviceId,
                                         uint16_t sequenceNumber,
                                         const FieldMap& fields,
                                         const std::optional<FragmentInfo>& fragmentInfo) const {
    if (config_.validateOnBuild) {
        auto validation = validator_.validate(messageId, fields);
        if (!validation) {
            spdlog::warn("Refusing to build {}: {}", messageIdToString(messageId), validation.errorMessage);
            return Result<Bytes, EncodeError>::error(
                toEncodeError(validation.errorCode), validation.errorMessage, validation.field);
        }
    }

    auto encoded = serializer_.encode(messageId, fields);
    if (!encoded) {
        spdlog::warn("Failed to encode {}: {}", messageIdToString(messageId), encoded.errorMessage);
        return encoded;
    }

    if (encoded.value.size() > Constants::BODY_LENGTH_MASK) {
        return Result<Bytes, EncodeError>::error(
            EncodeError::VALUE_OUT_OF_RANGE,
            "Body of " + std::to_string(encoded.value.size()) + " bytes does not fit the 10-bit length field");
    }

    return Result<Bytes, EncodeError>::ok(buildRaw(messageId, deviceId, sequenceNumber, encoded.value, fragmentInfo));
}

Bytes Parser::buildRaw(uint16_t messageId,
                       const std::string& deviceId,
                       uint16_t sequenceNumber,
                       const Bytes& body,
                       const std::optional<FragmentInfo>& fragmentInfo) const {
    if (body.size() > Constants::BODY_LENGTH_MASK) {
        spdlog::warn("Body of {} bytes for {} is truncated in the length field",
                     body.size(), messageIdToString(messageId));
    }

    Bytes data = header::serializeHeader(messageId, deviceId, sequenceNumber, body.size(), fragmentInfo);
    data.insert(data.end(), body.begin(), body.end());

    Bytes frame = frame::wrap(data);
    if (config_.logRawFrames) {
        spdlog::debug("TX frame ({} bytes): {}", frame.size(), toHex(frame, true));
    }
    return frame;
}

ParsedMessage Parser::fail(ParseErrorCode code, const std::string& message, const Bytes& frame) const {
    spdlog::warn("Frame rejected ({}): {}", errorToString(code), message);
    return ParsedMessage::failure(code, message, frame);
}

} // namespace jt808_codec
