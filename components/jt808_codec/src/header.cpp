#include "jt808_codec/header.hpp"
#include "jt808_codec/buffer.hpp"
#include "jt808_codec/protocol.hpp"
#include <algorithm>
#include <array>

namespace jt808_codec {
namespace header {

namespace {

// Message ids that only exist (or changed layout) in the 2019 revision
constexpr std::array<uint16_t, 7> V2019_MESSAGE_IDS = {
    protocol::message_id::TERMINAL_GENERAL_RESPONSE,
    protocol::message_id::PLATFORM_GENERAL_RESPONSE,
    protocol::message_id::TERMINAL_AUTH,
    protocol::message_id::SET_TERMINAL_PARAMETERS,
    protocol::message_id::QUERY_TERMINAL_PARAMETERS,
    protocol::message_id::QUERY_SPECIFIC_PARAMETERS,
    protocol::message_id::QUERY_TERMINAL_ATTRIBUTES
};

Result<MessageHeader, HeaderError> truncated(const std::string& what, size_t offset, size_t length) {
    return Result<MessageHeader, HeaderError>::error(
        HeaderError::TRUNCATED,
        "Header truncated reading " + what + " at offset " + std::to_string(offset) +
        ", buffer length " + std::to_string(length),
        what);
}

} // namespace

Result<MessageHeader, HeaderError> parseHeader(const uint8_t* data, size_t length) {
    ByteReader reader(data, length);
    MessageHeader header;

    if (!reader.readUint16(header.messageId)) {
        return truncated("messageId", reader.offset(), length);
    }

    if (!reader.readUint16(header.propertiesRaw)) {
        return truncated("properties", reader.offset(), length);
    }

    header.protocolVersion = detectProtocolVersion(header.messageId, header.reservedBits());

    // 6-byte BCD in every revision handled here
    if (!reader.readBcd(Constants::DEVICE_ID_BCD_LENGTH, header.deviceId)) {
        return truncated("deviceId", reader.offset(), length);
    }

    if (!reader.readUint16(header.sequenceNumber)) {
        return truncated("sequenceNumber", reader.offset(), length);
    }

    if (header.isFragmented()) {
        FragmentInfo fragment;
        if (!reader.readUint16(fragment.totalPackages)) {
            return truncated("fragmentTotal", reader.offset(), length);
        }
        if (!reader.readUint16(fragment.currentPackage)) {
            return truncated("fragmentCurrent", reader.offset(), length);
        }
        header.fragmentInfo = fragment;
    }

    return Result<MessageHeader, HeaderError>::ok(std::move(header));
}

Result<MessageHeader, HeaderError> parseHeader(const Bytes& data) {
    return parseHeader(data.data(), data.size());
}

ProtocolVersion detectProtocolVersion(uint16_t messageId, uint8_t reservedBits) {
    if (reservedBits != 0) {
        return ProtocolVersion::V2019;
    }

    if (std::find(V2019_MESSAGE_IDS.begin(), V2019_MESSAGE_IDS.end(), messageId) != V2019_MESSAGE_IDS.end()) {
        return ProtocolVersion::V2019;
    }

    // 2011 and 2013 share the envelope layout and cannot be told apart
    return ProtocolVersion::V2013;
}

size_t headerLength(const MessageHeader& header) {
    size_t length = Constants::BASE_HEADER_SIZE;
    if (header.fragmentInfo) {
        length += Constants::FRAGMENT_INFO_SIZE;
    }
    return length;
}

Bytes serializeHeader(uint16_t messageId,
                      const std::string& deviceId,
                      uint16_t sequenceNumber,
                      size_t bodyLength,
                      const std::optional<FragmentInfo>& fragmentInfo,
                      uint8_t encryptionType) {
    uint16_t properties = static_cast<uint16_t>(bodyLength & Constants::BODY_LENGTH_MASK);
    properties |= static_cast<uint16_t>((encryptionType & Constants::ENCRYPTION_MASK) << Constants::ENCRYPTION_SHIFT);
    if (fragmentInfo) {
        properties |= static_cast<uint16_t>(1u << Constants::FRAGMENT_SHIFT);
    }

    ByteWriter writer;
    writer.writeUint16(messageId);
    writer.writeUint16(properties);
    writer.writeBcd(deviceId, Constants::DEVICE_ID_BCD_LENGTH);
    writer.writeUint16(sequenceNumber);

    if (fragmentInfo) {
        writer.writeUint16(fragmentInfo->totalPackages);
        writer.writeUint16(fragmentInfo->currentPackage);
    }

    return writer.release();
}

} // namespace header
} // namespace jt808_codec
