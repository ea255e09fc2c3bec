#pragma once

#include "jt808_codec/types.hpp"
#include "jt808_codec/error.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace jt808_codec {

/**
 * @brief Fragmentation info carried when properties bit 13 is set
 */
struct FragmentInfo {
    uint16_t totalPackages = 0;
    uint16_t currentPackage = 0;

    bool operator==(const FragmentInfo& other) const {
        return totalPackages == other.totalPackages && currentPackage == other.currentPackage;
    }
};

/**
 * @brief Decoded message envelope
 */
struct MessageHeader {
    uint16_t messageId = 0;
    uint16_t propertiesRaw = 0;
    ProtocolVersion protocolVersion = ProtocolVersion::V2013;
    std::string deviceId;               ///< 12 decimal digits
    uint16_t sequenceNumber = 0;
    std::optional<FragmentInfo> fragmentInfo;

    uint16_t bodyLength() const { return propertiesRaw & Constants::BODY_LENGTH_MASK; }
    uint8_t encryptionType() const {
        return static_cast<uint8_t>((propertiesRaw >> Constants::ENCRYPTION_SHIFT) & Constants::ENCRYPTION_MASK);
    }
    bool isFragmented() const { return ((propertiesRaw >> Constants::FRAGMENT_SHIFT) & 0x01) != 0; }
    uint8_t reservedBits() const {
        return static_cast<uint8_t>((propertiesRaw >> Constants::RESERVED_SHIFT) & Constants::RESERVED_MASK);
    }
};

namespace header {

/**
 * @brief Decode the envelope at the start of unwrapped frame data
 * @param data Envelope + body (delimiters and checksum already removed)
 * @param length Number of bytes available
 * @return Header, or TRUNCATED if the fixed layout does not fit
 */
Result<MessageHeader, HeaderError> parseHeader(const uint8_t* data, size_t length);
Result<MessageHeader, HeaderError> parseHeader(const Bytes& data);

/**
 * @brief Guess the protocol revision from structural signals
 *
 * Non-zero reserved bits or a 2019-only message id mean V2019; everything
 * else is reported as V2013. V2011 is never returned because nothing in the
 * envelope tells it apart from V2013.
 */
ProtocolVersion detectProtocolVersion(uint16_t messageId, uint8_t reservedBits);

/**
 * @brief Encoded size of the envelope: 12 bytes, 16 with fragment info
 */
size_t headerLength(const MessageHeader& header);

/**
 * @brief Encode an envelope
 * @param messageId Message identifier
 * @param deviceId Decimal terminal id, left padded to 12 digits
 * @param sequenceNumber Sequence number
 * @param bodyLength Body size, masked to 10 bits
 * @param fragmentInfo Sets the fragmentation bit and appends totals when present
 * @param encryptionType 3-bit encryption marker
 */
Bytes serializeHeader(uint16_t messageId,
                      const std::string& deviceId,
                      uint16_t sequenceNumber,
                      size_t bodyLength,
                      const std::optional<FragmentInfo>& fragmentInfo = std::nullopt,
                      uint8_t encryptionType = 0);

} // namespace header

} // namespace jt808_codec
