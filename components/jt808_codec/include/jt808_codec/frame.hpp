#pragma once

#include "jt808_codec/types.hpp"
#include "jt808_codec/error.hpp"
#include <cstdint>

namespace jt808_codec {

/**
 * @brief Frame delimiting and checksum handling
 *
 * A frame is `0x7E <data> <checksum> 0x7E`. All functions are pure.
 */
namespace frame {

/**
 * @brief XOR of all bytes in [data, data + length)
 */
uint8_t calculateChecksum(const uint8_t* data, size_t length);
uint8_t calculateChecksum(const Bytes& data);

/**
 * @brief Wrap message data into a complete frame
 * @param data Envelope + body
 * @return 0x7E ++ data ++ checksum ++ 0x7E
 */
Bytes wrap(const Bytes& data);

/**
 * @brief Strip delimiters and checksum from a frame
 * @param frame Complete frame; bytes before the first and after the last 0x7E are ignored
 * @return Envelope + body on success, MALFORMED or CHECKSUM_MISMATCH otherwise
 */
Result<Bytes, FrameError> unwrap(const Bytes& frame);

/**
 * @brief Strip delimiters and checksum, optionally skipping the checksum test
 * @param frame Complete frame
 * @param checkChecksum When false the checksum byte is dropped unchecked
 */
Result<Bytes, FrameError> unwrap(const Bytes& frame, bool checkChecksum);

/**
 * @brief Check delimiters and checksum without extracting the data
 */
bool verifyChecksum(const Bytes& frame);

} // namespace frame

} // namespace jt808_codec
