#pragma once

#include "jt808_codec/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace jt808_codec {

/**
 * @brief Bounds-checked big-endian cursor over a byte buffer
 *
 * Every read either succeeds and advances the cursor, or fails and leaves
 * the cursor where it was. The reader never owns the data it points to.
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t length);
    explicit ByteReader(const Bytes& data);

    bool readUint8(uint8_t& out);
    bool readUint16(uint16_t& out);
    bool readUint32(uint32_t& out);

    /**
     * @brief Read `length` BCD bytes as 2*length decimal digits
     * @note Nibbles above 9 are rendered as-is (hex digit) and left to the validator
     */
    bool readBcd(size_t length, std::string& out);

    /**
     * @brief Read `length` bytes as ASCII, dropping every NUL byte
     */
    bool readAscii(size_t length, std::string& out);

    bool readBytes(size_t length, Bytes& out);

    size_t remaining() const { return length_ - offset_; }
    size_t offset() const { return offset_; }

private:
    const uint8_t* data_;
    size_t length_;
    size_t offset_;
};

/**
 * @brief Append-only big-endian writer
 */
class ByteWriter {
public:
    ByteWriter() = default;

    void writeUint8(uint8_t value);
    void writeUint16(uint16_t value);
    void writeUint32(uint32_t value);
    void writeBcd(const std::string& digits, size_t length);

    /**
     * @brief Write `value` into exactly `length` bytes, NUL padded or truncated
     */
    void writeFixedAscii(const std::string& value, size_t length);
    void writeAscii(const std::string& value);
    void writeBytes(const Bytes& value);

    const Bytes& data() const { return buffer_; }
    Bytes release() { return std::move(buffer_); }
    size_t size() const { return buffer_.size(); }

private:
    Bytes buffer_;
};

/**
 * @brief Convert a decimal digit string to packed BCD
 * @param digits Digit string, left padded with '0' to 2*length digits
 * @param length Number of output bytes
 * @return BCD bytes; when digits is longer than 2*length only the leading 2*length digits are kept
 */
Bytes stringToBcd(const std::string& digits, size_t length);

/**
 * @brief Convert packed BCD bytes to their digit string
 */
std::string bcdToString(const uint8_t* data, size_t length);
std::string bcdToString(const Bytes& data);

/**
 * @brief Render bytes as lowercase hex, optionally separated by spaces
 */
std::string toHex(const Bytes& data, bool spaced = false);

/**
 * @brief Parse a hex string (whitespace ignored) into bytes
 * @return false if the string contains a non-hex character or an odd digit count
 */
bool fromHex(const std::string& hex, Bytes& out);

} // namespace jt808_codec
