#include "jt808_codec/buffer.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace jt808_codec {

ByteReader::ByteReader(const uint8_t* data, size_t length)
    : data_(data)
    , length_(data ? length : 0)
    , offset_(0)
{
}

ByteReader::ByteReader(const Bytes& data)
    : ByteReader(data.data(), data.size())
{
}

bool ByteReader::readUint8(uint8_t& out) {
    if (remaining() < 1) {
        return false;
    }
    out = data_[offset_++];
    return true;
}

bool ByteReader::readUint16(uint16_t& out) {
    if (remaining() < 2) {
        return false;
    }
    out = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return true;
}

bool ByteReader::readUint32(uint32_t& out) {
    if (remaining() < 4) {
        return false;
    }
    out = (static_cast<uint32_t>(data_[offset_]) << 24) |
          (static_cast<uint32_t>(data_[offset_ + 1]) << 16) |
          (static_cast<uint32_t>(data_[offset_ + 2]) << 8) |
          static_cast<uint32_t>(data_[offset_ + 3]);
    offset_ += 4;
    return true;
}

bool ByteReader::readBcd(size_t length, std::string& out) {
    if (remaining() < length) {
        return false;
    }
    out = bcdToString(data_ + offset_, length);
    offset_ += length;
    return true;
}

bool ByteReader::readAscii(size_t length, std::string& out) {
    if (remaining() < length) {
        return false;
    }

    out.clear();
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        char c = static_cast<char>(data_[offset_ + i]);
        if (c != '\0') {
            out += c;
        }
    }
    offset_ += length;
    return true;
}

bool ByteReader::readBytes(size_t length, Bytes& out) {
    if (remaining() < length) {
        return false;
    }
    out.assign(data_ + offset_, data_ + offset_ + length);
    offset_ += length;
    return true;
}

void ByteWriter::writeUint8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::writeUint16(uint16_t value) {
    buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void ByteWriter::writeUint32(uint32_t value) {
    buffer_.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void ByteWriter::writeBcd(const std::string& digits, size_t length) {
    Bytes bcd = stringToBcd(digits, length);
    buffer_.insert(buffer_.end(), bcd.begin(), bcd.end());
}

void ByteWriter::writeFixedAscii(const std::string& value, size_t length) {
    size_t copied = std::min(value.size(), length);
    buffer_.insert(buffer_.end(), value.begin(), value.begin() + copied);
    buffer_.insert(buffer_.end(), length - copied, 0x00);
}

void ByteWriter::writeAscii(const std::string& value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void ByteWriter::writeBytes(const Bytes& value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

Bytes stringToBcd(const std::string& digits, size_t length) {
    const size_t digitCount = length * 2;
    std::string padded = digits;
    if (padded.size() < digitCount) {
        padded.insert(0, digitCount - padded.size(), '0');
    } else if (padded.size() > digitCount) {
        padded = padded.substr(0, digitCount);
    }

    auto nibble = [](char c) -> uint8_t {
        if (c >= '0' && c <= '9') {
            return static_cast<uint8_t>(c - '0');
        }
        // Non-digits collapse to zero; the validator rejects them up front
        return 0;
    };

    Bytes bcd(length, 0x00);
    for (size_t i = 0; i < length; ++i) {
        bcd[i] = static_cast<uint8_t>((nibble(padded[i * 2]) << 4) | nibble(padded[i * 2 + 1]));
    }
    return bcd;
}

std::string bcdToString(const uint8_t* data, size_t length) {
    static const char digits[] = "0123456789abcdef";

    std::string result;
    result.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        result += digits[(data[i] >> 4) & 0x0F];
        result += digits[data[i] & 0x0F];
    }
    return result;
}

std::string bcdToString(const Bytes& data) {
    return bcdToString(data.data(), data.size());
}

std::string toHex(const Bytes& data, bool spaced) {
    std::stringstream hexStream;
    for (size_t i = 0; i < data.size(); ++i) {
        if (spaced && i > 0) {
            hexStream << ' ';
        }
        hexStream << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return hexStream.str();
}

bool fromHex(const std::string& hex, Bytes& out) {
    std::string digits;
    digits.reserve(hex.size());
    for (char c : hex) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        digits += c;
    }

    if (digits.size() % 2 != 0) {
        return false;
    }

    out.clear();
    out.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    }
    return true;
}

} // namespace jt808_codec
