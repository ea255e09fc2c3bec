#include "jt808_codec/frame.hpp"
#include <algorithm>
#include <iterator>

namespace jt808_codec {
namespace frame {

namespace {

struct Delimiters {
    size_t start;
    size_t end;
};

// Locate the first and last delimiter; false if the frame cannot hold a checksum
bool findDelimiters(const Bytes& frame, Delimiters& delimiters) {
    if (frame.size() < Constants::MIN_FRAME_SIZE) {
        return false;
    }

    auto first = std::find(frame.begin(), frame.end(), Constants::FRAME_DELIMITER);
    auto last = std::find(frame.rbegin(), frame.rend(), Constants::FRAME_DELIMITER);
    if (first == frame.end() || last == frame.rend()) {
        return false;
    }

    delimiters.start = static_cast<size_t>(std::distance(frame.begin(), first));
    delimiters.end = frame.size() - 1 - static_cast<size_t>(std::distance(frame.rbegin(), last));

    // Need at least the checksum byte between the two delimiters
    return delimiters.start < delimiters.end && delimiters.end - delimiters.start >= 2;
}

} // namespace

uint8_t calculateChecksum(const uint8_t* data, size_t length) {
    uint8_t checksum = 0;
    for (size_t i = 0; i < length; ++i) {
        checksum ^= data[i];
    }
    return checksum;
}

uint8_t calculateChecksum(const Bytes& data) {
    return calculateChecksum(data.data(), data.size());
}

Bytes wrap(const Bytes& data) {
    Bytes wrapped;
    wrapped.reserve(data.size() + 3);

    wrapped.push_back(Constants::FRAME_DELIMITER);
    wrapped.insert(wrapped.end(), data.begin(), data.end());
    wrapped.push_back(calculateChecksum(data));
    wrapped.push_back(Constants::FRAME_DELIMITER);

    return wrapped;
}

Result<Bytes, FrameError> unwrap(const Bytes& frame) {
    return unwrap(frame, true);
}

Result<Bytes, FrameError> unwrap(const Bytes& frame, bool checkChecksum) {
    Delimiters delimiters{};
    if (!findDelimiters(frame, delimiters)) {
        return Result<Bytes, FrameError>::error(
            FrameError::MALFORMED,
            "Invalid message format: " + std::to_string(frame.size()) + " bytes without two distinct delimiters");
    }

    const size_t checksumPos = delimiters.end - 1;
    Bytes data(frame.begin() + static_cast<std::ptrdiff_t>(delimiters.start + 1),
               frame.begin() + static_cast<std::ptrdiff_t>(checksumPos));

    if (!checkChecksum) {
        return Result<Bytes, FrameError>::ok(std::move(data));
    }

    uint8_t expected = calculateChecksum(data);
    uint8_t received = frame[checksumPos];
    if (expected != received) {
        return Result<Bytes, FrameError>::error(
            FrameError::CHECKSUM_MISMATCH,
            "Invalid checksum: expected " + std::to_string(expected) + ", received " + std::to_string(received));
    }

    return Result<Bytes, FrameError>::ok(std::move(data));
}

bool verifyChecksum(const Bytes& frame) {
    Delimiters delimiters{};
    if (!findDelimiters(frame, delimiters)) {
        return false;
    }

    const size_t checksumPos = delimiters.end - 1;
    uint8_t expected = calculateChecksum(frame.data() + delimiters.start + 1, checksumPos - delimiters.start - 1);
    return expected == frame[checksumPos];
}

} // namespace frame
} // namespace jt808_codec
