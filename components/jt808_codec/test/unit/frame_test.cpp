#include <gtest/gtest.h>

#include "jt808_codec/frame.hpp"

using namespace jt808_codec;

class FrameTest : public ::testing::Test {
protected:
    Bytes data{0x00, 0x02, 0x00, 0x00, 0x01, 0x23, 0x45, 0x67, 0x89, 0x01, 0x00, 0x05};
};

TEST_F(FrameTest, ChecksumIsXorOfAllBytes) {
    EXPECT_EQ(0x00, frame::calculateChecksum(Bytes{}));
    EXPECT_EQ(0x03, frame::calculateChecksum(Bytes{0x01, 0x02}));
    EXPECT_EQ(0x00, frame::calculateChecksum(Bytes{0xAA, 0xAA}));
}

TEST_F(FrameTest, WrapAddsDelimitersAndChecksum) {
    Bytes wrapped = frame::wrap(data);

    ASSERT_EQ(data.size() + 3, wrapped.size());
    EXPECT_EQ(0x7E, wrapped.front());
    EXPECT_EQ(0x7E, wrapped.back());
    EXPECT_EQ(frame::calculateChecksum(data), wrapped[wrapped.size() - 2]);
}

TEST_F(FrameTest, UnwrapRestoresData) {
    auto result = frame::unwrap(frame::wrap(data));

    ASSERT_TRUE(result);
    EXPECT_EQ(data, result.value);
}

TEST_F(FrameTest, WrapEmptyData) {
    Bytes wrapped = frame::wrap(Bytes{});
    EXPECT_EQ((Bytes{0x7E, 0x00, 0x7E}), wrapped);

    auto result = frame::unwrap(wrapped);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value.empty());
}

TEST_F(FrameTest, EveryFlippedBitIsDetected) {
    Bytes wrapped = frame::wrap(data);

    // Flip each bit of the data bytes; bytes that become 0x7E change the
    // delimiter layout and are skipped
    for (size_t i = 1; i + 2 < wrapped.size(); ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            Bytes corrupted = wrapped;
            corrupted[i] ^= static_cast<uint8_t>(1u << bit);
            if (corrupted[i] == 0x7E) {
                continue;
            }

            auto result = frame::unwrap(corrupted);
            EXPECT_FALSE(result) << "byte " << i << " bit " << bit;
            EXPECT_EQ(FrameError::CHECKSUM_MISMATCH, result.errorCode);
            EXPECT_FALSE(frame::verifyChecksum(corrupted));
        }
    }
}

TEST_F(FrameTest, ChecksumMismatchMessage) {
    Bytes wrapped = frame::wrap(Bytes{0x01, 0x02});
    wrapped[3] = 0x00;

    auto result = frame::unwrap(wrapped);
    ASSERT_FALSE(result);
    EXPECT_EQ(FrameError::CHECKSUM_MISMATCH, result.errorCode);
    EXPECT_NE(std::string::npos, result.errorMessage.find("Invalid checksum"));
}

TEST_F(FrameTest, UncheckedUnwrapIgnoresChecksum) {
    Bytes wrapped = frame::wrap(data);
    wrapped[wrapped.size() - 2] ^= 0xFF;

    auto result = frame::unwrap(wrapped, false);
    ASSERT_TRUE(result);
    EXPECT_EQ(data, result.value);
}

TEST_F(FrameTest, MalformedFrames) {
    EXPECT_EQ(FrameError::MALFORMED, frame::unwrap(Bytes{}).errorCode);
    EXPECT_EQ(FrameError::MALFORMED, frame::unwrap(Bytes{0x7E, 0x7E}).errorCode);
    EXPECT_EQ(FrameError::MALFORMED, frame::unwrap(Bytes{0x7E, 0x01, 0x02}).errorCode);
    EXPECT_EQ(FrameError::MALFORMED, frame::unwrap(Bytes{0x01, 0x02, 0x03}).errorCode);
    EXPECT_EQ(FrameError::MALFORMED, frame::unwrap(Bytes{0x7E, 0x7E, 0x01}).errorCode);
}

TEST_F(FrameTest, BytesOutsideDelimitersAreIgnored) {
    Bytes wrapped = frame::wrap(data);
    wrapped.insert(wrapped.begin(), 0x55);
    wrapped.push_back(0x66);

    auto result = frame::unwrap(wrapped);
    ASSERT_TRUE(result);
    EXPECT_EQ(data, result.value);
    EXPECT_TRUE(frame::verifyChecksum(wrapped));
}

TEST_F(FrameTest, ErrorNames) {
    EXPECT_EQ("MALFORMED", errorToString(FrameError::MALFORMED));
    EXPECT_EQ("CHECKSUM_MISMATCH", errorToString(FrameError::CHECKSUM_MISMATCH));
}
