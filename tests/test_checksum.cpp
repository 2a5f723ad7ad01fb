#include "srft_protocol.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<uint8_t> with_checksum(std::vector<uint8_t> data) {
    uint16_t c = srft_checksum16(data);
    data.push_back(static_cast<uint8_t>(c >> 8));
    data.push_back(static_cast<uint8_t>(c));
    return data;
}

} // namespace

TEST(Checksum, CornerCases) {
    EXPECT_EQ(srft_checksum16(std::vector<uint8_t>{}), 0xFFFF);
    EXPECT_EQ(srft_checksum16(std::vector<uint8_t>{0x00, 0x00}), 0xFFFF);
    EXPECT_EQ(srft_checksum16(std::vector<uint8_t>{0xFF, 0xFF}), 0x0000);
}

TEST(Checksum, OddLengthIsZeroPadded) {
    EXPECT_EQ(srft_checksum16(std::vector<uint8_t>{0xAB, 0xCD, 0xEF}), 0x6531);
    EXPECT_EQ(srft_checksum16(std::vector<uint8_t>{0xAB, 0xCD, 0xEF}),
              srft_checksum16(std::vector<uint8_t>{0xAB, 0xCD, 0xEF, 0x00}));
}

TEST(Checksum, TextbookIpHeader) {
    std::vector<uint8_t> hdr = {0x45, 0x00, 0x00, 0x1C, 0xC0, 0x01, 0x00, 0x00, 0x04, 0x11,
                                0x00, 0x00, 0x0A, 0x0C, 0x0E, 0x05, 0x0C, 0x06, 0x07, 0x09};
    EXPECT_EQ(srft_checksum16(hdr), 0xCBB0);
}

TEST(Checksum, HelloMatchesManualSum) {
    std::vector<uint8_t> data = bytes_of("Hello!");

    uint32_t sum = 0;
    for (size_t i = 0; i < data.size(); i += 2) {
        uint32_t word = static_cast<uint32_t>(data[i]) << 8;
        if (i + 1 < data.size()) word |= data[i + 1];
        sum += word;
        while (sum > 0xFFFF) sum = (sum & 0xFFFF) + (sum >> 16);
    }
    uint16_t manual = static_cast<uint16_t>(~sum & 0xFFFF);

    EXPECT_EQ(manual, 0xDC0C);
    EXPECT_EQ(srft_checksum16(data), manual);
}

TEST(Checksum, VerifyAcceptsAppendedChecksum) {
    EXPECT_TRUE(srft_verify_checksum(with_checksum(bytes_of("Hello!"))));
    EXPECT_TRUE(srft_verify_checksum(with_checksum(std::vector<uint8_t>{0x12, 0x34, 0x56, 0x78})));
}

TEST(Checksum, EverySingleBitFlipIsDetected) {
    std::vector<uint8_t> good = with_checksum(bytes_of("Hello!"));
    for (size_t i = 0; i < good.size(); ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            std::vector<uint8_t> bad = good;
            bad[i] ^= static_cast<uint8_t>(1u << bit);
            EXPECT_FALSE(srft_verify_checksum(bad)) << "byte " << i << " bit " << bit;
        }
    }
}

TEST(Checksum, FieldHelpersAreBigEndian) {
    uint8_t buf[4] = {};
    srft_put32(buf, 0x01020304u);
    EXPECT_EQ(buf[0], 0x01);
    EXPECT_EQ(buf[3], 0x04);
    EXPECT_EQ(srft_get32(buf), 0x01020304u);
    srft_put16(buf, 0xBEEF);
    EXPECT_EQ(buf[0], 0xBE);
    EXPECT_EQ(srft_get16(buf), 0xBEEF);
}
