#include <gtest/gtest.h>
#include "../crypto/Checksum.hpp"
#include <stdexcept>

using namespace routesim;

TEST(ChecksumTest, KnownDigests) {
    EXPECT_EQ(Checksum::md5Text(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(Checksum::digestHex("abc", "md5"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(Checksum::digestHex("abc", "sha1"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(Checksum::digestHex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ChecksumTest, UnsupportedAlgorithm) {
    EXPECT_THROW(Checksum::digestHex("abc", "crc32"), std::invalid_argument);
}

TEST(ChecksumTest, Base64Decode) {
    EXPECT_EQ(Checksum::base64Decode("YWJj"), "abc");
    EXPECT_EQ(Checksum::base64Decode("c3VyZS4="), "sure.");
    EXPECT_EQ(Checksum::base64Decode("d2F5cG9pbnRzLnhsc3g="), "waypoints.xlsx");
    EXPECT_EQ(Checksum::base64Decode(""), "");
}

TEST(ChecksumTest, DigestOfUploadedContent) {
    // Upload arrives base64-encoded; digest covers the decoded bytes
    EXPECT_EQ(Checksum::computeBase64("YWJj"), Checksum::digestHex("abc"));
    EXPECT_EQ(Checksum::computeBase64("YWJj", "md5"), "900150983cd24fb0d6963f7d28e17f72");
}
