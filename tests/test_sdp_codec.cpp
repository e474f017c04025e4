#include <gtest/gtest.h>
#include "sdp_codec.h"
#include "errors.h"
#include <string>

using namespace rtcdrop;

class SdpCodecTest : public ::testing::Test {
protected:
    std::string all_bytes() {
        std::string bytes;
        for (int i = 0; i < 256; ++i) {
            bytes.push_back(static_cast<char>(i));
        }
        return bytes;
    }
};

// Test known vectors from RFC 4648
TEST_F(SdpCodecTest, EncodeKnownVectorsTest) {
    EXPECT_EQ(sdp_codec::encode(""), "");
    EXPECT_EQ(sdp_codec::encode("f"), "Zg==");
    EXPECT_EQ(sdp_codec::encode("fo"), "Zm8=");
    EXPECT_EQ(sdp_codec::encode("foo"), "Zm9v");
    EXPECT_EQ(sdp_codec::encode("foob"), "Zm9vYg==");
    EXPECT_EQ(sdp_codec::encode("fooba"), "Zm9vYmE=");
    EXPECT_EQ(sdp_codec::encode("foobar"), "Zm9vYmFy");
}

TEST_F(SdpCodecTest, DecodeKnownVectorsTest) {
    EXPECT_EQ(sdp_codec::decode(""), "");
    EXPECT_EQ(sdp_codec::decode("Zg=="), "f");
    EXPECT_EQ(sdp_codec::decode("Zm8="), "fo");
    EXPECT_EQ(sdp_codec::decode("Zm9vYmFy"), "foobar");
}

// An SDP blob with CRLF line breaks must survive a round trip unchanged
TEST_F(SdpCodecTest, SdpWithLineBreaksRoundTripTest) {
    std::string sdp = "v=0\r\no=- 4611731400430051336 2 IN IP4 127.0.0.1\r\ns=-\r\nt=0 0\r\n";
    std::string token = sdp_codec::encode(sdp);

    EXPECT_EQ(token.find('\n'), std::string::npos);
    EXPECT_EQ(token.find('\r'), std::string::npos);
    EXPECT_EQ(token.find(':'), std::string::npos);
    EXPECT_EQ(sdp_codec::decode(token), sdp);
}

TEST_F(SdpCodecTest, BinaryRoundTripTest) {
    std::string bytes = all_bytes();
    EXPECT_EQ(sdp_codec::decode(sdp_codec::encode(bytes)), bytes);
}

TEST_F(SdpCodecTest, SurroundingWhitespaceIgnoredTest) {
    EXPECT_EQ(sdp_codec::decode("  Zm9vYmFy\r\n"), "foobar");
}

TEST_F(SdpCodecTest, RejectsIllegalCharacterTest) {
    EXPECT_THROW(sdp_codec::decode("Zm9v*mFy"), DecodeError);
    EXPECT_THROW(sdp_codec::decode("Zm9v YmFy"), DecodeError);
}

TEST_F(SdpCodecTest, RejectsBadLengthTest) {
    EXPECT_THROW(sdp_codec::decode("Zm9"), DecodeError);
    EXPECT_THROW(sdp_codec::decode("Zm9vY"), DecodeError);
}

TEST_F(SdpCodecTest, RejectsMisplacedPaddingTest) {
    EXPECT_THROW(sdp_codec::decode("Z==="), DecodeError);
    EXPECT_THROW(sdp_codec::decode("Zg==Zm9v"), DecodeError);
    EXPECT_THROW(sdp_codec::decode("Zm=v"), DecodeError);
}

TEST_F(SdpCodecTest, DecodeErrorIsRtcdropErrorTest) {
    try {
        sdp_codec::decode("!!!!");
        FAIL() << "Expected DecodeError";
    } catch (const RtcdropError& e) {
        EXPECT_NE(std::string(e.what()).find("invalid base64"), std::string::npos);
    }
}

TEST_F(SdpCodecTest, TryDecodeTest) {
    std::string out = "unchanged";
    EXPECT_FALSE(sdp_codec::try_decode("not base64!", out));
    EXPECT_EQ(out, "unchanged");

    EXPECT_TRUE(sdp_codec::try_decode("aGVsbG8=", out));
    EXPECT_EQ(out, "hello");
}
