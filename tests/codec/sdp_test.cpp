#include "lanbeam/codec/sdp.hpp"
#include "lanbeam/codec/base64.hpp"

#include <gtest/gtest.h>

using lanbeam::ErrorKind;
using lanbeam::codec::decode_sdp;
using lanbeam::codec::encode_sdp;

namespace {

const char* kOffer =
    "v=0\r\n"
    "o=- 4611731400430051336 2 IN IP4 127.0.0.1\r\n"
    "s=-\r\n"
    "t=0 0\r\n"
    "a=group:BUNDLE 0\r\n"
    "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n"
    "c=IN IP4 0.0.0.0\r\n"
    "a=ice-ufrag:abcd\r\n"
    "a=ice-pwd:abcdefghijklmnopqrstuvwx\r\n"
    "a=sctp-port:5000\r\n";

} // namespace

TEST(SdpCodecTest, EncodedFormIsUrlSafeAndDecodesBack) {
    auto encoded = encode_sdp(kOffer);
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_EQ(encoded.value().find_first_of("+/="), std::string::npos);

    auto decoded = decode_sdp(encoded.value());
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().message;
    EXPECT_EQ(decoded.value(), kOffer);
}

TEST(SdpCodecTest, CompressesRepetitiveDescriptions) {
    std::string sdp;
    for (int i = 0; i < 50; ++i) {
        sdp += "a=candidate:1 1 udp 2122260223 192.168.1.10 54400 typ host generation 0\r\n";
    }
    auto encoded = encode_sdp(sdp);
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_LT(encoded.value().size(), sdp.size() / 4);
}

TEST(SdpCodecTest, RejectsCorruptInput) {
    auto not_base64 = decode_sdp("***");
    ASSERT_TRUE(not_base64.is_error());
    EXPECT_EQ(not_base64.error().kind, ErrorKind::InvalidArgument);

    auto not_deflate = decode_sdp(lanbeam::codec::base64url_encode(std::string_view("plain text")));
    ASSERT_TRUE(not_deflate.is_error());

    auto encoded = encode_sdp(kOffer);
    ASSERT_TRUE(encoded.is_ok());
    std::string truncated = encoded.value().substr(0, encoded.value().size() / 2);
    EXPECT_TRUE(decode_sdp(truncated).is_error());
}
