#include "lanbeam/codec/base64.hpp"
#include "lanbeam/crypto/identity.hpp"
#include "lanbeam/crypto/token.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace lanbeam;
using namespace lanbeam::crypto;

namespace {

KeyPair make_key() {
    auto key = KeyPair::generate();
    EXPECT_TRUE(key.is_ok());
    return std::move(key.value());
}

PublicKey public_of(const KeyPair& key) {
    auto pk = key.public_key();
    EXPECT_TRUE(pk.is_ok());
    return pk.value();
}

std::vector<std::string> fields(const std::string& token) {
    std::vector<std::string> out;
    std::size_t start = 0;
    for (std::size_t dot = token.find('.'); dot != std::string::npos; dot = token.find('.', start)) {
        out.push_back(token.substr(start, dot - start));
        start = dot + 1;
    }
    out.push_back(token.substr(start));
    return out;
}

} // namespace

TEST(TokenTest, NonceTokenVerifiesAgainstSameMaterial) {
    KeyPair key = make_key();
    auto a = generate_nonce();
    auto b = generate_nonce();
    ASSERT_TRUE(a.is_ok() && b.is_ok());
    const Bytes material = combine_nonces(a.value(), b.value());

    auto token = create_token(key, material);
    ASSERT_TRUE(token.is_ok());

    auto parts = fields(token.value());
    ASSERT_EQ(parts.size(), 5u);
    EXPECT_EQ(parts[0], "sha256");
    EXPECT_EQ(parts[3], "ed25519");

    EXPECT_TRUE(verify_nonce_token(token.value(), public_of(key), material).is_ok());
}

TEST(TokenTest, CombineNoncesPutsInitiatorFirst) {
    const Bytes initiator{1, 2, 3};
    const Bytes responder{9, 8};
    EXPECT_EQ(combine_nonces(initiator, responder), (Bytes{1, 2, 3, 9, 8}));
}

TEST(TokenTest, RejectsTokenForDifferentSession) {
    KeyPair key = make_key();
    auto token = create_token(key, Bytes(64, 0x11));
    ASSERT_TRUE(token.is_ok());

    auto result = verify_nonce_token(token.value(), public_of(key), Bytes(64, 0x22));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::TransportFatal);
}

TEST(TokenTest, RejectsTokenSignedByAnotherKey) {
    KeyPair signer = make_key();
    KeyPair other = make_key();
    const Bytes material(64, 0x42);

    auto token = create_token(signer, material);
    ASSERT_TRUE(token.is_ok());
    EXPECT_TRUE(verify_nonce_token(token.value(), public_of(other), material).is_error());
}

TEST(TokenTest, RejectsTamperedFields) {
    KeyPair key = make_key();
    const Bytes material(64, 0x42);
    auto token = create_token(key, material);
    ASSERT_TRUE(token.is_ok());
    auto parts = fields(token.value());

    auto join = [](const std::vector<std::string>& p) {
        return p[0] + "." + p[1] + "." + p[2] + "." + p[3] + "." + p[4];
    };

    auto wrong_hash_method = parts;
    wrong_hash_method[0] = "sha1";
    EXPECT_TRUE(verify_nonce_token(join(wrong_hash_method), public_of(key), material).is_error());

    auto wrong_sign_method = parts;
    wrong_sign_method[3] = "rsa";
    EXPECT_TRUE(verify_nonce_token(join(wrong_sign_method), public_of(key), material).is_error());

    auto flipped_signature = parts;
    flipped_signature[4][0] = flipped_signature[4][0] == 'A' ? 'B' : 'A';
    EXPECT_TRUE(verify_nonce_token(join(flipped_signature), public_of(key), material).is_error());

    EXPECT_TRUE(verify_nonce_token("sha256.abc.def", public_of(key), material).is_error());
}

TEST(TokenTest, TimestampTokenHonoursFreshnessWindow) {
    KeyPair key = make_key();
    const auto issued = std::chrono::system_clock::now();
    auto token = create_timestamp_token(key, issued);
    ASSERT_TRUE(token.is_ok());

    const std::chrono::seconds window{3600};
    EXPECT_TRUE(verify_timestamp_token(token.value(), public_of(key), window, issued).is_ok());
    EXPECT_TRUE(verify_timestamp_token(token.value(), public_of(key), window,
                                       issued + std::chrono::minutes(59)).is_ok());
    EXPECT_TRUE(verify_timestamp_token(token.value(), public_of(key), window,
                                       issued + std::chrono::minutes(61)).is_error());
    EXPECT_TRUE(verify_timestamp_token(token.value(), public_of(key), window,
                                       issued - std::chrono::minutes(30)).is_error());
}

TEST(TokenTest, NonceBoundsAreEnforced) {
    EXPECT_FALSE(validate_nonce(Bytes(15)));
    EXPECT_TRUE(validate_nonce(Bytes(16)));
    EXPECT_TRUE(validate_nonce(Bytes(128)));
    EXPECT_FALSE(validate_nonce(Bytes(129)));

    auto nonce = generate_nonce();
    ASSERT_TRUE(nonce.is_ok());
    EXPECT_EQ(nonce.value().size(), kNonceSize);
}

TEST(TokenTest, FileTokensAreUniqueAndUrlSafe) {
    auto a = generate_file_token();
    auto b = generate_file_token();
    ASSERT_TRUE(a.is_ok() && b.is_ok());
    EXPECT_NE(a.value(), b.value());
    EXPECT_EQ(a.value().find_first_of("+/="), std::string::npos);
    EXPECT_TRUE(constant_time_equals(a.value(), a.value()));
    EXPECT_FALSE(constant_time_equals(a.value(), b.value()));
    EXPECT_FALSE(constant_time_equals(a.value(), a.value() + "x"));
}

TEST(IdentityTest, PublicKeyRejectsNonEd25519Der) {
    EXPECT_TRUE(PublicKey::from_der(Bytes{0x30, 0x03, 0x01, 0x02, 0x03}).is_error());

    KeyPair key = make_key();
    auto parsed = PublicKey::from_der(key.public_key_der());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().der(), key.public_key_der());
}

TEST(IdentityTest, Sha256MatchesKnownVector) {
    const std::string abc = "abc";
    auto digest = sha256(reinterpret_cast<const std::uint8_t*>(abc.data()), abc.size());
    EXPECT_EQ(to_hex(digest.data(), digest.size()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    Sha256Hasher hasher;
    hasher.update(reinterpret_cast<const std::uint8_t*>("a"), 1);
    hasher.update(reinterpret_cast<const std::uint8_t*>("bc"), 2);
    EXPECT_EQ(hasher.finish_hex(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(TokenTest, AcceptsMaterialFromLongestNonces) {
    KeyPair key = make_key();
    const Bytes material = combine_nonces(Bytes(kMaxNonceSize, 0x01), Bytes(kMaxNonceSize, 0x02));
    auto token = create_token(key, material);
    ASSERT_TRUE(token.is_ok());
    EXPECT_TRUE(verify_nonce_token(token.value(), public_of(key), material).is_ok());

    const Bytes oversized(2 * kMaxNonceSize + 1, 0x03);
    auto too_long = create_token(key, oversized);
    ASSERT_TRUE(too_long.is_ok());
    EXPECT_TRUE(verify_nonce_token(too_long.value(), public_of(key), oversized).is_error());
}
