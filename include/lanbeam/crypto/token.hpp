#pragma once

/**
 * @file token.hpp
 * @brief ClientToken creation and verification, nonce helpers
 *
 * Token layout (five dot-separated fields):
 *
 *   sha256.<b64url(sha256(publicKeyDER || salt))>.<b64url(salt)>.ed25519.<b64url(signature over the hash)>
 *
 * Two salt flavours are in use:
 * - session tokens: salt = initiator nonce || responder nonce, must equal the expected material
 * - registration tokens: salt = unix seconds as big-endian u64, must be inside the freshness window
 */

#include "lanbeam/core/result.hpp"
#include "lanbeam/crypto/identity.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace lanbeam::crypto {

inline constexpr std::size_t kNonceSize = 32;
inline constexpr std::size_t kMinNonceSize = 16;
inline constexpr std::size_t kMaxNonceSize = 128;
inline constexpr const char* kHashMethod = "sha256";
inline constexpr const char* kSignMethod = "ed25519";

Result<Bytes> generate_nonce();

[[nodiscard]] bool validate_nonce(const Bytes& nonce) noexcept;

/**
 * @brief Session binding value; both roles put the initiator's bytes first
 */
Bytes combine_nonces(const Bytes& initiator_nonce, const Bytes& responder_nonce);

struct ParsedToken {
    std::string hash_method;
    Bytes hash;
    Bytes salt;
    std::string sign_method;
    Bytes signature;
};

Result<ParsedToken> parse_token(const std::string& token);

Result<std::string> create_token(const KeyPair& key, const Bytes& salt);

Result<std::string> create_timestamp_token(const KeyPair& key,
                                           std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

using SaltCheck = std::function<Result<void>(const Bytes& salt)>;

/**
 * @brief Verify method tags, recompute the hash, check the salt, then the signature
 */
Result<void> verify_token(const std::string& token, const PublicKey& key, const SaltCheck& check_salt);

Result<void> verify_nonce_token(const std::string& token, const PublicKey& key, const Bytes& expected_nonce);

Result<void> verify_timestamp_token(const std::string& token,
                                    const PublicKey& key,
                                    std::chrono::seconds freshness,
                                    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

/**
 * @brief Unguessable per-file transfer token (16 random bytes, base64url)
 */
Result<std::string> generate_file_token();

/**
 * @brief Comparison whose timing does not depend on where the inputs differ
 */
[[nodiscard]] bool constant_time_equals(const std::string& lhs, const std::string& rhs) noexcept;

} // namespace lanbeam::crypto
