#include "lanbeam/crypto/token.hpp"
#include "lanbeam/codec/base64.hpp"

#include <openssl/crypto.h>

#include <sstream>
#include <vector>

namespace lanbeam::crypto {
namespace {

constexpr std::chrono::seconds kFutureSkew{300};

Bytes hash_input(const Bytes& public_der, const Bytes& salt) {
    Bytes input;
    input.reserve(public_der.size() + salt.size());
    input.insert(input.end(), public_der.begin(), public_der.end());
    input.insert(input.end(), salt.begin(), salt.end());
    return input;
}

std::vector<std::string> split(const std::string& value, char separator) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(value);
    while (std::getline(stream, part, separator)) {
        parts.push_back(part);
    }
    if (!value.empty() && value.back() == separator) {
        parts.emplace_back();
    }
    return parts;
}

Result<void> reject(const std::string& reason) {
    return Err<void>(ErrorKind::TransportFatal, "token rejected: " + reason);
}

} // namespace

Result<Bytes> generate_nonce() {
    return random_bytes(kNonceSize);
}

bool validate_nonce(const Bytes& nonce) noexcept {
    return nonce.size() >= kMinNonceSize && nonce.size() <= kMaxNonceSize;
}

Bytes combine_nonces(const Bytes& initiator_nonce, const Bytes& responder_nonce) {
    Bytes combined;
    combined.reserve(initiator_nonce.size() + responder_nonce.size());
    combined.insert(combined.end(), initiator_nonce.begin(), initiator_nonce.end());
    combined.insert(combined.end(), responder_nonce.begin(), responder_nonce.end());
    return combined;
}

Result<ParsedToken> parse_token(const std::string& token) {
    const auto parts = split(token, '.');
    if (parts.size() != 5) {
        return Err<ParsedToken>(ErrorKind::TransportFatal, "token must have 5 fields");
    }

    ParsedToken parsed;
    parsed.hash_method = parts[0];
    parsed.sign_method = parts[3];

    auto hash = codec::base64url_decode(parts[1]);
    auto salt = codec::base64url_decode(parts[2]);
    auto signature = codec::base64url_decode(parts[4]);
    if (hash.is_error() || salt.is_error() || signature.is_error()) {
        return Err<ParsedToken>(ErrorKind::TransportFatal, "token field is not base64url");
    }
    parsed.hash = std::move(hash.value());
    parsed.salt = std::move(salt.value());
    parsed.signature = std::move(signature.value());
    return Ok(std::move(parsed));
}

Result<std::string> create_token(const KeyPair& key, const Bytes& salt) {
    const Sha256Digest digest = sha256(hash_input(key.public_key_der(), salt));
    auto signature = key.sign(digest.data(), digest.size());
    if (signature.is_error()) {
        return Err<std::string>(signature.error());
    }

    std::string token;
    token.append(kHashMethod).append(".");
    token.append(codec::base64url_encode(digest.data(), digest.size())).append(".");
    token.append(codec::base64url_encode(salt)).append(".");
    token.append(kSignMethod).append(".");
    token.append(codec::base64url_encode(signature.value()));
    return Ok(std::move(token));
}

Result<std::string> create_timestamp_token(const KeyPair& key, std::chrono::system_clock::time_point now) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    auto value = static_cast<std::uint64_t>(seconds < 0 ? 0 : seconds);

    Bytes salt(8);
    for (int i = 7; i >= 0; --i) {
        salt[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(value & 0xff);
        value >>= 8;
    }
    return create_token(key, salt);
}

Result<void> verify_token(const std::string& token, const PublicKey& key, const SaltCheck& check_salt) {
    auto parsed = parse_token(token);
    if (parsed.is_error()) {
        return reject(parsed.error().message);
    }
    const ParsedToken& t = parsed.value();

    if (t.hash_method != kHashMethod) {
        return reject("unsupported hash method '" + t.hash_method + "'");
    }
    if (t.sign_method != kSignMethod) {
        return reject("unsupported sign method '" + t.sign_method + "'");
    }

    if (auto salt_ok = check_salt(t.salt); salt_ok.is_error()) {
        return reject(salt_ok.error().message);
    }

    const Sha256Digest digest = sha256(hash_input(key.der(), t.salt));
    if (t.hash.size() != digest.size() || CRYPTO_memcmp(t.hash.data(), digest.data(), digest.size()) != 0) {
        return reject("hash does not match public key and salt");
    }

    if (!key.verify(digest.data(), digest.size(), t.signature)) {
        return reject("signature verification failed");
    }
    return Ok();
}

Result<void> verify_nonce_token(const std::string& token, const PublicKey& key, const Bytes& expected_nonce) {
    return verify_token(token, key, [&expected_nonce](const Bytes& salt) -> Result<void> {
        // Salt is the material of both peers; each nonce was bounded at exchange time
        if (salt.size() < 2 * kMinNonceSize || salt.size() > 2 * kMaxNonceSize) {
            return Err<void>(ErrorKind::TransportFatal, "nonce material length out of range");
        }
        if (salt.size() != expected_nonce.size()
            || CRYPTO_memcmp(salt.data(), expected_nonce.data(), salt.size()) != 0) {
            return Err<void>(ErrorKind::TransportFatal, "nonce does not belong to this session");
        }
        return Ok();
    });
}

Result<void> verify_timestamp_token(const std::string& token,
                                    const PublicKey& key,
                                    std::chrono::seconds freshness,
                                    std::chrono::system_clock::time_point now) {
    return verify_token(token, key, [freshness, now](const Bytes& salt) -> Result<void> {
        if (salt.size() != 8) {
            return Err<void>(ErrorKind::TransportFatal, "timestamp salt must be 8 bytes");
        }
        std::uint64_t issued = 0;
        for (std::uint8_t byte : salt) {
            issued = (issued << 8) | byte;
        }
        const auto now_seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
        const auto issued_seconds = static_cast<long long>(issued);

        if (issued_seconds > now_seconds + kFutureSkew.count()) {
            return Err<void>(ErrorKind::TransportFatal, "timestamp is in the future");
        }
        if (now_seconds - issued_seconds > freshness.count()) {
            return Err<void>(ErrorKind::TransportFatal, "timestamp is older than the freshness window");
        }
        return Ok();
    });
}

Result<std::string> generate_file_token() {
    auto bytes = random_bytes(16);
    if (bytes.is_error()) {
        return Err<std::string>(bytes.error());
    }
    return Ok(codec::base64url_encode(bytes.value()));
}

bool constant_time_equals(const std::string& lhs, const std::string& rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

} // namespace lanbeam::crypto
