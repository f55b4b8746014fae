#pragma once

/**
 * @file identity.hpp
 * @brief Ephemeral Ed25519 identity and the OpenSSL primitives around it
 *
 * A KeyPair lives as long as the process (or the test) that created it.
 * Nothing here is ever written to disk.
 */

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"

#include <array>
#include <cstddef>
#include <memory>

typedef struct evp_pkey_st EVP_PKEY;

namespace lanbeam::crypto {

using Sha256Digest = std::array<std::uint8_t, 32>;

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept;
};
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

/**
 * @brief Verification-only half of a peer identity
 */
class PublicKey {
public:
    /**
     * @brief Parse a SubjectPublicKeyInfo DER blob; only Ed25519 keys are accepted
     */
    static Result<PublicKey> from_der(const Bytes& der);

    [[nodiscard]] const Bytes& der() const noexcept { return der_; }

    [[nodiscard]] bool verify(const std::uint8_t* message, std::size_t size, const Bytes& signature) const;

private:
    PublicKey(std::shared_ptr<EVP_PKEY> key, Bytes der);

    std::shared_ptr<EVP_PKEY> key_;
    Bytes der_;
};

class KeyPair {
public:
    static Result<KeyPair> generate();

    KeyPair(KeyPair&&) noexcept = default;
    KeyPair& operator=(KeyPair&&) noexcept = default;
    KeyPair(const KeyPair&) = delete;
    KeyPair& operator=(const KeyPair&) = delete;

    [[nodiscard]] const Bytes& public_key_der() const noexcept { return public_der_; }

    Result<PublicKey> public_key() const;

    Result<Bytes> sign(const std::uint8_t* message, std::size_t size) const;

private:
    KeyPair(PkeyPtr key, Bytes public_der);

    PkeyPtr key_;
    Bytes public_der_;
};

Sha256Digest sha256(const std::uint8_t* data, std::size_t size);
Sha256Digest sha256(const Bytes& data);

/**
 * @brief Incremental SHA-256 for streamed file content
 */
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    void update(const std::uint8_t* data, std::size_t size);

    /**
     * @brief Lowercase hex digest; the hasher must not be updated afterwards
     */
    std::string finish_hex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string to_hex(const std::uint8_t* data, std::size_t size);

/**
 * @brief Bytes from the OpenSSL CSPRNG
 */
Result<Bytes> random_bytes(std::size_t count);

} // namespace lanbeam::crypto
