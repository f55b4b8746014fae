#include "lanbeam/crypto/identity.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/x509.h>

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace lanbeam::crypto {
namespace {

constexpr std::size_t kEd25519SignatureSize = 64;

std::string openssl_error(const std::string& what) {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return what;
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return what + ": " + buffer;
}

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

Result<Bytes> export_public_der(EVP_PKEY* key) {
    const int length = i2d_PUBKEY(key, nullptr);
    if (length <= 0) {
        return Err<Bytes>(ErrorKind::TransportFatal, openssl_error("i2d_PUBKEY failed"));
    }
    Bytes der(static_cast<std::size_t>(length));
    unsigned char* out = der.data();
    if (i2d_PUBKEY(key, &out) != length) {
        return Err<Bytes>(ErrorKind::TransportFatal, openssl_error("i2d_PUBKEY failed"));
    }
    return Ok(std::move(der));
}

} // namespace

void PkeyDeleter::operator()(EVP_PKEY* key) const noexcept {
    EVP_PKEY_free(key);
}

// ──────────────────────────────────────────────────────────
// PublicKey
// ──────────────────────────────────────────────────────────

PublicKey::PublicKey(std::shared_ptr<EVP_PKEY> key, Bytes der)
    : key_(std::move(key)), der_(std::move(der)) {}

Result<PublicKey> PublicKey::from_der(const Bytes& der) {
    if (der.empty() || der.size() > static_cast<std::size_t>(std::numeric_limits<long>::max())) {
        return Err<PublicKey>(ErrorKind::TransportFatal, "public key is empty");
    }
    const unsigned char* in = der.data();
    EVP_PKEY* raw = d2i_PUBKEY(nullptr, &in, static_cast<long>(der.size()));
    if (raw == nullptr) {
        return Err<PublicKey>(ErrorKind::TransportFatal, openssl_error("public key is not valid DER"));
    }
    std::shared_ptr<EVP_PKEY> key(raw, PkeyDeleter{});

    if (EVP_PKEY_id(key.get()) != EVP_PKEY_ED25519) {
        return Err<PublicKey>(ErrorKind::TransportFatal, "public key is not Ed25519");
    }
    if (in != der.data() + der.size()) {
        return Err<PublicKey>(ErrorKind::TransportFatal, "public key has trailing bytes");
    }
    return Ok(PublicKey(std::move(key), der));
}

bool PublicKey::verify(const std::uint8_t* message, std::size_t size, const Bytes& signature) const {
    if (signature.size() != kEd25519SignatureSize) {
        return false;
    }
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message, size) == 1;
}

// ──────────────────────────────────────────────────────────
// KeyPair
// ──────────────────────────────────────────────────────────

KeyPair::KeyPair(PkeyPtr key, Bytes public_der)
    : key_(std::move(key)), public_der_(std::move(public_der)) {}

Result<KeyPair> KeyPair::generate() {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), &EVP_PKEY_CTX_free);
    if (!ctx) {
        return Err<KeyPair>(ErrorKind::TransportFatal, openssl_error("EVP_PKEY_CTX_new_id failed"));
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen_init(ctx.get()) != 1 || EVP_PKEY_keygen(ctx.get(), &raw) != 1 || raw == nullptr) {
        return Err<KeyPair>(ErrorKind::TransportFatal, openssl_error("Ed25519 keygen failed"));
    }
    PkeyPtr key(raw);

    auto der = export_public_der(key.get());
    if (der.is_error()) {
        return Err<KeyPair>(der.error());
    }
    return Ok(KeyPair(std::move(key), std::move(der.value())));
}

Result<PublicKey> KeyPair::public_key() const {
    return PublicKey::from_der(public_der_);
}

Result<Bytes> KeyPair::sign(const std::uint8_t* message, std::size_t size) const {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Err<Bytes>(ErrorKind::TransportFatal, "EVP_MD_CTX_new failed");
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
        return Err<Bytes>(ErrorKind::TransportFatal, openssl_error("EVP_DigestSignInit failed"));
    }

    Bytes signature(kEd25519SignatureSize);
    std::size_t signature_size = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size, message, size) != 1
        || signature_size != kEd25519SignatureSize) {
        return Err<Bytes>(ErrorKind::TransportFatal, openssl_error("Ed25519 signing failed"));
    }
    return Ok(std::move(signature));
}

// ──────────────────────────────────────────────────────────
// Hashing and randomness
// ──────────────────────────────────────────────────────────

Sha256Digest sha256(const std::uint8_t* data, std::size_t size) {
    Sha256Digest digest{};
    unsigned int digest_size = 0;
    if (EVP_Digest(data, size, digest.data(), &digest_size, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(openssl_error("EVP_Digest(sha256) failed"));
    }
    return digest;
}

Sha256Digest sha256(const Bytes& data) {
    return sha256(data.data(), data.size());
}

struct Sha256Hasher::Impl {
    MdCtxPtr ctx{EVP_MD_CTX_new()};
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(openssl_error("EVP_DigestInit_ex(sha256) failed"));
    }
}

Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::update(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data, size) != 1) {
        throw std::runtime_error(openssl_error("EVP_DigestUpdate failed"));
    }
}

std::string Sha256Hasher::finish_hex() {
    Sha256Digest digest{};
    unsigned int digest_size = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &digest_size) != 1) {
        throw std::runtime_error(openssl_error("EVP_DigestFinal_ex failed"));
    }
    return to_hex(digest.data(), digest_size);
}

std::string to_hex(const std::uint8_t* data, std::size_t size) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

Result<Bytes> random_bytes(std::size_t count) {
    Bytes out(count);
    if (count > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return Err<Bytes>(ErrorKind::InvalidArgument, "random_bytes request too large");
    }
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        return Err<Bytes>(ErrorKind::TransportFatal, openssl_error("RAND_bytes failed"));
    }
    return Ok(std::move(out));
}

} // namespace lanbeam::crypto
