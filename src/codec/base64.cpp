#include "lanbeam/codec/base64.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <limits>

namespace lanbeam::codec {
namespace {

bool is_url_safe(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

} // namespace

std::string base64url_encode(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return {};
    }

    std::string encoded(4 * ((size + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                        data,
                                        static_cast<int>(size));
    encoded.resize(static_cast<std::size_t>(written));

    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');
    return encoded;
}

std::string base64url_encode(const Bytes& data) {
    return base64url_encode(data.data(), data.size());
}

std::string base64url_encode(std::string_view text) {
    return base64url_encode(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

Result<Bytes> base64url_decode(std::string_view encoded) {
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.remove_suffix(1);
    }
    if (encoded.empty()) {
        return Ok(Bytes{});
    }
    if (encoded.size() % 4 == 1) {
        return Err<Bytes>(ErrorKind::InvalidArgument, "base64 input has invalid length");
    }
    if (encoded.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() - 3)) {
        return Err<Bytes>(ErrorKind::InvalidArgument, "base64 input too large");
    }

    std::string standard;
    standard.reserve(encoded.size() + 3);
    for (char c : encoded) {
        if (!is_url_safe(c)) {
            return Err<Bytes>(ErrorKind::InvalidArgument, "base64 input contains invalid characters");
        }
        standard.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
    }
    const std::size_t padding = (4 - standard.size() % 4) % 4;
    standard.append(padding, '=');

    Bytes decoded(standard.size() / 4 * 3);
    const int written = EVP_DecodeBlock(decoded.data(),
                                        reinterpret_cast<const unsigned char*>(standard.data()),
                                        static_cast<int>(standard.size()));
    if (written < 0) {
        return Err<Bytes>(ErrorKind::InvalidArgument, "base64 decoding failed");
    }

    // EVP_DecodeBlock counts the zero bytes produced by padding
    decoded.resize(static_cast<std::size_t>(written) - padding);
    return Ok(std::move(decoded));
}

} // namespace lanbeam::codec
