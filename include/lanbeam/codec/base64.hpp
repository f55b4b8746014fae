#pragma once

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"

#include <string>
#include <string_view>

namespace lanbeam::codec {

/**
 * @brief URL-safe base64 without padding ('-' and '_', no '=')
 */
std::string base64url_encode(const std::uint8_t* data, std::size_t size);
std::string base64url_encode(const Bytes& data);
std::string base64url_encode(std::string_view text);

/**
 * @brief Accepts input with or without '=' padding; rejects characters outside the URL-safe alphabet
 */
Result<Bytes> base64url_decode(std::string_view encoded);

} // namespace lanbeam::codec
