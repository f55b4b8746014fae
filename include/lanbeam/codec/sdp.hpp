#pragma once

#include "lanbeam/core/result.hpp"

#include <string>

namespace lanbeam::codec {

/**
 * @brief Session description as carried in relay `offer`/`answer` messages
 *
 * encode: UTF-8 text -> zlib deflate -> base64url (no padding)
 * decode: the reverse; corrupt input yields an InvalidArgument error
 */
Result<std::string> encode_sdp(const std::string& sdp);
Result<std::string> decode_sdp(const std::string& encoded);

} // namespace lanbeam::codec
