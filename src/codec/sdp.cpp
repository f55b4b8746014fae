#include "lanbeam/codec/sdp.hpp"
#include "lanbeam/codec/base64.hpp"

#include <zlib.h>

#include <array>

namespace lanbeam::codec {

Result<std::string> encode_sdp(const std::string& sdp) {
    uLongf compressed_size = compressBound(static_cast<uLong>(sdp.size()));
    Bytes compressed(compressed_size);

    const int rc = compress2(compressed.data(),
                             &compressed_size,
                             reinterpret_cast<const Bytef*>(sdp.data()),
                             static_cast<uLong>(sdp.size()),
                             Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK) {
        return Err<std::string>(ErrorKind::InvalidArgument, "deflate failed: " + std::to_string(rc));
    }
    compressed.resize(compressed_size);
    return Ok(base64url_encode(compressed));
}

Result<std::string> decode_sdp(const std::string& encoded) {
    auto compressed = base64url_decode(encoded);
    if (compressed.is_error()) {
        return Err<std::string>(compressed.error());
    }
    const Bytes& input = compressed.value();

    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        return Err<std::string>(ErrorKind::InvalidArgument, "inflateInit failed");
    }

    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());

    std::string output;
    std::array<char, 16 * 1024> buffer{};
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.avail_out = static_cast<uInt>(buffer.size());

        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&stream);
            return Err<std::string>(ErrorKind::InvalidArgument, "inflate failed: " + std::to_string(rc));
        }
        output.append(buffer.data(), buffer.size() - stream.avail_out);

        if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            return Err<std::string>(ErrorKind::InvalidArgument, "session description is truncated");
        }
    }

    inflateEnd(&stream);
    return Ok(std::move(output));
}

} // namespace lanbeam::codec
