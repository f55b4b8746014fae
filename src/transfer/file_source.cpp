#include "lanbeam/transfer/file_source.hpp"
#include "lanbeam/crypto/identity.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <system_error>
#include <unordered_map>

namespace lanbeam::transfer {
namespace fs = std::filesystem;

namespace {

std::time_t to_time_t(fs::file_time_type time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<system_clock::duration>(
        time - fs::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(system_time);
}

Result<std::string> hash_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::InvalidArgument, "failed to open " + path.string());
    }
    crypto::Sha256Hasher hasher;
    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        hasher.update(reinterpret_cast<const std::uint8_t*>(buffer), static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return Err<std::string>(ErrorKind::InvalidArgument, "failed to read " + path.string());
    }
    return Ok(hasher.finish_hex());
}

} // namespace

std::string guess_mime_type(const fs::path& path) {
    static const std::unordered_map<std::string, std::string> types {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".apk", "application/vnd.android.package-archive"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".heic", "image/heic"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
        {".mp4", "video/mp4"},
        {".mov", "video/quicktime"},
        {".webm", "video/webm"},
    };

    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto it = types.find(extension);
    return it != types.end() ? it->second : "application/octet-stream";
}

std::string format_iso8601(std::time_t time) {
    std::tm utc{};
    gmtime_r(&time, &utc);
    char buffer[32];
    const std::size_t length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S.000Z", &utc);
    return std::string(buffer, length);
}

Result<FileDescriptor> describe_file(const fs::path& path, std::string id, bool compute_sha256) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<FileDescriptor>(ErrorKind::InvalidArgument, "not a regular file: " + path.string());
    }

    FileDescriptor descriptor;
    descriptor.id = std::move(id);
    descriptor.file_name = path.filename().string();
    descriptor.mime_type = guess_mime_type(path);

    descriptor.size = fs::file_size(path, ec);
    if (ec) {
        return Err<FileDescriptor>(ErrorKind::InvalidArgument, "cannot stat " + path.string() + ": " + ec.message());
    }
    const auto write_time = fs::last_write_time(path, ec);
    if (!ec) {
        descriptor.metadata.modified = format_iso8601(to_time_t(write_time));
    }

    if (compute_sha256) {
        auto digest = hash_file(path);
        if (digest.is_error()) {
            return Err<FileDescriptor>(digest.error());
        }
        descriptor.sha256 = std::move(digest.value());
    }
    return Ok(std::move(descriptor));
}

// ──────────────────────────────────────────────────────────
// MemoryFileSource
// ──────────────────────────────────────────────────────────

MemoryFileSource::MemoryFileSource(FileDescriptor descriptor, Bytes content)
    : descriptor_(std::move(descriptor)), content_(std::move(content)) {}

std::unique_ptr<MemoryFileSource> MemoryFileSource::from_bytes(std::string id, std::string file_name, Bytes content) {
    FileDescriptor descriptor;
    descriptor.id = std::move(id);
    descriptor.mime_type = guess_mime_type(file_name);
    descriptor.file_name = std::move(file_name);
    descriptor.size = content.size();
    const auto digest = crypto::sha256(content);
    descriptor.sha256 = crypto::to_hex(digest.data(), digest.size());
    return std::make_unique<MemoryFileSource>(std::move(descriptor), std::move(content));
}

Result<std::size_t> MemoryFileSource::read(std::uint8_t* buffer, std::size_t capacity) {
    const std::size_t count = std::min(capacity, content_.size() - offset_);
    if (count > 0) {
        std::memcpy(buffer, content_.data() + offset_, count);
        offset_ += count;
    }
    return Ok(count);
}

// ──────────────────────────────────────────────────────────
// DiskFileSource
// ──────────────────────────────────────────────────────────

DiskFileSource::DiskFileSource(FileDescriptor descriptor, fs::path path, std::ifstream input)
    : descriptor_(std::move(descriptor)), path_(std::move(path)), input_(std::move(input)) {}

Result<std::unique_ptr<DiskFileSource>> DiskFileSource::open(const fs::path& path, std::string id, bool compute_sha256) {
    auto descriptor = describe_file(path, std::move(id), compute_sha256);
    if (descriptor.is_error()) {
        return Err<std::unique_ptr<DiskFileSource>>(descriptor.error());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::unique_ptr<DiskFileSource>>(ErrorKind::InvalidArgument, "failed to open " + path.string());
    }
    return Ok(std::unique_ptr<DiskFileSource>(new DiskFileSource(std::move(descriptor.value()), path, std::move(input))));
}

Result<std::size_t> DiskFileSource::read(std::uint8_t* buffer, std::size_t capacity) {
    input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(capacity));
    if (input_.bad()) {
        return Err<std::size_t>(ErrorKind::SessionRecoverable, "read failed for " + path_.string());
    }
    return Ok(static_cast<std::size_t>(input_.gcount()));
}

} // namespace lanbeam::transfer
