#pragma once

/**
 * @file file_source.hpp
 * @brief Where outgoing file bytes come from
 *
 * The transfer protocol only sees FileSource. DiskFileSource streams a file
 * from the local filesystem, MemoryFileSource serves a byte buffer (tests and
 * generated content).
 */

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace lanbeam::transfer {

class FileSource {
public:
    virtual ~FileSource() = default;

    [[nodiscard]] virtual const FileDescriptor& descriptor() const = 0;

    /**
     * @brief Copy up to `capacity` bytes into `buffer`
     *
     * RETURNS: bytes copied; 0 means end of stream
     */
    virtual Result<std::size_t> read(std::uint8_t* buffer, std::size_t capacity) = 0;
};

class MemoryFileSource : public FileSource {
public:
    MemoryFileSource(FileDescriptor descriptor, Bytes content);

    /**
     * @brief Descriptor derived from the content (size and sha256 filled in)
     */
    static std::unique_ptr<MemoryFileSource> from_bytes(std::string id, std::string file_name, Bytes content);

    [[nodiscard]] const FileDescriptor& descriptor() const override { return descriptor_; }
    Result<std::size_t> read(std::uint8_t* buffer, std::size_t capacity) override;

private:
    FileDescriptor descriptor_;
    Bytes content_;
    std::size_t offset_ = 0;
};

class DiskFileSource : public FileSource {
public:
    static Result<std::unique_ptr<DiskFileSource>> open(const std::filesystem::path& path,
                                                        std::string id,
                                                        bool compute_sha256 = true);

    [[nodiscard]] const FileDescriptor& descriptor() const override { return descriptor_; }
    Result<std::size_t> read(std::uint8_t* buffer, std::size_t capacity) override;

private:
    DiskFileSource(FileDescriptor descriptor, std::filesystem::path path, std::ifstream input);

    FileDescriptor descriptor_;
    std::filesystem::path path_;
    std::ifstream input_;
};

/**
 * @brief Build a manifest entry from a file on disk
 *
 * Name, size, MIME type from the extension, modification time (ISO-8601 UTC)
 * and, when requested, the SHA-256 of the content.
 */
Result<FileDescriptor> describe_file(const std::filesystem::path& path, std::string id, bool compute_sha256 = true);

std::string guess_mime_type(const std::filesystem::path& path);

std::string format_iso8601(std::time_t time);

} // namespace lanbeam::transfer
