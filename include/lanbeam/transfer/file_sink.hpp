#pragma once

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanbeam::transfer {

/**
 * @brief Destination of received file bytes
 *
 * Called from the session thread in this order per file:
 * begin -> write* -> finish | abort. Errors returned from a sink fail that
 * one file, not the session.
 */
class FileSink {
public:
    virtual ~FileSink() = default;

    virtual Result<void> begin(const FileDescriptor& file) = 0;
    virtual Result<void> write(const std::string& file_id, const std::uint8_t* data, std::size_t size) = 0;
    virtual Result<void> finish(const std::string& file_id) = 0;
    virtual void abort(const std::string& file_id, const std::string& reason) = 0;
};

/**
 * @brief Keeps received files in memory, keyed by file id
 */
class MemoryFileSink : public FileSink {
public:
    Result<void> begin(const FileDescriptor& file) override;
    Result<void> write(const std::string& file_id, const std::uint8_t* data, std::size_t size) override;
    Result<void> finish(const std::string& file_id) override;
    void abort(const std::string& file_id, const std::string& reason) override;

    [[nodiscard]] std::optional<Bytes> completed(const std::string& file_id) const;
    [[nodiscard]] std::vector<std::string> completed_ids() const;
    [[nodiscard]] std::vector<std::string> aborted_ids() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Bytes> open_;
    std::map<std::string, Bytes> completed_;
    std::vector<std::string> aborted_;
};

} // namespace lanbeam::transfer
