#pragma once

/**
 * @file sender.hpp
 * @brief File-holder side of the transfer protocol
 *
 * SEQUENCE:
 *   -> manifest (fragments + "0")
 *   <- selection {id -> token} (fragments + "0")
 *   -> header[0]
 *   for each selected file i:
 *       -> blocks of file i        (paused while buffered_amount > high-water)
 *       -> header[i+1] or "0"
 *       <- outcome[i]
 *   drain, caller closes
 */

#include "lanbeam/core/config.hpp"
#include "lanbeam/core/result.hpp"
#include "lanbeam/session/session.hpp"
#include "lanbeam/transfer/file_source.hpp"
#include "lanbeam/transfer/progress.hpp"
#include "lanbeam/transport/data_channel.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace lanbeam::transfer {

/**
 * @brief Regroups arbitrary reads into fixed-size blocks
 *
 * Full blocks are handed to the emitter as soon as they fill up; a shorter
 * remainder stays buffered until flush().
 */
class BlockAccumulator {
public:
    using Emit = std::function<Result<void>(const std::uint8_t* data, std::size_t size)>;

    explicit BlockAccumulator(std::size_t block_size);

    Result<void> push(const std::uint8_t* data, std::size_t size, const Emit& emit);
    Result<void> flush(const Emit& emit);

    [[nodiscard]] std::size_t pending() const noexcept { return buffer_.size(); }

private:
    std::size_t block_size_;
    Bytes buffer_;
};

Result<ProgressTotals> send_files(transport::DataChannel& channel,
                                  std::vector<std::unique_ptr<FileSource>>& files,
                                  const TransferLimits& limits,
                                  session::TransferSession& session,
                                  TransferProgress& progress);

} // namespace lanbeam::transfer
