#pragma once

/**
 * @file receiver.hpp
 * @brief Receiving side of the transfer protocol
 *
 * Inbound stream after the selection has been sent:
 *   text header {id, token}  -> closes the open file (outcome sent), opens the next
 *   binary                   -> appended to the open file, progress reported per block
 *   text "0"                 -> closes the open file, ends the transfer
 *
 * A header for an unselected id, a wrong token or a second header for the
 * same id is TransportFatal. Size or sha256 mismatches fail only that file.
 */

#include "lanbeam/core/config.hpp"
#include "lanbeam/core/result.hpp"
#include "lanbeam/session/session.hpp"
#include "lanbeam/transfer/file_sink.hpp"
#include "lanbeam/transfer/progress.hpp"
#include "lanbeam/transport/data_channel.hpp"

#include <functional>
#include <string>
#include <vector>

namespace lanbeam::transfer {

/**
 * @brief Picks the accepted subset of a manifest; returns file ids
 */
using SelectFilesFn = std::function<std::vector<std::string>(const std::vector<FileDescriptor>& manifest)>;

/**
 * @brief Selection that accepts every offered file
 */
std::vector<std::string> accept_all(const std::vector<FileDescriptor>& manifest);

Result<ProgressTotals> receive_files(transport::DataChannel& channel,
                                     FileSink& sink,
                                     const SelectFilesFn& select,
                                     const TransferLimits& limits,
                                     session::TransferSession& session,
                                     TransferProgress& progress);

} // namespace lanbeam::transfer
