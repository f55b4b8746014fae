#pragma once

/**
 * @file flow_control.hpp
 * @brief Backpressure helpers built on DataChannel::buffered_amount()
 *
 * Neither helper has a wake-up from the channel; both poll at a fixed interval.
 */

#include "lanbeam/core/result.hpp"
#include "lanbeam/transport/data_channel.hpp"

#include <chrono>
#include <cstddef>

namespace lanbeam::transport {

/**
 * @brief Suspend while more than `high_water_mark` bytes are queued locally
 *
 * Fails with TransportFatal if the channel closes while waiting.
 */
Result<void> wait_for_capacity(const DataChannel& channel,
                               std::size_t high_water_mark,
                               std::chrono::milliseconds poll_interval);

/**
 * @brief Suspend until the local send queue is empty (before close)
 */
Result<void> drain(const DataChannel& channel, std::chrono::milliseconds poll_interval);

} // namespace lanbeam::transport
