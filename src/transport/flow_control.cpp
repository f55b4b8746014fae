#include "lanbeam/transport/flow_control.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace lanbeam::transport {

Result<void> wait_for_capacity(const DataChannel& channel,
                               std::size_t high_water_mark,
                               std::chrono::milliseconds poll_interval) {
    bool logged = false;
    while (channel.buffered_amount() > high_water_mark) {
        if (!channel.is_open()) {
            return Err<void>(ErrorKind::TransportFatal, "data channel closed while waiting for send capacity");
        }
        if (!logged) {
            spdlog::debug("[FlowControl] buffered={} above high_water={}, pausing",
                          channel.buffered_amount(), high_water_mark);
            logged = true;
        }
        std::this_thread::sleep_for(poll_interval);
    }
    return Ok();
}

Result<void> drain(const DataChannel& channel, std::chrono::milliseconds poll_interval) {
    return wait_for_capacity(channel, 0, poll_interval);
}

} // namespace lanbeam::transport
