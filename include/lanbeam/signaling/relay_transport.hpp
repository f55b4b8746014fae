#pragma once

/**
 * @file relay_transport.hpp
 * @brief Text-frame connection to the relay server
 *
 * RelayClient only talks to these interfaces. WebSocketRelayTransport is the
 * production implementation (Boost.Beast over plain TCP or TLS); tests
 * substitute scripted fakes.
 */

#include "lanbeam/core/result.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace lanbeam::signaling {

class RelayConnection {
public:
    virtual ~RelayConnection() = default;

    /**
     * @brief Next text frame from the relay
     *
     * BLOCKS: up to `timeout`
     * RETURNS: Ok(nullopt) on timeout; RelayRecoverable once the connection is gone
     */
    virtual Result<std::optional<std::string>> read(std::chrono::milliseconds timeout) = 0;

    virtual Result<void> write(const std::string& text) = 0;

    /**
     * @brief Start closing; pending and future reads fail
     */
    virtual void close() = 0;
};

class RelayTransport {
public:
    virtual ~RelayTransport() = default;

    virtual Result<std::unique_ptr<RelayConnection>> open(const std::string& url) = 0;
};

struct RelayEndpoint {
    bool secure = true;
    std::string host;
    std::string port;
    std::string target; ///< path and query
};

Result<RelayEndpoint> parse_relay_url(const std::string& url);

/**
 * @brief ws:// and wss:// connections through Boost.Beast
 *
 * Each connection runs its own io_context on a dedicated thread. TLS
 * connections verify the server certificate against the system store and
 * the host name.
 */
class WebSocketRelayTransport : public RelayTransport {
public:
    Result<std::unique_ptr<RelayConnection>> open(const std::string& url) override;
};

} // namespace lanbeam::signaling
