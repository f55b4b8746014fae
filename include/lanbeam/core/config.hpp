#pragma once

/**
 * @file config.hpp
 * @brief Runtime configuration for a lanbeam client
 *
 * Sources, lowest to highest priority:
 * 1. Built-in defaults (below)
 * 2. JSON file (load_config_file)
 * 3. LANBEAM_* environment variables (apply_environment)
 * 4. Command line flags (handled by the executables)
 */

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lanbeam {

inline constexpr const char* kProtocolVersion = "2.3";
inline constexpr std::size_t kDefaultBlockSize = 16 * 1024;
inline constexpr std::size_t kDefaultHighWaterMark = 1024 * 1024;

struct TransferLimits {
    std::size_t block_size = kDefaultBlockSize;
    std::size_t high_water_mark = kDefaultHighWaterMark;
    std::chrono::milliseconds poll_interval{10};
};

struct ClientConfig {
    std::string relay_url = "wss://public.localsend.org/v1/ws";
    std::string alias = "lanbeam";
    std::string protocol_version = kProtocolVersion;
    std::optional<std::string> device_model;
    DeviceType device_type = DeviceType::Headless;

    // Gate imposed on remote peers
    std::optional<std::string> pin;
    std::uint32_t max_pin_attempts = 3;
    bool require_pairing = false;

    TransferLimits limits;

    std::chrono::milliseconds reconnect_backoff{5000};
    std::chrono::milliseconds keepalive_interval{120000};
    std::chrono::seconds token_freshness{3600};
    std::chrono::milliseconds answer_timeout{60000};
    std::chrono::milliseconds open_timeout{30000};

    std::string log_level = "info";
};

/**
 * @brief Check value ranges (sizes > 0, high-water >= block size, ...)
 */
Result<void> validate_config(const ClientConfig& config);

/**
 * @brief Overlay the keys present in a JSON file on top of `base`
 */
Result<ClientConfig> load_config_file(const std::filesystem::path& path, ClientConfig base = {});

/**
 * @brief Overlay a parsed JSON object on top of `base`
 */
Result<ClientConfig> apply_json(const std::string& json_text, ClientConfig base = {});

/**
 * @brief Overlay LANBEAM_RELAY_URL, LANBEAM_ALIAS, LANBEAM_PIN and LANBEAM_LOG_LEVEL
 */
ClientConfig apply_environment(ClientConfig config);

/**
 * @brief Registration info derived from the config; the token is filled in by the caller
 */
ClientInfo make_client_info(const ClientConfig& config, std::string auth_token);

} // namespace lanbeam
