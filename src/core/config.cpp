#include "lanbeam/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace lanbeam {
namespace {

using json = nlohmann::json;

template<typename Duration>
void read_duration(const json& j, const char* key, Duration& target) {
    if (auto it = j.find(key); it != j.end()) {
        target = Duration(it->get<typename Duration::rep>());
    }
}

template<typename T>
void read_value(const json& j, const char* key, T& target) {
    if (auto it = j.find(key); it != j.end()) {
        target = it->get<T>();
    }
}

std::optional<std::string> read_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

Result<void> validate_config(const ClientConfig& config) {
    if (config.relay_url.rfind("ws://", 0) != 0 && config.relay_url.rfind("wss://", 0) != 0) {
        return Err<void>(ErrorKind::InvalidArgument, "relay_url must start with ws:// or wss://");
    }
    if (config.alias.empty()) {
        return Err<void>(ErrorKind::InvalidArgument, "alias must not be empty");
    }
    if (config.limits.block_size == 0) {
        return Err<void>(ErrorKind::InvalidArgument, "block_size must be > 0");
    }
    if (config.limits.high_water_mark < config.limits.block_size) {
        return Err<void>(ErrorKind::InvalidArgument, "high_water_mark must be >= block_size");
    }
    if (config.limits.poll_interval.count() <= 0) {
        return Err<void>(ErrorKind::InvalidArgument, "poll_interval_ms must be > 0");
    }
    if (config.pin && config.pin->empty()) {
        return Err<void>(ErrorKind::InvalidArgument, "pin must not be empty when set");
    }
    if (config.max_pin_attempts == 0) {
        return Err<void>(ErrorKind::InvalidArgument, "max_pin_attempts must be > 0");
    }
    if (config.reconnect_backoff.count() < 0 || config.keepalive_interval.count() <= 0) {
        return Err<void>(ErrorKind::InvalidArgument, "relay timings must be positive");
    }
    return Ok();
}

Result<ClientConfig> apply_json(const std::string& json_text, ClientConfig base) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Err<ClientConfig>(ErrorKind::InvalidArgument, std::string("config is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        return Err<ClientConfig>(ErrorKind::InvalidArgument, "config root must be an object");
    }

    try {
        read_value(j, "relay_url", base.relay_url);
        read_value(j, "alias", base.alias);
        read_value(j, "protocol_version", base.protocol_version);
        if (auto it = j.find("device_model"); it != j.end()) {
            base.device_model = it->get<std::string>();
        }
        if (auto it = j.find("device_type"); it != j.end()) {
            auto type = device_type_from_string(it->get<std::string>());
            if (!type) {
                return Err<ClientConfig>(ErrorKind::InvalidArgument,
                                         "unknown device_type: " + it->get<std::string>());
            }
            base.device_type = *type;
        }
        if (auto it = j.find("pin"); it != j.end()) {
            if (it->is_null()) {
                base.pin.reset();
            } else {
                base.pin = it->get<std::string>();
            }
        }
        read_value(j, "max_pin_attempts", base.max_pin_attempts);
        read_value(j, "require_pairing", base.require_pairing);
        read_value(j, "block_size", base.limits.block_size);
        read_value(j, "high_water_mark", base.limits.high_water_mark);
        read_duration(j, "poll_interval_ms", base.limits.poll_interval);
        read_duration(j, "reconnect_backoff_ms", base.reconnect_backoff);
        read_duration(j, "keepalive_interval_ms", base.keepalive_interval);
        read_duration(j, "token_freshness_s", base.token_freshness);
        read_duration(j, "answer_timeout_ms", base.answer_timeout);
        read_duration(j, "open_timeout_ms", base.open_timeout);
        read_value(j, "log_level", base.log_level);
    } catch (const json::exception& e) {
        return Err<ClientConfig>(ErrorKind::InvalidArgument, std::string("config value has wrong type: ") + e.what());
    }

    if (auto valid = validate_config(base); valid.is_error()) {
        return Err<ClientConfig>(valid.error());
    }
    return Ok(std::move(base));
}

Result<ClientConfig> load_config_file(const std::filesystem::path& path, ClientConfig base) {
    std::ifstream input(path);
    if (!input) {
        return Err<ClientConfig>(ErrorKind::InvalidArgument, "failed to open config file: " + path.string());
    }
    std::ostringstream content;
    content << input.rdbuf();
    spdlog::debug("[Config] loading {}", path.string());
    return apply_json(content.str(), std::move(base));
}

ClientConfig apply_environment(ClientConfig config) {
    if (auto url = read_env("LANBEAM_RELAY_URL")) {
        config.relay_url = *url;
    }
    if (auto alias = read_env("LANBEAM_ALIAS")) {
        config.alias = *alias;
    }
    if (auto pin = read_env("LANBEAM_PIN")) {
        config.pin = *pin;
    }
    if (auto level = read_env("LANBEAM_LOG_LEVEL")) {
        config.log_level = *level;
    }
    return config;
}

ClientInfo make_client_info(const ClientConfig& config, std::string auth_token) {
    ClientInfo info;
    info.alias = config.alias;
    info.protocol_version = config.protocol_version;
    info.device_model = config.device_model;
    info.device_type = config.device_type;
    info.auth_token = std::move(auth_token);
    return info;
}

} // namespace lanbeam
