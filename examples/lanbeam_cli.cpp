#include "lanbeam/core/config.hpp"
#include "lanbeam/crypto/identity.hpp"
#include "lanbeam/crypto/token.hpp"
#include "lanbeam/events/components.hpp"
#include "lanbeam/events/event_bus.hpp"
#include "lanbeam/signaling/relay_client.hpp"
#include "lanbeam/signaling/relay_transport.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}

void print_usage() {
    std::cout << "Usage: lanbeam_cli peers [--config FILE] [--relay URL] [--alias NAME] [--log-level LEVEL]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 2 || std::string(argv[1]) != "peers") {
        print_usage();
        return 1;
    }

    std::optional<std::string> config_path;
    std::optional<std::string> relay_url;
    std::optional<std::string> alias;
    std::optional<std::string> log_level;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-r" || arg == "--relay") && i + 1 < argc) {
            relay_url = argv[++i];
        } else if ((arg == "-a" || arg == "--alias") && i + 1 < argc) {
            alias = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else {
            spdlog::error("Unknown argument: {}", arg);
            print_usage();
            return 1;
        }
    }

    lanbeam::ClientConfig config;
    if (config_path) {
        auto loaded = lanbeam::load_config_file(*config_path);
        if (loaded.is_error()) {
            spdlog::error("Failed to load config: {}", loaded.error().describe());
            return 1;
        }
        config = loaded.value();
    }
    config = lanbeam::apply_environment(std::move(config));
    if (relay_url) config.relay_url = *relay_url;
    if (alias) config.alias = *alias;
    if (log_level) config.log_level = *log_level;

    if (auto valid = lanbeam::validate_config(config); valid.is_error()) {
        spdlog::error("Invalid configuration: {}", valid.error().message);
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    auto key = lanbeam::crypto::KeyPair::generate();
    if (key.is_error()) {
        spdlog::error("Failed to generate identity: {}", key.error().message);
        return 1;
    }
    const lanbeam::crypto::KeyPair& identity = key.value();

    lanbeam::events::EventBus event_bus;
    lanbeam::events::LoggerComponent logger(event_bus);
    lanbeam::events::MetricsComponent metrics(event_bus);

    lanbeam::signaling::RelayClientOptions options;
    options.url = config.relay_url;
    options.reconnect_backoff = config.reconnect_backoff;
    options.keepalive_interval = config.keepalive_interval;
    options.token_provider = [&identity]() {
        return lanbeam::crypto::create_timestamp_token(identity);
    };

    lanbeam::signaling::RelayClient relay(
        std::make_shared<lanbeam::signaling::WebSocketRelayTransport>(),
        options,
        lanbeam::make_client_info(config, ""),
        &event_bus);
    relay.set_offer_handler([](const lanbeam::signaling::IncomingOffer& offer) {
        spdlog::warn("Ignoring offer session={} from={}: direct transport not available",
                     offer.session_id, offer.peer.info.alias);
    });

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    spdlog::info("Connecting to {} as '{}' (Ctrl+C to stop)", config.relay_url, config.alias);
    relay.connect();

    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutting down...");
    for (const auto& peer : relay.current_roster()) {
        spdlog::info("  {} {} ({})", peer.id, peer.info.alias,
                     peer.info.device_type ? lanbeam::to_string(*peer.info.device_type) : "unknown");
    }
    relay.close();
    metrics.print_stats();
    return 0;
}
