#include "lanbeam/core/config.hpp"
#include "lanbeam/crypto/identity.hpp"
#include "lanbeam/events/components.hpp"
#include "lanbeam/events/event_bus.hpp"
#include "lanbeam/events/events.hpp"
#include "lanbeam/session/orchestrator.hpp"
#include "lanbeam/signaling/loopback_relay.hpp"
#include "lanbeam/transfer/file_sink.hpp"
#include "lanbeam/transfer/file_source.hpp"
#include "lanbeam/transport/memory_transport.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using lanbeam::session::SessionOrchestrator;
using lanbeam::signaling::IncomingOffer;
using lanbeam::transfer::FileSource;

namespace {

void print_usage() {
    std::cout << "Usage: lanbeam_loopback_demo [--pin PIN] [--pairing] [--block-size BYTES] FILE...\n";
}

lanbeam::PeerIdentity make_peer(const std::string& id, const std::string& alias) {
    lanbeam::PeerIdentity peer;
    peer.id = id;
    peer.info.alias = alias;
    peer.info.protocol_version = lanbeam::kProtocolVersion;
    peer.info.device_type = lanbeam::DeviceType::Headless;
    return peer;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    lanbeam::ClientConfig receiver_config;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--pin" && i + 1 < argc) {
            receiver_config.pin = std::string(argv[++i]);
        } else if (arg == "--pairing") {
            receiver_config.require_pairing = true;
        } else if (arg == "--block-size" && i + 1 < argc) {
            receiver_config.limits.block_size = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else {
            paths.push_back(arg);
        }
    }

    if (paths.empty()) {
        print_usage();
        return 1;
    }
    if (auto valid = lanbeam::validate_config(receiver_config); valid.is_error()) {
        spdlog::error("Invalid configuration: {}", valid.error().message);
        return 1;
    }

    std::vector<std::unique_ptr<FileSource>> files;
    for (std::size_t i = 0; i < paths.size(); ++i) {
        auto source = lanbeam::transfer::DiskFileSource::open(paths[i], "file-" + std::to_string(i));
        if (source.is_error()) {
            spdlog::error("Cannot offer {}: {}", paths[i], source.error().message);
            return 1;
        }
        files.push_back(std::move(source.value()));
    }

    auto sender_key = lanbeam::crypto::KeyPair::generate();
    auto receiver_key = lanbeam::crypto::KeyPair::generate();
    if (sender_key.is_error() || receiver_key.is_error()) {
        spdlog::error("Failed to generate identities");
        return 1;
    }

    lanbeam::events::EventBus event_bus;
    lanbeam::events::LoggerComponent logger(event_bus);
    lanbeam::events::MetricsComponent metrics(event_bus);

    event_bus.subscribe<lanbeam::events::FileProgressEvent>([](const lanbeam::events::FileProgressEvent& e) {
        const double percent = e.total == 0 ? 100.0 : 100.0 * static_cast<double>(e.bytes_transferred) / e.total;
        spdlog::info("{} {:>6.1f}% ({}/{})", e.file_id, percent, e.bytes_transferred, e.total);
    });

    lanbeam::transport::MemoryTransportHub hub;
    lanbeam::signaling::LoopbackRelay relay;
    auto sender_endpoint = relay.join(make_peer("sender", "loopback-sender"));
    auto receiver_endpoint = relay.join(make_peer("receiver", "loopback-receiver"));

    auto sink = std::make_shared<lanbeam::transfer::MemoryFileSink>();

    auto receiver_options = lanbeam::session::make_orchestrator_options(receiver_config);
    receiver_options.sink = sink;
    receiver_options.select_files = lanbeam::transfer::accept_all;
    receiver_options.handshake.pairing_decision = [](const lanbeam::session::PairingRequest&) { return true; };

    lanbeam::ClientConfig sender_config;
    sender_config.limits = receiver_config.limits;
    auto sender_options = lanbeam::session::make_orchestrator_options(sender_config);
    sender_options.handshake.pairing_decision = [](const lanbeam::session::PairingRequest& request) {
        spdlog::info("Pairing with {}", request.fingerprint);
        return true;
    };
    const auto pin = receiver_config.pin;
    sender_options.handshake.pin_prompt = [pin](const lanbeam::session::PinPrompt& prompt) {
        spdlog::info("PIN requested (attempt {})", prompt.attempt);
        return pin;
    };

    SessionOrchestrator receiver(receiver_key.value(), hub, *receiver_endpoint, receiver_options, event_bus);
    SessionOrchestrator sender(sender_key.value(), hub, *sender_endpoint, sender_options, event_bus);

    receiver_endpoint->set_offer_handler([&receiver](const IncomingOffer& offer) {
        auto accepted = receiver.handle_offer(offer);
        if (accepted.is_error()) {
            spdlog::warn("Offer {} not accepted: {}", offer.session_id, accepted.error().message);
        }
    });

    auto result = sender.send_files("receiver", std::move(files));
    receiver.wait_idle();

    if (result.is_error()) {
        spdlog::error("Transfer failed: {}", result.error().describe());
        metrics.print_stats();
        return 1;
    }

    const auto& totals = result.value();
    spdlog::info("Sent {}/{} bytes, {} finished, {} failed", totals.curr, totals.total, totals.finished, totals.failed);
    for (const auto& id : sink->completed_ids()) {
        auto content = sink->completed(id);
        spdlog::info("  received {} ({} bytes)", id, content ? content->size() : 0);
    }
    metrics.print_stats();
    return totals.failed == 0 ? 0 : 1;
}
