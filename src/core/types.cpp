#include "lanbeam/core/types.hpp"
#include "lanbeam/core/result.hpp"

#include <nlohmann/json.hpp>

namespace lanbeam {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::TransportFatal: return "transport-fatal";
        case ErrorKind::SessionRecoverable: return "session-recoverable";
        case ErrorKind::RelayRecoverable: return "relay-recoverable";
        case ErrorKind::UserDeclined: return "user-declined";
        case ErrorKind::InvalidArgument: return "invalid-argument";
        case ErrorKind::Busy: return "busy";
    }
    return "unknown";
}

const char* to_string(DeviceType type) noexcept {
    switch (type) {
        case DeviceType::Mobile: return "mobile";
        case DeviceType::Desktop: return "desktop";
        case DeviceType::Web: return "web";
        case DeviceType::Headless: return "headless";
        case DeviceType::Server: return "server";
    }
    return "web";
}

std::optional<DeviceType> device_type_from_string(const std::string& value) {
    if (value == "mobile") return DeviceType::Mobile;
    if (value == "desktop") return DeviceType::Desktop;
    if (value == "web") return DeviceType::Web;
    if (value == "headless") return DeviceType::Headless;
    if (value == "server") return DeviceType::Server;
    return std::nullopt;
}

const char* to_string(FileStatus status) noexcept {
    switch (status) {
        case FileStatus::Pending: return "pending";
        case FileStatus::Skipped: return "skipped";
        case FileStatus::Sending: return "sending";
        case FileStatus::Receiving: return "receiving";
        case FileStatus::Finished: return "finished";
        case FileStatus::Error: return "error";
    }
    return "error";
}

const char* to_string(SessionRole role) noexcept {
    switch (role) {
        case SessionRole::Sender: return "sender";
        case SessionRole::Receiver: return "receiver";
    }
    return "sender";
}

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Negotiating: return "negotiating";
        case SessionState::Authenticating: return "authenticating";
        case SessionState::PinPending: return "pin-pending";
        case SessionState::ManifestSent: return "manifest-sent";
        case SessionState::ManifestReceived: return "manifest-received";
        case SessionState::Transferring: return "transferring";
        case SessionState::Completed: return "completed";
        case SessionState::Aborted: return "aborted";
    }
    return "aborted";
}

void to_json(nlohmann::json& j, const ClientInfo& info) {
    j = nlohmann::json{
        {"alias", info.alias},
        {"version", info.protocol_version},
        {"fingerprint", info.auth_token},
    };
    if (info.device_model) {
        j["deviceModel"] = *info.device_model;
    }
    if (info.device_type) {
        j["deviceType"] = to_string(*info.device_type);
    }
}

void from_json(const nlohmann::json& j, ClientInfo& info) {
    info.alias = j.at("alias").get<std::string>();
    info.protocol_version = j.value("version", std::string{});
    // "fingerprint" on the wire; "token" is accepted as well
    info.auth_token = j.contains("fingerprint") ? j.value("fingerprint", std::string{})
                                                : j.value("token", std::string{});

    info.device_model.reset();
    if (auto it = j.find("deviceModel"); it != j.end() && it->is_string()) {
        info.device_model = it->get<std::string>();
    }

    // Unknown device types are tolerated, newer peers may add some
    info.device_type.reset();
    if (auto it = j.find("deviceType"); it != j.end() && it->is_string()) {
        info.device_type = device_type_from_string(it->get<std::string>());
    }
}

void to_json(nlohmann::json& j, const PeerIdentity& peer) {
    to_json(j, peer.info);
    j["id"] = peer.id;
}

void from_json(const nlohmann::json& j, PeerIdentity& peer) {
    peer.id = j.at("id").get<std::string>();
    from_json(j, peer.info);
}

void to_json(nlohmann::json& j, const FileDescriptor& file) {
    j = nlohmann::json{
        {"id", file.id},
        {"fileName", file.file_name},
        {"size", file.size},
        {"fileType", file.mime_type},
    };
    if (file.sha256) {
        j["sha256"] = *file.sha256;
    }

    nlohmann::json metadata = nlohmann::json::object();
    if (file.metadata.modified) {
        metadata["modified"] = *file.metadata.modified;
    }
    if (file.metadata.accessed) {
        metadata["accessed"] = *file.metadata.accessed;
    }
    if (!metadata.empty()) {
        j["metadata"] = std::move(metadata);
    }
}

void from_json(const nlohmann::json& j, FileDescriptor& file) {
    file.id = j.at("id").get<std::string>();
    file.file_name = j.at("fileName").get<std::string>();
    file.size = j.at("size").get<std::uint64_t>();
    file.mime_type = j.value("fileType", std::string("application/octet-stream"));

    file.sha256.reset();
    if (auto it = j.find("sha256"); it != j.end() && it->is_string()) {
        file.sha256 = it->get<std::string>();
    }

    file.metadata = FileMetadata{};
    if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        if (auto m = it->find("modified"); m != it->end() && m->is_string()) {
            file.metadata.modified = m->get<std::string>();
        }
        if (auto a = it->find("accessed"); a != it->end() && a->is_string()) {
            file.metadata.accessed = a->get<std::string>();
        }
    }
}

} // namespace lanbeam
