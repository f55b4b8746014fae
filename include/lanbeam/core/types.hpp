#pragma once

/**
 * @file types.hpp
 * @brief Data model shared by the relay client, the handshake and the transfer protocol
 *
 * PeerIdentity     -> one entry of the relay roster
 * FileDescriptor   -> one entry of a transfer manifest
 * FileTransferState-> per-file progress inside one transfer session
 *
 * JSON field names follow the wire protocol (camelCase), C++ members use snake_case.
 */

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanbeam {

using Bytes = std::vector<std::uint8_t>;

enum class DeviceType {
    Mobile,
    Desktop,
    Web,
    Headless,
    Server
};

const char* to_string(DeviceType type) noexcept;
std::optional<DeviceType> device_type_from_string(const std::string& value);

/**
 * @brief Information a client registers with the relay (everything but the id)
 */
struct ClientInfo {
    std::string alias;
    std::string protocol_version;
    std::optional<std::string> device_model;
    std::optional<DeviceType> device_type;
    std::string auth_token; ///< ClientToken salted with the registration timestamp
};

/**
 * @brief A peer as seen through the relay roster
 *
 * The relay assigns `id` and is the sole authority for its uniqueness.
 */
struct PeerIdentity {
    std::string id;
    ClientInfo info;
};

struct FileMetadata {
    std::optional<std::string> modified; ///< ISO-8601 UTC
    std::optional<std::string> accessed;
};

/**
 * @brief One file offered in a manifest
 *
 * `id` is the join key between the manifest, the per-file token and the chunk stream.
 */
struct FileDescriptor {
    std::string id;
    std::string file_name;
    std::uint64_t size = 0;
    std::string mime_type;
    std::optional<std::string> sha256; ///< lowercase hex
    FileMetadata metadata;
};

enum class FileStatus {
    Pending,
    Skipped,
    Sending,
    Receiving,
    Finished,
    Error
};

const char* to_string(FileStatus status) noexcept;

struct FileTransferState {
    std::string id;
    std::string file_name;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total = 0;
    FileStatus status = FileStatus::Pending;
    std::optional<std::string> error;
};

enum class SessionRole {
    Sender,
    Receiver
};

/**
 * @brief Lifecycle of one direct-transport session
 *
 * Negotiating -> Authenticating -> [PinPending] -> ManifestSent | ManifestReceived
 *             -> Transferring -> Completed
 * Aborted is reachable from every non-terminal state.
 */
enum class SessionState {
    Negotiating,
    Authenticating,
    PinPending,
    ManifestSent,
    ManifestReceived,
    Transferring,
    Completed,
    Aborted
};

const char* to_string(SessionRole role) noexcept;
const char* to_string(SessionState state) noexcept;

void to_json(nlohmann::json& j, const ClientInfo& info);
void from_json(const nlohmann::json& j, ClientInfo& info);

void to_json(nlohmann::json& j, const PeerIdentity& peer);
void from_json(const nlohmann::json& j, PeerIdentity& peer);

void to_json(nlohmann::json& j, const FileDescriptor& file);
void from_json(const nlohmann::json& j, FileDescriptor& file);

} // namespace lanbeam
