#pragma once

#include "file_transfer.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace rtcdrop {

constexpr const char* DEFAULT_CONFIG_FILE = "rtcdrop_config.json";

/**
 * Node configuration, persisted as JSON
 */
struct NodeConfig {
    std::string peer_id;                            // Generated on first start and persisted
    int listen_port;                                // Signaling host port, 0 for ephemeral
    int connection_timeout_seconds;                 // Bound for the connection wait
    size_t chunk_size;                              // Sender chunk size, clamped to [1, MAX_CHUNK_SIZE]
    std::string download_prefix;
    std::string download_directory;
    std::string share_directory;
    std::vector<std::string> advertised_addresses;  // Extra IPv4 host candidates
    std::string log_level;                          // DEBUG, INFO, WARN or ERROR
    std::string log_file;                           // Empty for console only
    std::map<std::string, std::string> peers;       // Address book: peer id -> host:port
    int64_t created_at;                             // Unix seconds

    NodeConfig();

    FileTransferConfig to_file_transfer_config() const;
};

/**
 * Random 32-character hex peer id
 */
std::string generate_peer_id();

/**
 * Read known keys from a JSON object; missing keys keep their defaults and
 * out-of-range values are replaced by defaults with a warning.
 */
NodeConfig config_from_json(const nlohmann::json& json);
nlohmann::json config_to_json(const NodeConfig& config);

/**
 * Load configuration from path.
 * A missing file is created with defaults and a new peer id.
 * @return false if the file exists but could not be parsed (config then holds defaults)
 */
bool load_config(const std::string& path, NodeConfig& config);

/**
 * Write configuration to path (pretty-printed, last_updated refreshed)
 * @return true on success
 */
bool save_config(const std::string& path, const NodeConfig& config);

} // namespace rtcdrop
