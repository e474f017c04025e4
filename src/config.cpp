#include "config.h"
#include "fs.h"
#include "logger.h"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

// Config module logging macros
#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace rtcdrop {

namespace {

int64_t unix_timestamp() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

} // anonymous namespace

NodeConfig::NodeConfig()
    : listen_port(0),
      connection_timeout_seconds(30),
      chunk_size(MAX_CHUNK_SIZE),
      download_prefix("downloaded_"),
      download_directory("."),
      share_directory("."),
      log_level("INFO"),
      created_at(0) {
}

FileTransferConfig NodeConfig::to_file_transfer_config() const {
    FileTransferConfig transfer;
    transfer.chunk_size = chunk_size;
    transfer.download_prefix = download_prefix;
    transfer.download_directory = download_directory;
    transfer.share_directory = share_directory;
    return transfer;
}

std::string generate_peer_id() {
    auto now = std::chrono::high_resolution_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();

    std::random_device rd;
    std::seed_seq seed{static_cast<uint32_t>(rd()), static_cast<uint32_t>(rd()),
                       static_cast<uint32_t>(timestamp), static_cast<uint32_t>(timestamp >> 32)};
    std::mt19937 gen(seed);
    std::uniform_int_distribution<> dis(0, 255);

    std::ostringstream id;
    for (int i = 0; i < 16; ++i) {
        id << std::setfill('0') << std::setw(2) << std::hex << dis(gen);
    }
    return id.str();
}

NodeConfig config_from_json(const nlohmann::json& json) {
    NodeConfig config;
    if (!json.is_object()) {
        LOG_CONFIG_WARN("Configuration is not a JSON object, using defaults");
        return config;
    }

    config.peer_id = json.value("peer_id", "");

    int port = json.value("listen_port", 0);
    if (port < 0 || port > 65535) {
        LOG_CONFIG_WARN("Invalid listen_port " << port << ", using an ephemeral port");
        port = 0;
    }
    config.listen_port = port;

    int timeout = json.value("connection_timeout_seconds", config.connection_timeout_seconds);
    if (timeout <= 0) {
        LOG_CONFIG_WARN("Invalid connection_timeout_seconds " << timeout << ", using "
                        << config.connection_timeout_seconds);
    } else {
        config.connection_timeout_seconds = timeout;
    }

    int64_t chunk_size = json.value("chunk_size", static_cast<int64_t>(MAX_CHUNK_SIZE));
    if (chunk_size < 1 || chunk_size > static_cast<int64_t>(MAX_CHUNK_SIZE)) {
        LOG_CONFIG_WARN("chunk_size " << chunk_size << " out of range, clamping to [1, " << MAX_CHUNK_SIZE << "]");
        chunk_size = chunk_size < 1 ? 1 : static_cast<int64_t>(MAX_CHUNK_SIZE);
    }
    config.chunk_size = static_cast<size_t>(chunk_size);

    config.download_prefix = json.value("download_prefix", config.download_prefix);
    config.download_directory = json.value("download_directory", config.download_directory);
    config.share_directory = json.value("share_directory", config.share_directory);
    config.log_level = json.value("log_level", config.log_level);
    config.log_file = json.value("log_file", config.log_file);
    config.created_at = json.value("created_at", static_cast<int64_t>(0));

    if (json.contains("advertised_addresses") && json["advertised_addresses"].is_array()) {
        for (const auto& address : json["advertised_addresses"]) {
            if (address.is_string()) {
                config.advertised_addresses.push_back(address.get<std::string>());
            }
        }
    }

    if (json.contains("peers") && json["peers"].is_object()) {
        for (auto it = json["peers"].begin(); it != json["peers"].end(); ++it) {
            if (it.value().is_string()) {
                config.peers[it.key()] = it.value().get<std::string>();
            } else {
                LOG_CONFIG_WARN("Ignoring peer " << it.key() << " with non-string address");
            }
        }
    }

    return config;
}

nlohmann::json config_to_json(const NodeConfig& config) {
    nlohmann::json json;
    json["peer_id"] = config.peer_id;
    json["listen_port"] = config.listen_port;
    json["connection_timeout_seconds"] = config.connection_timeout_seconds;
    json["chunk_size"] = config.chunk_size;
    json["download_prefix"] = config.download_prefix;
    json["download_directory"] = config.download_directory;
    json["share_directory"] = config.share_directory;
    json["advertised_addresses"] = config.advertised_addresses;
    json["log_level"] = config.log_level;
    json["log_file"] = config.log_file;
    json["peers"] = config.peers;
    json["created_at"] = config.created_at;
    return json;
}

bool load_config(const std::string& path, NodeConfig& config) {
    LOG_CONFIG_INFO("Loading configuration from " << path);

    if (!file_exists(path)) {
        LOG_CONFIG_INFO("No existing configuration found, generating new peer ID");
        config = NodeConfig();
        config.peer_id = generate_peer_id();
        config.created_at = unix_timestamp();
        if (save_config(path, config)) {
            LOG_CONFIG_INFO("Created new configuration file with peer ID: " << config.peer_id);
        }
        return true;
    }

    try {
        std::string config_data = read_file_text_cpp(path);
        if (config_data.empty()) {
            LOG_CONFIG_ERROR("Configuration file is empty: " << path);
            config = NodeConfig();
            config.peer_id = generate_peer_id();
            return false;
        }

        config = config_from_json(nlohmann::json::parse(config_data));
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file: " << e.what());
        config = NodeConfig();
        config.peer_id = generate_peer_id();
        return false;
    }

    if (config.peer_id.empty()) {
        LOG_CONFIG_WARN("No peer ID in configuration, generating new one");
        config.peer_id = generate_peer_id();
        if (config.created_at == 0) {
            config.created_at = unix_timestamp();
        }
        if (!save_config(path, config)) {
            LOG_CONFIG_WARN("New peer ID could not be persisted");
        }
    }

    LOG_CONFIG_INFO("Loaded configuration with peer ID: " << config.peer_id);
    return true;
}

bool save_config(const std::string& path, const NodeConfig& config) {
    nlohmann::json json = config_to_json(config);
    json["last_updated"] = unix_timestamp();

    std::string config_data = json.dump(4); // Pretty print with 4 spaces
    if (!create_file(path, config_data)) {
        LOG_CONFIG_ERROR("Failed to save configuration to " << path);
        return false;
    }

    LOG_CONFIG_DEBUG("Configuration saved to " << path);
    return true;
}

} // namespace rtcdrop
