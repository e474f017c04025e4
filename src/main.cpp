#include "node.h"
#include "config.h"
#include "data_channel_protocol.h"
#include "errors.h"
#include "logger.h"
#include <iostream>
#include <string>
#include <sstream>
#include <stdexcept>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

namespace {

struct CommandLineOptions {
    std::string config_path;
    int port;
    std::string peer_id;
    std::string log_level;
    int timeout_seconds;

    CommandLineOptions() : config_path(rtcdrop::DEFAULT_CONFIG_FILE), port(-1), timeout_seconds(0) {}
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "  --config <path>      Configuration file (default: " << rtcdrop::DEFAULT_CONFIG_FILE << ")\n";
    std::cout << "  --port <n>           Port to listen on for signaling streams (0 for ephemeral)\n";
    std::cout << "  --peer-id <id>       Override the persisted peer ID\n";
    std::cout << "  --log-level <level>  DEBUG, INFO, WARN or ERROR\n";
    std::cout << "  --timeout <seconds>  Connection establishment timeout\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program_name << " --port 9000\n";
}

void print_help() {
    std::cout << "\nAvailable commands:\n";
    std::cout << "  connect <peer_id> <host:port> - Add a peer to the address book\n";
    std::cout << "  offer <peer_id>               - Negotiate a connection with a peer\n";
    std::cout << "  download <file> [peer_id]     - Request a file from a connected peer\n";
    std::cout << "  status                        - Show sessions and transfers\n";
    std::cout << "  peers                         - List known peers\n";
    std::cout << "  disconnect <peer_id>          - Close the session with a peer\n";
    std::cout << "  help                          - Show this help message\n";
    std::cout << "  exit | quit | q               - Exit the program\n";
}

void print_prompt() {
    std::cout << "> " << std::flush;
}

bool parse_int_option(const std::string& value, int& out) {
    try {
        size_t consumed = 0;
        out = std::stoi(value, &consumed);
        return consumed == value.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parse_command_line(int argc, char* argv[], CommandLineOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return false;
        }

        std::string value = argv[++i];
        if (arg == "--config") {
            options.config_path = value;
        } else if (arg == "--port") {
            if (!parse_int_option(value, options.port) || options.port < 0 || options.port > 65535) {
                std::cerr << "Invalid port: " << value << std::endl;
                return false;
            }
        } else if (arg == "--peer-id") {
            options.peer_id = value;
        } else if (arg == "--log-level") {
            options.log_level = value;
        } else if (arg == "--timeout") {
            if (!parse_int_option(value, options.timeout_seconds) || options.timeout_seconds <= 0) {
                std::cerr << "Invalid timeout: " << value << std::endl;
                return false;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

void print_status(rtcdrop::RtcdropNode& node) {
    std::cout << "Peer ID: " << node.get_peer_id() << " | listening on port " << node.get_listen_port() << std::endl;

    auto sessions = node.get_sessions();
    if (sessions.empty()) {
        std::cout << "No sessions." << std::endl;
        return;
    }

    auto now = std::chrono::steady_clock::now();
    for (const auto& session : sessions) {
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - session.created_at).count();
        std::cout << "  " << session.peer_id
                  << " | " << rtcdrop::session_role_to_string(session.role)
                  << " | " << rtcdrop::negotiation_state_to_string(session.state);
        if (session.state == rtcdrop::NegotiationState::FAILED) {
            std::cout << " (" << rtcdrop::failure_reason_to_string(session.failure_reason) << ": "
                      << session.failure_detail << ")";
        }
        std::cout << " | " << age << "s ago";

        auto channel = node.get_transfer_channel(session.peer_id);
        if (channel && channel->is_receiving()) {
            std::cout << " | receiving " << channel->get_receiving_filename();
        }
        std::cout << std::endl;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CommandLineOptions options;
    if (!parse_command_line(argc, argv, options)) {
        print_usage(argv[0]);
        return 1;
    }

    rtcdrop::NodeConfig config;
    if (!rtcdrop::load_config(options.config_path, config)) {
        LOG_MAIN_WARN("Using default configuration");
    }

    if (options.port >= 0) {
        config.listen_port = options.port;
    }
    if (!options.peer_id.empty()) {
        config.peer_id = options.peer_id;
    }
    if (!options.log_level.empty()) {
        config.log_level = options.log_level;
    }
    if (options.timeout_seconds > 0) {
        config.connection_timeout_seconds = options.timeout_seconds;
    }

    rtcdrop::Logger::getInstance().set_log_level(rtcdrop::log_level_from_string(config.log_level));
    if (!config.log_file.empty() && !rtcdrop::Logger::getInstance().set_log_file(config.log_file)) {
        LOG_MAIN_WARN("Logging to console only");
    }

    LOG_MAIN_INFO("=== rtcdrop ===");
    rtcdrop::RtcdropNode node(config);

    node.set_session_status_callback([](const std::string& peer_id, rtcdrop::NegotiationState state,
                                        const std::string& message) {
        if (state == rtcdrop::NegotiationState::CONNECTED) {
            std::cout << "\nConnection established with peer " << peer_id << std::endl;
            print_prompt();
        } else if (state == rtcdrop::NegotiationState::FAILED) {
            std::cout << "\n" << message << std::endl;
            print_prompt();
        }
    });
    node.set_receive_started_callback([](const std::string& filename, uint64_t declared_size) {
        std::cout << "\nReceiving file: " << filename << " (Size: " << rtcdrop::format_file_size(declared_size)
                  << ")" << std::endl;
        print_prompt();
    });
    node.set_receive_complete_callback([](const rtcdrop::FileReceiveResult& result) {
        std::cout << "\nFile received successfully: " << result.path << " ("
                  << rtcdrop::format_file_size(result.bytes_received) << ")" << std::endl;
        print_prompt();
    });
    node.set_send_complete_callback([](const rtcdrop::FileSendResult& result) {
        std::cout << "\nFile sent: " << result.filename << " (" << rtcdrop::format_file_size(result.bytes_sent)
                  << ")" << std::endl;
        print_prompt();
    });

    if (!node.start()) {
        LOG_MAIN_ERROR("Failed to start node on port " << config.listen_port);
        return 1;
    }

    std::cout << "Peer ID: " << node.get_peer_id() << std::endl;
    std::cout << "Listening on port " << node.get_listen_port() << std::endl;
    print_help();
    print_prompt();

    // Main command loop
    std::string input;
    while (node.is_running() && std::getline(std::cin, input)) {
        std::istringstream iss(input);
        std::string command;
        iss >> command;

        if (command.empty()) {
            print_prompt();
            continue;
        }

        if (command == "exit" || command == "quit" || command == "q") {
            LOG_MAIN_INFO("Shutting down...");
            break;
        }
        else if (command == "help") {
            print_help();
        }
        else if (command == "connect") {
            std::string peer_id, address;
            iss >> peer_id >> address;
            if (peer_id.empty() || address.empty()) {
                std::cout << "Usage: connect <peer_id> <host:port>" << std::endl;
            } else {
                try {
                    node.add_peer(peer_id, address);
                    config.peers[peer_id] = address;
                    if (!rtcdrop::save_config(options.config_path, config)) {
                        LOG_MAIN_WARN("Peer " << peer_id << " was not persisted");
                    }
                    std::cout << "Added peer " << peer_id << " at " << address << std::endl;
                } catch (const rtcdrop::RtcdropError& e) {
                    std::cout << e.what() << std::endl;
                }
            }
        }
        else if (command == "offer") {
            std::string peer_id;
            iss >> peer_id;
            if (peer_id.empty()) {
                std::cout << "Usage: offer <peer_id>" << std::endl;
            } else if (node.offer(peer_id)) {
                std::cout << "Answer received from " << peer_id << ", establishing connection..." << std::endl;
            } else {
                std::cout << "Negotiation with " << peer_id << " failed (see log)" << std::endl;
            }
        }
        else if (command == "download") {
            std::string filename, peer_id;
            iss >> filename >> peer_id;
            if (filename.empty()) {
                std::cout << "Usage: download <file> [peer_id]" << std::endl;
            } else {
                try {
                    node.download(filename, peer_id);
                    std::cout << "Requested " << filename << std::endl;
                } catch (const rtcdrop::RtcdropError& e) {
                    std::cout << e.what() << std::endl;
                }
            }
        }
        else if (command == "status") {
            print_status(node);
        }
        else if (command == "peers") {
            auto peers = node.get_known_peers();
            if (peers.empty()) {
                std::cout << "No known peers. Use 'connect <peer_id> <host:port>'." << std::endl;
            } else {
                std::cout << "Known peers:" << std::endl;
                for (const auto& peer : peers) {
                    std::cout << "  " << peer.first << " -> " << peer.second << " ["
                              << rtcdrop::negotiation_state_to_string(node.get_session_state(peer.first))
                              << "]" << std::endl;
                }
            }
        }
        else if (command == "disconnect") {
            std::string peer_id;
            iss >> peer_id;
            if (peer_id.empty()) {
                std::cout << "Usage: disconnect <peer_id>" << std::endl;
            } else if (node.disconnect(peer_id)) {
                std::cout << "Disconnected from " << peer_id << std::endl;
            } else {
                std::cout << "No session with " << peer_id << std::endl;
            }
        }
        else {
            std::cout << "Unknown command: " << command << std::endl;
            std::cout << "Type 'help' for available commands." << std::endl;
        }
        print_prompt();
    }

    // Clean shutdown
    node.stop();
    LOG_MAIN_INFO("rtcdrop stopped. Goodbye!");
    return 0;
}
