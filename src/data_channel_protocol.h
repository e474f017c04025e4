#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace rtcdrop {

/**
 * Control commands carried as text messages on the data channel
 */
enum class DataChannelCommandType {
    REQUEST_FILE,   // REQUEST_FILE:<base64 name>
    FILE_START,     // FILE_START:<base64 name>:<decimal size>
    FILE_END        // FILE_END:<base64 name>
};

std::string data_channel_command_type_to_string(DataChannelCommandType type);

struct DataChannelCommand {
    DataChannelCommandType type;
    std::string filename;       // Decoded
    uint64_t file_size;         // FILE_START only

    DataChannelCommand() : type(DataChannelCommandType::REQUEST_FILE), file_size(0) {}
};

// Largest binary chunk sent on the data channel
const size_t MAX_CHUNK_SIZE = 16384;

/**
 * Parse a text message received on the data channel
 * @throws DecodeError if the filename field is not valid base64
 * @throws ProtocolError for an unknown command, missing fields, or a size
 *         that is not a non-negative decimal number
 */
DataChannelCommand parse_data_channel_command(const std::string& message);

std::string format_request_file(const std::string& filename);
std::string format_file_start(const std::string& filename, uint64_t file_size);
std::string format_file_end(const std::string& filename);

/**
 * Human-readable size ("1.5 KB", "12 B")
 */
std::string format_file_size(uint64_t bytes);

} // namespace rtcdrop
