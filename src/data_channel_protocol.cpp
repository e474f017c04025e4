#include "data_channel_protocol.h"
#include "sdp_codec.h"
#include "errors.h"
#include <vector>
#include <sstream>
#include <iomanip>
#include <cctype>

namespace rtcdrop {

namespace {

std::vector<std::string> split_fields(const std::string& message) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t colon = message.find(':', start);
        if (colon == std::string::npos) {
            fields.push_back(message.substr(start));
            break;
        }
        fields.push_back(message.substr(start, colon - start));
        start = colon + 1;
    }
    return fields;
}

uint64_t parse_size(const std::string& field) {
    if (field.empty()) {
        throw ProtocolError("FILE_START size is empty");
    }
    for (char c : field) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ProtocolError("FILE_START size is not a non-negative decimal number: " + field);
        }
    }

    uint64_t value = 0;
    std::istringstream iss(field);
    if (!(iss >> value)) {
        throw ProtocolError("FILE_START size is out of range: " + field);
    }
    return value;
}

} // anonymous namespace

std::string data_channel_command_type_to_string(DataChannelCommandType type) {
    switch (type) {
        case DataChannelCommandType::REQUEST_FILE: return "REQUEST_FILE";
        case DataChannelCommandType::FILE_START: return "FILE_START";
        case DataChannelCommandType::FILE_END: return "FILE_END";
        default: return "UNKNOWN";
    }
}

DataChannelCommand parse_data_channel_command(const std::string& message) {
    std::vector<std::string> fields = split_fields(message);
    const std::string& name = fields[0];

    DataChannelCommand command;
    size_t expected_fields = 2;
    if (name == "REQUEST_FILE") {
        command.type = DataChannelCommandType::REQUEST_FILE;
    } else if (name == "FILE_START") {
        command.type = DataChannelCommandType::FILE_START;
        expected_fields = 3;
    } else if (name == "FILE_END") {
        command.type = DataChannelCommandType::FILE_END;
    } else {
        throw ProtocolError("Unknown data channel command: " + name);
    }

    if (fields.size() != expected_fields) {
        throw ProtocolError(name + " expects " + std::to_string(expected_fields - 1) +
                            " field(s), got " + std::to_string(fields.size() - 1));
    }

    command.filename = sdp_codec::decode(fields[1]);
    if (command.type == DataChannelCommandType::FILE_START) {
        command.file_size = parse_size(fields[2]);
    }
    return command;
}

std::string format_request_file(const std::string& filename) {
    return "REQUEST_FILE:" + sdp_codec::encode(filename);
}

std::string format_file_start(const std::string& filename, uint64_t file_size) {
    return "FILE_START:" + sdp_codec::encode(filename) + ":" + std::to_string(file_size);
}

std::string format_file_end(const std::string& filename) {
    return "FILE_END:" + sdp_codec::encode(filename);
}

std::string format_file_size(uint64_t bytes) {
    const uint64_t unit = 1024;
    if (bytes < unit) {
        return std::to_string(bytes) + " B";
    }

    const char* suffixes = "KMGTPE";
    double value = static_cast<double>(bytes);
    int exp = -1;
    while (value >= unit && exp < 5) {
        value /= unit;
        exp++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << " " << suffixes[exp] << "B";
    return oss.str();
}

} // namespace rtcdrop
