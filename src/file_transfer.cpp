#include "file_transfer.h"
#include "errors.h"
#include "fs.h"
#include "logger.h"
#include <algorithm>
#include <zlib.h>

// File transfer module logging macros
#define LOG_FILE_TRANSFER_DEBUG(message) LOG_DEBUG("transfer", message)
#define LOG_FILE_TRANSFER_INFO(message)  LOG_INFO("transfer", message)
#define LOG_FILE_TRANSFER_WARN(message)  LOG_WARN("transfer", message)
#define LOG_FILE_TRANSFER_ERROR(message) LOG_ERROR("transfer", message)

namespace rtcdrop {

namespace {

uint32_t crc32_update(uint32_t crc, const uint8_t* data, size_t size) {
    return static_cast<uint32_t>(::crc32(crc, data, static_cast<uInt>(size)));
}

uint32_t crc32_initial() {
    return static_cast<uint32_t>(::crc32(0L, Z_NULL, 0));
}

} // anonymous namespace

std::shared_ptr<FileTransferChannel> FileTransferChannel::create(std::shared_ptr<PeerConnection> connection,
                                                                 const FileTransferConfig& config) {
    std::shared_ptr<FileTransferChannel> channel(new FileTransferChannel(std::move(connection), config));

    std::weak_ptr<FileTransferChannel> weak_channel = channel;
    channel->connection_->set_message_callback([weak_channel](const std::vector<uint8_t>& data, bool is_text) {
        if (auto strong = weak_channel.lock()) {
            strong->handle_message(data, is_text);
        }
    });
    return channel;
}

FileTransferChannel::FileTransferChannel(std::shared_ptr<PeerConnection> connection, const FileTransferConfig& config)
    : connection_(std::move(connection)), config_(config) {
    if (config_.chunk_size == 0 || config_.chunk_size > MAX_CHUNK_SIZE) {
        LOG_FILE_TRANSFER_WARN("Chunk size " << config_.chunk_size << " out of range, using " << MAX_CHUNK_SIZE);
        config_.chunk_size = MAX_CHUNK_SIZE;
    }
}

FileTransferChannel::~FileTransferChannel() {
    close();
}

void FileTransferChannel::close() {
    shutdown_all_threads();
    join_all_active_threads();

    std::lock_guard<std::mutex> lock(receive_mutex_);
    if (receive_) {
        LOG_FILE_TRANSFER_WARN("Abandoning incomplete transfer of " << receive_->filename << " after "
                               << receive_->bytes_received << " bytes");
        receive_->file.close();
        receive_.reset();
    }
}

//=============================================================================
// Incoming messages
//=============================================================================

void FileTransferChannel::handle_message(const std::vector<uint8_t>& data, bool is_text) {
    if (!is_text) {
        handle_chunk(data);
        return;
    }

    std::string message(data.begin(), data.end());
    try {
        handle_command(message);
    } catch (const RtcdropError& e) {
        LOG_FILE_TRANSFER_ERROR("Failed to process command '" << message << "': " << e.what());
    }
}

void FileTransferChannel::handle_command(const std::string& message) {
    DataChannelCommand command = parse_data_channel_command(message);
    switch (command.type) {
        case DataChannelCommandType::REQUEST_FILE:
            handle_request_file(command.filename);
            break;
        case DataChannelCommandType::FILE_START:
            handle_file_start(command.filename, command.file_size);
            break;
        case DataChannelCommandType::FILE_END:
            handle_file_end(command.filename);
            break;
    }
}

void FileTransferChannel::handle_request_file(const std::string& filename) {
    std::string path = resolve_shared_path(filename);
    LOG_FILE_TRANSFER_INFO("Peer requested file: " << filename);

    std::weak_ptr<FileTransferChannel> weak_self = shared_from_this();
    bool started = start_managed_thread("send-" + filename, [weak_self, path, filename]() {
        auto self = weak_self.lock();
        if (!self) {
            return;
        }
        try {
            self->send_file(path, filename);
        } catch (const RtcdropError& e) {
            LOG_FILE_TRANSFER_ERROR("Failed to send file " << filename << ": " << e.what());
        }
    });
    if (!started) {
        LOG_FILE_TRANSFER_WARN("Not sending " << filename << ", channel is closing");
    }
}

void FileTransferChannel::handle_file_start(const std::string& filename, uint64_t declared_size) {
    std::string base_name = get_filename_from_path(filename);
    if (base_name.empty() || base_name == "." || base_name == "..") {
        throw ProtocolError("Invalid file name in FILE_START: '" + filename + "'");
    }

    {
        std::lock_guard<std::mutex> lock(receive_mutex_);
        if (receive_) {
            throw ProtocolError("FILE_START for " + filename + " while " + receive_->filename + " is still open");
        }

        if (!config_.download_directory.empty() && !create_directories(config_.download_directory)) {
            throw IOError("Failed to create download directory: " + config_.download_directory);
        }

        std::unique_ptr<ReceiveContext> context(new ReceiveContext());
        context->filename = filename;
        context->path = combine_paths(config_.download_directory, config_.download_prefix + base_name);
        context->declared_size = declared_size;
        context->crc32 = crc32_initial();
        context->file.open(context->path, std::ios::binary | std::ios::trunc);
        if (!context->file.is_open()) {
            throw IOError("Failed to create file: " + context->path);
        }

        LOG_FILE_TRANSFER_INFO("Receiving file: " << filename << " (Size: " << format_file_size(declared_size)
                               << ") -> " << context->path);
        receive_ = std::move(context);
    }

    FileReceiveStartedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = receive_started_callback_;
    }
    if (callback) {
        callback(filename, declared_size);
    }
}

void FileTransferChannel::handle_file_end(const std::string& filename) {
    FileReceiveResult result;
    {
        std::lock_guard<std::mutex> lock(receive_mutex_);
        if (!receive_) {
            throw ProtocolError("FILE_END for " + filename + " without an open transfer");
        }
        if (receive_->filename != filename) {
            throw ProtocolError("FILE_END for " + filename + " does not match open transfer " + receive_->filename);
        }

        receive_->file.close();
        if (receive_->file.fail()) {
            receive_->write_failed = true;
        }

        result.filename = receive_->filename;
        result.path = receive_->path;
        result.declared_size = receive_->declared_size;
        result.bytes_received = receive_->bytes_received;
        result.crc32 = receive_->crc32;
        result.write_failed = receive_->write_failed;
        receive_.reset();
    }

    if (result.write_failed) {
        LOG_FILE_TRANSFER_ERROR("File " << result.path << " was not written completely");
    } else if (!result.size_matches()) {
        LOG_FILE_TRANSFER_WARN("File " << result.filename << " announced " << result.declared_size
                               << " bytes but " << result.bytes_received << " arrived");
    }
    LOG_FILE_TRANSFER_INFO("File received: " << result.path << " (" << format_file_size(result.bytes_received)
                           << ", crc32 " << std::hex << result.crc32 << std::dec << ")");

    FileReceiveCompleteCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = receive_complete_callback_;
    }
    if (callback) {
        callback(result);
    }
}

void FileTransferChannel::handle_chunk(const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(receive_mutex_);
    if (!receive_) {
        LOG_FILE_TRANSFER_DEBUG("Discarding " << data.size() << " bytes, no transfer is open");
        return;
    }

    if (!data.empty()) {
        receive_->file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!receive_->file && !receive_->write_failed) {
            LOG_FILE_TRANSFER_ERROR("Failed to write to " << receive_->path);
            receive_->write_failed = true;
        }
        receive_->crc32 = crc32_update(receive_->crc32, data.data(), data.size());
    }
    receive_->bytes_received += data.size();
}

//=============================================================================
// Outgoing
//=============================================================================

void FileTransferChannel::request_file(const std::string& filename) {
    if (filename.empty()) {
        throw ProtocolError("File name is empty");
    }
    if (!connection_->send_text(format_request_file(filename))) {
        throw IOError("Failed to send file request for " + filename);
    }
    LOG_FILE_TRANSFER_INFO("Requested file: " << filename);
}

FileSendResult FileTransferChannel::send_file(const std::string& path, const std::string& announced_name) {
    std::lock_guard<std::mutex> send_lock(send_mutex_);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open() || !is_file(path)) {
        throw IOError("Failed to open file: " + path);
    }
    int64_t file_size = get_file_size(path);
    if (file_size < 0) {
        throw IOError("Failed to get size of file: " + path);
    }

    FileSendResult result;
    result.filename = announced_name;
    result.path = path;
    result.crc32 = crc32_initial();

    if (!connection_->send_text(format_file_start(announced_name, static_cast<uint64_t>(file_size)))) {
        throw IOError("Failed to send FILE_START for " + announced_name);
    }
    LOG_FILE_TRANSFER_INFO("Sending file: " << announced_name << " (" << format_file_size(file_size) << ")");

    std::vector<uint8_t> buffer(config_.chunk_size);
    while (true) {
        if (is_shutdown_requested()) {
            throw IOError("Transfer of " + announced_name + " cancelled after " +
                          std::to_string(result.chunks_sent) + " chunks");
        }
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = file.gcount();
        if (count > 0) {
            if (!connection_->send_binary(buffer.data(), static_cast<size_t>(count))) {
                throw IOError("Failed to send chunk " + std::to_string(result.chunks_sent) + " of " + announced_name);
            }
            result.crc32 = crc32_update(result.crc32, buffer.data(), static_cast<size_t>(count));
            result.bytes_sent += static_cast<uint64_t>(count);
            result.chunks_sent++;
        }
        if (file.eof()) {
            break;
        }
        if (!file) {
            throw IOError("Read error on " + path + " after " + std::to_string(result.bytes_sent) + " bytes");
        }
    }

    if (!connection_->send_text(format_file_end(announced_name))) {
        throw IOError("Failed to send FILE_END for " + announced_name);
    }

    LOG_FILE_TRANSFER_INFO("File sent: " << announced_name << " (" << format_file_size(result.bytes_sent)
                           << " in " << result.chunks_sent << " chunks, crc32 " << std::hex << result.crc32
                           << std::dec << ")");

    FileSendCompleteCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = send_complete_callback_;
    }
    if (callback) {
        callback(result);
    }
    return result;
}

std::string FileTransferChannel::resolve_shared_path(const std::string& filename) const {
    if (filename.empty()) {
        throw ProtocolError("Requested file name is empty");
    }
    if (filename[0] == '/' || filename[0] == '\\' || (filename.size() > 1 && filename[1] == ':')) {
        throw ProtocolError("Requested file name is absolute: " + filename);
    }

    size_t start = 0;
    while (start <= filename.size()) {
        size_t sep = filename.find_first_of("/\\", start);
        std::string component = filename.substr(start, sep == std::string::npos ? std::string::npos : sep - start);
        if (component == "..") {
            throw ProtocolError("Requested file name leaves the share directory: " + filename);
        }
        if (sep == std::string::npos) {
            break;
        }
        start = sep + 1;
    }

    return combine_paths(config_.share_directory, filename);
}

//=============================================================================
// State and callbacks
//=============================================================================

bool FileTransferChannel::is_receiving() const {
    std::lock_guard<std::mutex> lock(receive_mutex_);
    return receive_ != nullptr;
}

std::string FileTransferChannel::get_receiving_filename() const {
    std::lock_guard<std::mutex> lock(receive_mutex_);
    return receive_ ? receive_->filename : "";
}

void FileTransferChannel::set_receive_started_callback(FileReceiveStartedCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    receive_started_callback_ = std::move(callback);
}

void FileTransferChannel::set_receive_complete_callback(FileReceiveCompleteCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    receive_complete_callback_ = std::move(callback);
}

void FileTransferChannel::set_send_complete_callback(FileSendCompleteCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    send_complete_callback_ = std::move(callback);
}

} // namespace rtcdrop
