#pragma once

#include "peer_connection.h"
#include "data_channel_protocol.h"
#include "threadmanager.h"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <fstream>
#include <functional>
#include <cstdint>

namespace rtcdrop {

/**
 * File transfer configuration
 */
struct FileTransferConfig {
    size_t chunk_size;                  // Binary chunk size, at most MAX_CHUNK_SIZE
    std::string download_prefix;        // Prepended to every received file name
    std::string download_directory;     // Where received files are written
    std::string share_directory;        // Root that requested names are resolved against

    FileTransferConfig()
        : chunk_size(MAX_CHUNK_SIZE),
          download_prefix("downloaded_"),
          download_directory("."),
          share_directory(".") {}
};

/**
 * Outcome of one outgoing transfer
 */
struct FileSendResult {
    std::string filename;       // Name announced in FILE_START
    std::string path;           // Local source path
    uint64_t bytes_sent;
    uint64_t chunks_sent;
    uint32_t crc32;

    FileSendResult() : bytes_sent(0), chunks_sent(0), crc32(0) {}
};

/**
 * Outcome of one incoming transfer (reported on FILE_END)
 */
struct FileReceiveResult {
    std::string filename;       // Name announced by the sender
    std::string path;           // Local destination path
    uint64_t declared_size;     // Size from FILE_START (advisory)
    uint64_t bytes_received;
    uint32_t crc32;
    bool write_failed;

    FileReceiveResult() : declared_size(0), bytes_received(0), crc32(0), write_failed(false) {}

    bool size_matches() const { return declared_size == bytes_received; }
};

// Callback function types
using FileReceiveStartedCallback = std::function<void(const std::string& filename, uint64_t declared_size)>;
using FileReceiveCompleteCallback = std::function<void(const FileReceiveResult& result)>;
using FileSendCompleteCallback = std::function<void(const FileSendResult& result)>;

/**
 * File transfer over one established data channel.
 *
 * Text messages are control commands (REQUEST_FILE, FILE_START, FILE_END),
 * binary messages are chunks of the file opened by the last FILE_START.
 * At most one incoming file is open at a time; outgoing transfers are
 * serialized so chunks of two files never interleave.
 */
class FileTransferChannel : public ThreadManager, public std::enable_shared_from_this<FileTransferChannel> {
public:
    /**
     * Create a channel and register it as the connection's message callback
     */
    static std::shared_ptr<FileTransferChannel> create(std::shared_ptr<PeerConnection> connection,
                                                       const FileTransferConfig& config = FileTransferConfig());
    ~FileTransferChannel() override;

    /**
     * Demultiplex one data channel message. Errors are logged, never thrown.
     */
    void handle_message(const std::vector<uint8_t>& data, bool is_text);

    /**
     * Ask the remote side to send a file
     * @throws IOError if the command cannot be sent
     */
    void request_file(const std::string& filename);

    /**
     * Stream a local file: FILE_START, chunks, FILE_END
     * @param path Local file to read
     * @param announced_name Name carried in FILE_START/FILE_END
     * @throws IOError if the file cannot be opened or read, if the channel fails,
     *         or the channel is closed mid-transfer. FILE_END is not sent then.
     */
    FileSendResult send_file(const std::string& path, const std::string& announced_name);

    bool is_receiving() const;
    std::string get_receiving_filename() const;

    const FileTransferConfig& get_config() const { return config_; }

    void set_receive_started_callback(FileReceiveStartedCallback callback);
    void set_receive_complete_callback(FileReceiveCompleteCallback callback);
    void set_send_complete_callback(FileSendCompleteCallback callback);

    /**
     * Stop sender threads and abandon a partially received file
     */
    void close();

private:
    FileTransferChannel(std::shared_ptr<PeerConnection> connection, const FileTransferConfig& config);

    struct ReceiveContext {
        std::string filename;
        std::string path;
        uint64_t declared_size;
        uint64_t bytes_received;
        uint32_t crc32;
        bool write_failed;
        std::ofstream file;

        ReceiveContext() : declared_size(0), bytes_received(0), crc32(0), write_failed(false) {}
    };

    std::shared_ptr<PeerConnection> connection_;
    FileTransferConfig config_;

    mutable std::mutex receive_mutex_;
    std::unique_ptr<ReceiveContext> receive_;

    std::mutex send_mutex_;

    std::mutex callbacks_mutex_;
    FileReceiveStartedCallback receive_started_callback_;
    FileReceiveCompleteCallback receive_complete_callback_;
    FileSendCompleteCallback send_complete_callback_;

    void handle_command(const std::string& message);
    void handle_request_file(const std::string& filename);
    void handle_file_start(const std::string& filename, uint64_t declared_size);
    void handle_file_end(const std::string& filename);
    void handle_chunk(const std::vector<uint8_t>& data);

    // Resolve a requested name inside share_directory
    std::string resolve_shared_path(const std::string& filename) const;
};

} // namespace rtcdrop
