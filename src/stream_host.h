#pragma once

#include <string>
#include <memory>
#include <functional>

namespace rtcdrop {

/**
 * Result of reading one line from a signaling stream
 */
enum class StreamReadStatus {
    OK,             // A full line was read
    END_OF_STREAM,  // Remote side closed cleanly
    TIMED_OUT,      // No full line within the read timeout
    ERROR           // Transport failure
};

/**
 * Bidirectional, reliable, ordered byte stream to one remote peer,
 * consumed line by line.
 */
class SignalingStream {
public:
    virtual ~SignalingStream() = default;

    /**
     * Read bytes up to and including the next '\n'
     * @param line Receives the line without its terminator
     * @param error Receives a description when ERROR is returned (optional)
     */
    virtual StreamReadStatus read_line(std::string& line, std::string* error = nullptr) = 0;

    /**
     * Bound each later read_line call; 0 waits without limit
     */
    virtual void set_read_timeout(int timeout_ms) = 0;

    /**
     * Queue bytes for the remote side
     * @return false on transport failure
     */
    virtual bool write(const std::string& data) = 0;

    /**
     * Push queued bytes to the remote side
     * @return false on transport failure
     */
    virtual bool flush() = 0;

    virtual void close() = 0;

    virtual std::string remote_peer_id() const = 0;
};

using StreamHandler = std::function<void(std::unique_ptr<SignalingStream>)>;

/**
 * Peer-to-peer host that opens and accepts protocol-tagged streams.
 */
class StreamHost {
public:
    virtual ~StreamHost() = default;

    virtual std::string local_peer_id() const = 0;

    /**
     * Register the handler invoked for every inbound stream tagged with protocol_id.
     * Each stream is handed to the handler on its own thread.
     */
    virtual void set_stream_handler(const std::string& protocol_id, StreamHandler handler) = 0;

    /**
     * Open an outbound stream to a known peer
     * @return The stream, or nullptr if the peer is unknown or refused the protocol
     */
    virtual std::unique_ptr<SignalingStream> open_stream(const std::string& peer_id,
                                                         const std::string& protocol_id) = 0;
};

} // namespace rtcdrop
