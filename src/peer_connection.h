#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <chrono>
#include <cstdint>

namespace rtcdrop {

/**
 * Outcome of waiting for a peer connection to come up
 */
enum class ConnectionWaitResult {
    CONNECTED,
    TIMED_OUT,
    FAILED      // Connection was closed or could not be established
};

// Called for every data channel message; is_text distinguishes control strings from chunks
using DataChannelMessageCallback = std::function<void(const std::vector<uint8_t>& data, bool is_text)>;

/**
 * Peer connection primitive with one ordered, reliable data channel.
 * Produces offers and answers as opaque session description text.
 */
class PeerConnection {
public:
    virtual ~PeerConnection() = default;

    /**
     * Produce a local offer and start gathering/listening for the remote side
     * @throws NegotiationError if the offer cannot be produced
     */
    virtual std::string create_offer() = 0;

    /**
     * Apply a remote offer and produce the matching answer
     * @throws NegotiationError if the offer is rejected
     */
    virtual std::string create_answer(const std::string& offer) = 0;

    /**
     * Apply the remote answer to a previously created offer
     * @throws NegotiationError if the answer is rejected
     */
    virtual void set_answer(const std::string& answer) = 0;

    /**
     * Block until the data channel is open, the connection fails, or timeout elapses
     */
    virtual ConnectionWaitResult wait_for_connection(std::chrono::milliseconds timeout) = 0;

    /**
     * Send a control string as a text message
     * @return false if the channel is not open or the transport failed
     */
    virtual bool send_text(const std::string& text) = 0;

    /**
     * Send a binary message
     * @return false if the channel is not open or the transport failed
     */
    virtual bool send_binary(const uint8_t* data, size_t size) = 0;

    virtual bool is_connected() const = 0;

    virtual void set_message_callback(DataChannelMessageCallback callback) = 0;

    virtual void close() = 0;
};

// Creates a fresh connection for the given remote peer
using PeerConnectionFactory = std::function<std::shared_ptr<PeerConnection>(const std::string& peer_id)>;

} // namespace rtcdrop
