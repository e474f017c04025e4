#pragma once

#include "stream_host.h"
#include "peer_session.h"
#include <string>
#include <memory>

namespace rtcdrop {

/**
 * Signaling line types
 */
enum class SignalingMessageType {
    OFFER,
    ANSWER,
    ERROR,
    UNKNOWN     // Well-formed line with an unrecognized type
};

std::string signaling_message_type_to_string(SignalingMessageType type);

/**
 * One "TYPE:payload" line of the signaling protocol
 */
struct SignalingMessage {
    SignalingMessageType type;
    std::string type_name;      // Type field as received
    std::string payload;        // Everything after the first ':'

    SignalingMessage() : type(SignalingMessageType::UNKNOWN) {}
};

/**
 * Parse a signaling line. Surrounding whitespace (including the line
 * terminator) is ignored and the line is split at its first ':'.
 * @return false if the line has no ':' separator
 */
bool parse_signaling_line(const std::string& line, SignalingMessage& out);

/**
 * Build "TYPE:payload\n". Newlines in the payload are replaced by spaces.
 */
std::string format_signaling_line(SignalingMessageType type, const std::string& payload);

/**
 * Offer/answer exchange over signaling streams, in both roles.
 *
 * Responder: every inbound stream is read line by line; an OFFER is answered
 * on the same stream and the stream is released right after, while the wait
 * for the connection continues in the background.
 * Initiator: send_offer() writes one OFFER and expects exactly one ANSWER line
 * within the session manager's connection timeout.
 */
class SignalingHandler {
public:
    static constexpr const char* PROTOCOL_ID = "/webrtc/sdp/1.0.0";

    SignalingHandler(StreamHost& host, SessionManager& sessions);

    // Register the responder with the host
    void attach();

    /**
     * Responder loop for one inbound stream. Returns when the stream ends,
     * fails, or the single-shot exchange is complete.
     */
    void handle_inbound_stream(std::unique_ptr<SignalingStream> stream);

    /**
     * Initiator path: offer, wait for the answer line, apply it and start
     * waiting for the connection in the background.
     * @return true if the answer was applied
     */
    bool send_offer(const std::string& peer_id);

private:
    StreamHost& host_;
    SessionManager& sessions_;

    // Returns false when the stream should be released
    bool handle_offer(SignalingStream& stream, const std::string& peer_id, const std::string& token);
    bool handle_answer(const std::string& peer_id, const std::string& token);
    void abort_offer(const std::string& peer_id, const std::string& detail,
                     FailureReason reason = FailureReason::SIGNALING);
};

} // namespace rtcdrop
