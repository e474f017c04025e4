#include "signaling.h"
#include "sdp_codec.h"
#include "errors.h"
#include "logger.h"

// Signaling module logging macros
#define LOG_SIGNALING_DEBUG(message) LOG_DEBUG("signaling", message)
#define LOG_SIGNALING_INFO(message)  LOG_INFO("signaling", message)
#define LOG_SIGNALING_WARN(message)  LOG_WARN("signaling", message)
#define LOG_SIGNALING_ERROR(message) LOG_ERROR("signaling", message)

namespace rtcdrop {

namespace {

std::string trim(const std::string& s) {
    const char* whitespace = " \t\r\n";
    size_t start = s.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

std::string signaling_message_type_to_string(SignalingMessageType type) {
    switch (type) {
        case SignalingMessageType::OFFER: return "OFFER";
        case SignalingMessageType::ANSWER: return "ANSWER";
        case SignalingMessageType::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

bool parse_signaling_line(const std::string& line, SignalingMessage& out) {
    std::string trimmed = trim(line);
    size_t colon = trimmed.find(':');
    if (colon == std::string::npos) {
        return false;
    }

    SignalingMessage message;
    message.type_name = trimmed.substr(0, colon);
    message.payload = trimmed.substr(colon + 1);

    if (message.type_name == "OFFER") {
        message.type = SignalingMessageType::OFFER;
    } else if (message.type_name == "ANSWER") {
        message.type = SignalingMessageType::ANSWER;
    } else if (message.type_name == "ERROR") {
        message.type = SignalingMessageType::ERROR;
    } else {
        message.type = SignalingMessageType::UNKNOWN;
    }

    out = message;
    return true;
}

std::string format_signaling_line(SignalingMessageType type, const std::string& payload) {
    std::string safe_payload = payload;
    for (auto& c : safe_payload) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return signaling_message_type_to_string(type) + ":" + safe_payload + "\n";
}

//=============================================================================
// SignalingHandler
//=============================================================================

SignalingHandler::SignalingHandler(StreamHost& host, SessionManager& sessions)
    : host_(host), sessions_(sessions) {
}

void SignalingHandler::attach() {
    host_.set_stream_handler(PROTOCOL_ID, [this](std::unique_ptr<SignalingStream> stream) {
        handle_inbound_stream(std::move(stream));
    });
}

void SignalingHandler::handle_inbound_stream(std::unique_ptr<SignalingStream> stream) {
    const std::string peer_id = stream->remote_peer_id();
    LOG_SIGNALING_DEBUG("Handling signaling stream from peer " << peer_id);

    while (true) {
        std::string line, error;
        StreamReadStatus status = stream->read_line(line, &error);
        if (status == StreamReadStatus::END_OF_STREAM) {
            LOG_SIGNALING_DEBUG("Signaling stream from peer " << peer_id << " closed");
            break;
        }
        if (status != StreamReadStatus::OK) {
            LOG_SIGNALING_ERROR("Error reading signaling stream from peer " << peer_id << ": " << error);
            break;
        }

        SignalingMessage message;
        if (!parse_signaling_line(line, message)) {
            if (!trim(line).empty()) {
                LOG_SIGNALING_WARN("Ignoring malformed signaling line from peer " << peer_id << ": " << line);
            }
            continue;
        }

        bool keep_reading = true;
        switch (message.type) {
            case SignalingMessageType::OFFER:
                keep_reading = handle_offer(*stream, peer_id, message.payload);
                break;
            case SignalingMessageType::ANSWER:
                keep_reading = handle_answer(peer_id, message.payload);
                break;
            case SignalingMessageType::ERROR:
                LOG_SIGNALING_WARN("Peer " << peer_id << " reported error: " << message.payload);
                break;
            default:
                LOG_SIGNALING_WARN("Ignoring unknown signaling message type '" << message.type_name
                                   << "' from peer " << peer_id);
                break;
        }

        if (!keep_reading) {
            break;
        }
    }

    stream->close();
}

bool SignalingHandler::handle_offer(SignalingStream& stream, const std::string& peer_id, const std::string& token) {
    std::string offer;
    try {
        offer = sdp_codec::decode(token);
    } catch (const DecodeError& e) {
        LOG_SIGNALING_WARN("Failed to decode offer from peer " << peer_id << ": " << e.what());
        return true;
    }

    LOG_SIGNALING_INFO("Received offer from peer " << peer_id);

    std::string answer;
    try {
        answer = sessions_.create_answer(peer_id, offer);
    } catch (const NegotiationError& e) {
        LOG_SIGNALING_ERROR("Failed to create answer for peer " << peer_id << ": " << e.what());
        if (!stream.write(format_signaling_line(SignalingMessageType::ERROR, e.what())) || !stream.flush()) {
            LOG_SIGNALING_WARN("Failed to report answer error to peer " << peer_id);
        }
        return false;
    }

    if (!stream.write(format_signaling_line(SignalingMessageType::ANSWER, sdp_codec::encode(answer))) ||
        !stream.flush()) {
        LOG_SIGNALING_ERROR("Failed to send answer to peer " << peer_id);
        sessions_.fail(peer_id, FailureReason::SIGNALING, "Failed to send answer");
        return false;
    }

    LOG_SIGNALING_INFO("Sent answer to peer " << peer_id);
    if (!sessions_.await_connected_async(peer_id)) {
        LOG_SIGNALING_WARN("Not waiting for connection with peer " << peer_id << ", shutting down");
    }

    // Single-shot exchange: the stream is done once the answer is out
    return false;
}

bool SignalingHandler::handle_answer(const std::string& peer_id, const std::string& token) {
    std::string answer;
    try {
        answer = sdp_codec::decode(token);
    } catch (const DecodeError& e) {
        LOG_SIGNALING_WARN("Failed to decode answer from peer " << peer_id << ": " << e.what());
        return true;
    }

    try {
        sessions_.apply_answer(peer_id, answer);
    } catch (const NegotiationError& e) {
        LOG_SIGNALING_ERROR("Failed to apply answer from peer " << peer_id << ": " << e.what());
        return false;
    }

    LOG_SIGNALING_INFO("Applied answer from peer " << peer_id);
    if (!sessions_.await_connected_async(peer_id)) {
        LOG_SIGNALING_WARN("Not waiting for connection with peer " << peer_id << ", shutting down");
    }
    return true;
}

bool SignalingHandler::send_offer(const std::string& peer_id) {
    std::string offer;
    try {
        offer = sessions_.create_offer(peer_id);
    } catch (const NegotiationError& e) {
        LOG_SIGNALING_ERROR("Failed to create offer for peer " << peer_id << ": " << e.what());
        return false;
    }

    std::unique_ptr<SignalingStream> stream = host_.open_stream(peer_id, PROTOCOL_ID);
    if (!stream) {
        abort_offer(peer_id, "Could not open a signaling stream");
        return false;
    }

    if (!stream->write(format_signaling_line(SignalingMessageType::OFFER, sdp_codec::encode(offer))) ||
        !stream->flush()) {
        abort_offer(peer_id, "Failed to send offer");
        return false;
    }

    try {
        sessions_.mark_offer_sent(peer_id);
    } catch (const ProtocolError& e) {
        LOG_SIGNALING_ERROR("Offer to peer " << peer_id << " was superseded: " << e.what());
        return false;
    }
    LOG_SIGNALING_INFO("Sent offer to peer " << peer_id);

    auto answer_timeout = sessions_.get_connection_timeout();
    stream->set_read_timeout(static_cast<int>(answer_timeout.count()));

    std::string line, error;
    StreamReadStatus status = stream->read_line(line, &error);
    if (status == StreamReadStatus::TIMED_OUT) {
        abort_offer(peer_id, "No answer within " + std::to_string(answer_timeout.count()) + "ms",
                    FailureReason::TIMEOUT);
        return false;
    }
    if (status != StreamReadStatus::OK) {
        abort_offer(peer_id, status == StreamReadStatus::END_OF_STREAM
                                 ? "Signaling stream closed before an answer arrived"
                                 : "Error reading answer: " + error);
        return false;
    }
    stream->close();

    SignalingMessage message;
    if (!parse_signaling_line(line, message)) {
        abort_offer(peer_id, "Malformed answer: " + line);
        return false;
    }
    if (message.type == SignalingMessageType::ERROR) {
        abort_offer(peer_id, "Peer reported error: " + message.payload);
        return false;
    }
    if (message.type != SignalingMessageType::ANSWER) {
        abort_offer(peer_id, "Expected ANSWER, got " + message.type_name);
        return false;
    }

    std::string answer;
    try {
        answer = sdp_codec::decode(message.payload);
    } catch (const DecodeError& e) {
        abort_offer(peer_id, std::string("Failed to decode answer: ") + e.what());
        return false;
    }

    try {
        sessions_.apply_answer(peer_id, answer);
    } catch (const NegotiationError& e) {
        LOG_SIGNALING_ERROR("Failed to apply answer from peer " << peer_id << ": " << e.what());
        return false;
    }

    LOG_SIGNALING_INFO("Received answer from peer " << peer_id);
    if (!sessions_.await_connected_async(peer_id)) {
        LOG_SIGNALING_WARN("Not waiting for connection with peer " << peer_id << ", shutting down");
    }
    return true;
}

void SignalingHandler::abort_offer(const std::string& peer_id, const std::string& detail, FailureReason reason) {
    LOG_SIGNALING_ERROR("Negotiation with peer " << peer_id << " aborted: " << detail);
    sessions_.fail(peer_id, reason, detail);
}

} // namespace rtcdrop
