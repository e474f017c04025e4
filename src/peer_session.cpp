#include "peer_session.h"
#include "errors.h"
#include "logger.h"
#include <sstream>

// Session module logging macros
#define LOG_SESSION_DEBUG(message) LOG_DEBUG("session", message)
#define LOG_SESSION_INFO(message)  LOG_INFO("session", message)
#define LOG_SESSION_WARN(message)  LOG_WARN("session", message)
#define LOG_SESSION_ERROR(message) LOG_ERROR("session", message)

namespace rtcdrop {

std::string negotiation_state_to_string(NegotiationState state) {
    switch (state) {
        case NegotiationState::IDLE: return "idle";
        case NegotiationState::OFFER_PENDING: return "offer-pending";
        case NegotiationState::AWAITING_ANSWER: return "awaiting-answer";
        case NegotiationState::ANSWER_SENT: return "answer-sent";
        case NegotiationState::ESTABLISHING: return "establishing";
        case NegotiationState::CONNECTED: return "connected";
        case NegotiationState::FAILED: return "failed";
        default: return "unknown";
    }
}

std::string session_role_to_string(SessionRole role) {
    switch (role) {
        case SessionRole::INITIATOR: return "initiator";
        case SessionRole::RESPONDER: return "responder";
        default: return "unknown";
    }
}

std::string failure_reason_to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE: return "none";
        case FailureReason::TIMEOUT: return "timeout";
        case FailureReason::NEGOTIATION: return "negotiation";
        case FailureReason::SIGNALING: return "signaling";
        case FailureReason::CLOSED: return "closed";
        default: return "unknown";
    }
}

SessionManager::SessionManager(PeerConnectionFactory factory, std::chrono::milliseconds connection_timeout)
    : factory_(std::move(factory)),
      connection_timeout_(connection_timeout),
      next_attempt_id_(0) {
}

SessionManager::~SessionManager() {
    shutdown();
}

//=============================================================================
// Transitions
//=============================================================================

std::string SessionManager::create_offer(const std::string& peer_id) {
    uint64_t attempt_id = 0;
    std::shared_ptr<PeerConnection> connection;
    std::shared_ptr<PeerConnection> displaced;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(peer_id);
        if (it != sessions_.end() &&
            it->second.state != NegotiationState::IDLE &&
            it->second.state != NegotiationState::FAILED) {
            throw NegotiationError("Session with peer " + peer_id + " is already " +
                                   negotiation_state_to_string(it->second.state));
        }

        connection = create_connection(peer_id);
        displaced = install_session_locked(peer_id, SessionRole::INITIATOR,
                                           NegotiationState::OFFER_PENDING, connection, attempt_id);
    }
    if (displaced) {
        displaced->close();
    }

    std::string offer;
    try {
        offer = connection->create_offer();
    } catch (const RtcdropError& e) {
        fail_attempt(peer_id, attempt_id, FailureReason::NEGOTIATION, e.what());
        throw NegotiationError(e.what());
    }

    notify_status(peer_id, NegotiationState::OFFER_PENDING, "Offer created for peer " + peer_id);
    return offer;
}

void SessionManager::mark_offer_sent(const std::string& peer_id) {
    uint64_t attempt_id = 0;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(peer_id);
        if (it == sessions_.end() || it->second.state != NegotiationState::OFFER_PENDING) {
            throw ProtocolError("No pending offer for peer " + peer_id);
        }
        attempt_id = it->second.attempt_id;
    }
    transition(peer_id, attempt_id, NegotiationState::AWAITING_ANSWER,
               "Offer sent to peer " + peer_id + ", awaiting answer");
}

std::string SessionManager::create_answer(const std::string& peer_id, const std::string& offer) {
    uint64_t attempt_id = 0;
    std::shared_ptr<PeerConnection> connection;
    std::shared_ptr<PeerConnection> displaced;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(peer_id);
        if (it != sessions_.end() &&
            it->second.state != NegotiationState::IDLE &&
            it->second.state != NegotiationState::FAILED) {
            LOG_SESSION_WARN("Offer from peer " << peer_id << " replaces session in state "
                             << negotiation_state_to_string(it->second.state));
        }

        connection = create_connection(peer_id);
        displaced = install_session_locked(peer_id, SessionRole::RESPONDER,
                                           NegotiationState::IDLE, connection, attempt_id);
    }
    if (displaced) {
        displaced->close();
    }

    std::string answer;
    try {
        answer = connection->create_answer(offer);
    } catch (const RtcdropError& e) {
        fail_attempt(peer_id, attempt_id, FailureReason::NEGOTIATION, e.what());
        throw NegotiationError(e.what());
    }

    transition(peer_id, attempt_id, NegotiationState::ANSWER_SENT, "Answer created for peer " + peer_id);
    return answer;
}

void SessionManager::apply_answer(const std::string& peer_id, const std::string& answer) {
    uint64_t attempt_id = 0;
    std::shared_ptr<PeerConnection> connection;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(peer_id);
        NegotiationState state = it != sessions_.end() ? it->second.state : NegotiationState::IDLE;
        if (state != NegotiationState::AWAITING_ANSWER) {
            throw NegotiationError("Cannot apply answer from peer " + peer_id + " in state " +
                                   negotiation_state_to_string(state));
        }
        attempt_id = it->second.attempt_id;
        connection = it->second.connection;
    }

    try {
        connection->set_answer(answer);
    } catch (const RtcdropError& e) {
        fail_attempt(peer_id, attempt_id, FailureReason::NEGOTIATION, e.what());
        throw NegotiationError(e.what());
    }

    transition(peer_id, attempt_id, NegotiationState::ESTABLISHING,
               "Answer from peer " + peer_id + " applied, establishing connection");
}

NegotiationState SessionManager::await_connected(const std::string& peer_id, std::chrono::milliseconds timeout) {
    uint64_t attempt_id = 0;
    std::shared_ptr<PeerConnection> connection;
    bool answer_sent = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(peer_id);
        if (it == sessions_.end()) {
            throw NegotiationError("No session with peer " + peer_id);
        }
        if (it->second.state == NegotiationState::CONNECTED ||
            it->second.state == NegotiationState::FAILED) {
            return it->second.state;
        }
        attempt_id = it->second.attempt_id;
        connection = it->second.connection;
        answer_sent = it->second.state == NegotiationState::ANSWER_SENT;
    }

    if (answer_sent) {
        transition(peer_id, attempt_id, NegotiationState::ESTABLISHING,
                   "Waiting for connection with peer " + peer_id);
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    ConnectionWaitResult result = ConnectionWaitResult::TIMED_OUT;
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result = ConnectionWaitResult::TIMED_OUT;
            break;
        }
        result = connection->wait_for_connection(
            std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
        if (result != ConnectionWaitResult::TIMED_OUT) {
            break;
        }
    }

    switch (result) {
        case ConnectionWaitResult::CONNECTED:
            if (transition(peer_id, attempt_id, NegotiationState::CONNECTED, "Connected to peer " + peer_id)) {
                return NegotiationState::CONNECTED;
            }
            return get_state(peer_id);

        case ConnectionWaitResult::TIMED_OUT: {
            auto seconds = std::chrono::duration_cast<std::chrono::duration<double>>(timeout).count();
            std::ostringstream detail;
            detail << "Connection with peer " << peer_id << " not established within " << seconds << "s";
            fail_attempt(peer_id, attempt_id, FailureReason::TIMEOUT, detail.str());
            return NegotiationState::FAILED;
        }

        case ConnectionWaitResult::FAILED:
        default:
            fail_attempt(peer_id, attempt_id, FailureReason::CLOSED,
                         "Connection with peer " + peer_id + " closed before it was established");
            return NegotiationState::FAILED;
    }
}

NegotiationState SessionManager::await_connected(const std::string& peer_id) {
    return await_connected(peer_id, get_connection_timeout());
}

bool SessionManager::await_connected_async(const std::string& peer_id) {
    return start_managed_thread("await-" + peer_id, [this, peer_id]() {
        try {
            await_connected(peer_id);
        } catch (const RtcdropError& e) {
            LOG_SESSION_WARN("Connection wait for peer " << peer_id << " aborted: " << e.what());
        }
    });
}

void SessionManager::fail(const std::string& peer_id, FailureReason reason, const std::string& detail) {
    fail_attempt(peer_id, 0, reason, detail);
}

bool SessionManager::reset(const std::string& peer_id) {
    std::shared_ptr<PeerConnection> connection;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(peer_id);
        if (it == sessions_.end()) {
            return false;
        }
        connection = it->second.connection;
        sessions_.erase(it);
    }

    if (connection) {
        connection->close();
    }
    notify_status(peer_id, NegotiationState::IDLE, "Session with peer " + peer_id + " reset");
    return true;
}

//=============================================================================
// Queries
//=============================================================================

NegotiationState SessionManager::get_state(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(peer_id);
    return it != sessions_.end() ? it->second.state : NegotiationState::IDLE;
}

bool SessionManager::get_session(const std::string& peer_id, PeerSession& out) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(peer_id);
    if (it == sessions_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

std::vector<PeerSession> SessionManager::get_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<PeerSession> result;
    result.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        result.push_back(entry.second);
    }
    return result;
}

std::shared_ptr<PeerConnection> SessionManager::get_connection(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(peer_id);
    return it != sessions_.end() ? it->second.connection : nullptr;
}

std::string SessionManager::get_connected_peer() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& entry : sessions_) {
        if (entry.second.state == NegotiationState::CONNECTED &&
            entry.second.connection && entry.second.connection->is_connected()) {
            return entry.first;
        }
    }
    return "";
}

void SessionManager::set_status_callback(SessionStatusCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    status_callback_ = std::move(callback);
}

void SessionManager::set_connection_timeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    connection_timeout_ = timeout;
}

std::chrono::milliseconds SessionManager::get_connection_timeout() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return connection_timeout_;
}

void SessionManager::shutdown() {
    shutdown_all_threads();

    std::vector<std::shared_ptr<PeerConnection>> connections;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& entry : sessions_) {
            if (entry.second.connection) {
                connections.push_back(entry.second.connection);
            }
        }
    }
    for (auto& connection : connections) {
        connection->close();
    }

    join_all_active_threads();
}

//=============================================================================
// Internals
//=============================================================================

std::shared_ptr<PeerConnection> SessionManager::create_connection(const std::string& peer_id) {
    std::shared_ptr<PeerConnection> connection = factory_ ? factory_(peer_id) : nullptr;
    if (!connection) {
        throw NegotiationError("Failed to create a peer connection for peer " + peer_id);
    }
    return connection;
}

std::shared_ptr<PeerConnection> SessionManager::install_session_locked(const std::string& peer_id,
                                                                       SessionRole role,
                                                                       NegotiationState state,
                                                                       std::shared_ptr<PeerConnection> connection,
                                                                       uint64_t& attempt_id) {
    std::shared_ptr<PeerConnection> displaced;
    auto it = sessions_.find(peer_id);
    if (it != sessions_.end()) {
        displaced = it->second.connection;
    }

    PeerSession session;
    session.peer_id = peer_id;
    session.role = role;
    session.state = state;
    session.connection = std::move(connection);
    session.created_at = std::chrono::steady_clock::now();
    session.attempt_id = ++next_attempt_id_;
    attempt_id = session.attempt_id;

    sessions_[peer_id] = session;
    return displaced;
}

bool SessionManager::transition(const std::string& peer_id, uint64_t attempt_id, NegotiationState new_state,
                                const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(peer_id);
        if (it == sessions_.end() || it->second.attempt_id != attempt_id ||
            it->second.state == NegotiationState::FAILED) {
            LOG_SESSION_DEBUG("Dropping transition to " << negotiation_state_to_string(new_state)
                              << " for superseded attempt with peer " << peer_id);
            return false;
        }
        it->second.state = new_state;
    }

    notify_status(peer_id, new_state, message);
    return true;
}

void SessionManager::fail_attempt(const std::string& peer_id, uint64_t attempt_id, FailureReason reason,
                                  const std::string& detail) {
    std::shared_ptr<PeerConnection> connection;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(peer_id);
        if (it == sessions_.end() || (attempt_id != 0 && it->second.attempt_id != attempt_id) ||
            it->second.state == NegotiationState::FAILED) {
            return;
        }
        it->second.state = NegotiationState::FAILED;
        it->second.failure_reason = reason;
        it->second.failure_detail = detail;
        connection = it->second.connection;
    }

    if (connection) {
        connection->close();
    }
    notify_status(peer_id, NegotiationState::FAILED,
                  "Session with peer " + peer_id + " failed (" + failure_reason_to_string(reason) + "): " + detail);
}

void SessionManager::notify_status(const std::string& peer_id, NegotiationState state, const std::string& message) {
    if (state == NegotiationState::FAILED) {
        LOG_SESSION_WARN(message);
    } else {
        LOG_SESSION_INFO(message);
    }

    SessionStatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = status_callback_;
    }
    if (callback) {
        callback(peer_id, state, message);
    }
}

} // namespace rtcdrop
