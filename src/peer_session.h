#pragma once

#include "peer_connection.h"
#include "threadmanager.h"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <functional>
#include <unordered_map>
#include <cstdint>

namespace rtcdrop {

/**
 * Negotiation state of one peer session
 */
enum class NegotiationState {
    IDLE,               // No negotiation with this peer
    OFFER_PENDING,      // Offer created, not yet sent
    AWAITING_ANSWER,    // Offer sent (initiator)
    ANSWER_SENT,        // Answer produced for a received offer (responder)
    ESTABLISHING,       // Offer/answer complete, transport connecting
    CONNECTED,          // Data channel open
    FAILED              // See FailureReason
};

enum class SessionRole {
    INITIATOR,
    RESPONDER
};

enum class FailureReason {
    NONE,
    TIMEOUT,        // Not connected within the configured bound
    NEGOTIATION,    // Offer/answer rejected by the peer connection
    SIGNALING,      // Signaling exchange aborted (bad reply, stream failure)
    CLOSED          // Connection closed before it was established
};

std::string negotiation_state_to_string(NegotiationState state);
std::string session_role_to_string(SessionRole role);
std::string failure_reason_to_string(FailureReason reason);

/**
 * One negotiation/connection attempt with a remote peer
 */
struct PeerSession {
    std::string peer_id;
    SessionRole role;
    NegotiationState state;
    FailureReason failure_reason;
    std::string failure_detail;
    std::shared_ptr<PeerConnection> connection;
    std::chrono::steady_clock::time_point created_at;
    uint64_t attempt_id;

    PeerSession()
        : role(SessionRole::INITIATOR), state(NegotiationState::IDLE),
          failure_reason(FailureReason::NONE), attempt_id(0) {}
};

// Invoked after every state transition with a human-readable status line
using SessionStatusCallback = std::function<void(const std::string& peer_id,
                                                 NegotiationState state,
                                                 const std::string& message)>;

/**
 * Connection establishment state machine, one session per remote peer.
 *
 * Sessions live in a mutex-protected map keyed by peer id. A new attempt
 * gets a fresh PeerConnection from the factory; results of a superseded
 * attempt (e.g. a late timeout) never touch the session that replaced it.
 */
class SessionManager : public ThreadManager {
public:
    static constexpr int DEFAULT_CONNECTION_TIMEOUT_SECONDS = 30;

    explicit SessionManager(PeerConnectionFactory factory,
                            std::chrono::milliseconds connection_timeout =
                                std::chrono::seconds(DEFAULT_CONNECTION_TIMEOUT_SECONDS));
    ~SessionManager() override;

    /**
     * Idle -> OfferPending. A Failed session is replaced.
     * @return Local offer text
     * @throws NegotiationError if the peer's session is already past Idle,
     *         or the peer connection cannot produce an offer
     */
    std::string create_offer(const std::string& peer_id);

    /**
     * OfferPending -> AwaitingAnswer, once the offer line is flushed
     * @throws ProtocolError if no offer is pending for the peer
     */
    void mark_offer_sent(const std::string& peer_id);

    /**
     * Consume a received offer and produce the answer (-> AnswerSent).
     * An existing session with the peer is replaced.
     * @throws NegotiationError on malformed or unsupported offer content
     */
    std::string create_answer(const std::string& peer_id, const std::string& offer);

    /**
     * AwaitingAnswer -> Establishing
     * @throws NegotiationError outside AwaitingAnswer or if the answer is inapplicable
     */
    void apply_answer(const std::string& peer_id, const std::string& answer);

    /**
     * Block until the session is Connected or the timeout elapses (-> Failed(Timeout)).
     * Never reports a timeout before the full timeout has passed.
     * @return CONNECTED or FAILED
     * @throws NegotiationError if there is no session for the peer
     */
    NegotiationState await_connected(const std::string& peer_id, std::chrono::milliseconds timeout);
    NegotiationState await_connected(const std::string& peer_id);

    /**
     * Run await_connected with the configured timeout on a managed thread
     * @return false if the manager is shutting down
     */
    bool await_connected_async(const std::string& peer_id);

    /**
     * Mark the current attempt with the peer Failed and close its connection
     */
    void fail(const std::string& peer_id, FailureReason reason, const std::string& detail);

    /**
     * Close and forget the peer's session (back to Idle)
     * @return false if there was no session
     */
    bool reset(const std::string& peer_id);

    NegotiationState get_state(const std::string& peer_id) const;
    bool get_session(const std::string& peer_id, PeerSession& out) const;
    std::vector<PeerSession> get_sessions() const;
    std::shared_ptr<PeerConnection> get_connection(const std::string& peer_id) const;

    // First peer whose session is Connected with an open data channel, or empty
    std::string get_connected_peer() const;

    void set_status_callback(SessionStatusCallback callback);

    void set_connection_timeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds get_connection_timeout() const;

    /**
     * Close every connection and join pending waits
     */
    void shutdown();

private:
    PeerConnectionFactory factory_;
    std::chrono::milliseconds connection_timeout_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, PeerSession> sessions_;
    uint64_t next_attempt_id_;

    std::mutex callback_mutex_;
    SessionStatusCallback status_callback_;

    // Replace the peer's session with a fresh attempt; returns the connection it displaced
    std::shared_ptr<PeerConnection> install_session_locked(const std::string& peer_id, SessionRole role,
                                                           NegotiationState state,
                                                           std::shared_ptr<PeerConnection> connection,
                                                           uint64_t& attempt_id);

    // Move the attempt to new_state if it is still current; returns whether it moved
    bool transition(const std::string& peer_id, uint64_t attempt_id, NegotiationState new_state,
                    const std::string& message);
    void fail_attempt(const std::string& peer_id, uint64_t attempt_id, FailureReason reason,
                      const std::string& detail);
    void notify_status(const std::string& peer_id, NegotiationState state, const std::string& message);
    std::shared_ptr<PeerConnection> create_connection(const std::string& peer_id);
};

} // namespace rtcdrop
