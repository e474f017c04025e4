#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace rtcdrop {

/**
 * DTLS-style setup attribute. The passive side listens, the active side dials.
 */
enum class SetupRole {
    PASSIVE,
    ACTIVE
};

std::string setup_role_to_string(SetupRole role);

/**
 * Host candidate carried in "a=candidate:" lines
 */
struct HostCandidate {
    std::string foundation;
    uint16_t component_id;
    uint32_t priority;
    std::string ip;
    uint16_t port;

    HostCandidate() : component_id(1), priority(0), port(0) {}

    // "candidate:<foundation> <component> tcp <priority> <ip> <port> typ host"
    std::string to_sdp() const;

    /**
     * Parse the value of an "a=candidate:" attribute
     * @return false if the line is not a TCP host candidate
     */
    static bool from_sdp(const std::string& sdp_line, HostCandidate& out);
};

/**
 * Session description exchanged as the opaque offer/answer payload.
 * Serialized as SDP with CRLF line endings and a single application m-line.
 */
struct SessionDescription {
    std::string session_id;
    std::string ice_ufrag;
    std::string ice_pwd;
    SetupRole setup;
    std::vector<HostCandidate> candidates;

    SessionDescription() : setup(SetupRole::PASSIVE) {}

    std::string to_sdp() const;

    /**
     * Parse SDP text produced by to_sdp()
     * @throws NegotiationError if the text is not SDP, lacks ICE credentials,
     *         or does not describe an rtcdrop data channel
     */
    static SessionDescription parse(const std::string& sdp);
};

// Protocol token of the application m-line
extern const char* const DATA_CHANNEL_SDP_PROTOCOL;

/**
 * Candidate priority (type preference 126 for host candidates)
 */
uint32_t calculate_host_priority(uint16_t local_pref, uint16_t component_id = 1);

/**
 * Random alphanumeric string for ice-ufrag / ice-pwd
 */
std::string generate_ice_credential(size_t length);

std::string generate_candidate_foundation(const std::string& ip);

// Decimal id for the o= line
std::string generate_session_id();

} // namespace rtcdrop
