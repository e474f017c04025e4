#include "session_description.h"
#include "errors.h"
#include <sstream>
#include <random>
#include <functional>

namespace rtcdrop {

const char* const DATA_CHANNEL_SDP_PROTOCOL = "rtcdrop-datachannel";

namespace {

const char* const CANDIDATE_PREFIX = "candidate:";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::mt19937_64& random_engine() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

} // anonymous namespace

std::string setup_role_to_string(SetupRole role) {
    switch (role) {
        case SetupRole::PASSIVE: return "passive";
        case SetupRole::ACTIVE: return "active";
        default: return "passive";
    }
}

//=============================================================================
// HostCandidate
//=============================================================================

std::string HostCandidate::to_sdp() const {
    std::ostringstream sdp;
    sdp << CANDIDATE_PREFIX << foundation << " " << component_id << " tcp "
        << priority << " " << ip << " " << port << " typ host";
    return sdp.str();
}

bool HostCandidate::from_sdp(const std::string& sdp_line, HostCandidate& out) {
    std::istringstream iss(sdp_line);
    std::string token;

    // Parse: candidate:foundation component transport priority ip port typ type
    if (!(iss >> token) || !starts_with(token, CANDIDATE_PREFIX)) {
        return false;
    }

    HostCandidate candidate;
    candidate.foundation = token.substr(10);

    std::string transport, typ, type;
    if (!(iss >> candidate.component_id >> transport >> candidate.priority
              >> candidate.ip >> candidate.port >> typ >> type)) {
        return false;
    }
    if ((transport != "tcp" && transport != "TCP") || typ != "typ" || type != "host") {
        return false;
    }
    if (candidate.ip.empty() || candidate.port == 0) {
        return false;
    }

    out = candidate;
    return true;
}

//=============================================================================
// SessionDescription
//=============================================================================

std::string SessionDescription::to_sdp() const {
    std::ostringstream sdp;
    sdp << "v=0\r\n"
        << "o=- " << session_id << " 2 IN IP4 127.0.0.1\r\n"
        << "s=-\r\n"
        << "t=0 0\r\n"
        << "m=application 9 TCP " << DATA_CHANNEL_SDP_PROTOCOL << "\r\n"
        << "c=IN IP4 0.0.0.0\r\n"
        << "a=mid:0\r\n"
        << "a=ice-ufrag:" << ice_ufrag << "\r\n"
        << "a=ice-pwd:" << ice_pwd << "\r\n"
        << "a=setup:" << setup_role_to_string(setup) << "\r\n";
    for (const auto& candidate : candidates) {
        sdp << "a=" << candidate.to_sdp() << "\r\n";
    }
    return sdp.str();
}

SessionDescription SessionDescription::parse(const std::string& sdp) {
    SessionDescription desc;
    bool saw_version = false;
    bool saw_media = false;
    bool saw_setup = false;

    std::istringstream iss(sdp);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        if (line.size() < 2 || line[1] != '=') {
            throw NegotiationError("Malformed SDP line: " + line);
        }

        if (line == "v=0") {
            saw_version = true;
        } else if (starts_with(line, "o=")) {
            std::istringstream origin(line.substr(2));
            std::string user;
            origin >> user >> desc.session_id;
        } else if (starts_with(line, "m=")) {
            std::istringstream media(line.substr(2));
            std::string kind, port, transport, protocol;
            media >> kind >> port >> transport >> protocol;
            if (kind != "application" || protocol != DATA_CHANNEL_SDP_PROTOCOL) {
                throw NegotiationError("Unsupported media section: " + line);
            }
            saw_media = true;
        } else if (starts_with(line, "a=ice-ufrag:")) {
            desc.ice_ufrag = line.substr(12);
        } else if (starts_with(line, "a=ice-pwd:")) {
            desc.ice_pwd = line.substr(10);
        } else if (starts_with(line, "a=setup:")) {
            std::string value = line.substr(8);
            if (value == "passive") {
                desc.setup = SetupRole::PASSIVE;
            } else if (value == "active") {
                desc.setup = SetupRole::ACTIVE;
            } else {
                throw NegotiationError("Unsupported setup attribute: " + value);
            }
            saw_setup = true;
        } else if (starts_with(line, "a=candidate:")) {
            HostCandidate candidate;
            if (HostCandidate::from_sdp(line.substr(2), candidate)) {
                desc.candidates.push_back(candidate);
            }
            // Candidates of other transports or types are skipped
        }
    }

    if (!saw_version) {
        throw NegotiationError("Session description is not SDP (missing v=0)");
    }
    if (!saw_media) {
        throw NegotiationError("Session description has no data channel section");
    }
    if (desc.ice_ufrag.empty() || desc.ice_pwd.empty()) {
        throw NegotiationError("Session description is missing ICE credentials");
    }
    if (!saw_setup) {
        throw NegotiationError("Session description is missing the setup attribute");
    }

    return desc;
}

uint32_t calculate_host_priority(uint16_t local_pref, uint16_t component_id) {
    const uint8_t type_pref = 126;
    return (static_cast<uint32_t>(type_pref) << 24) |
           (static_cast<uint32_t>(local_pref) << 8) |
           static_cast<uint32_t>(256 - component_id);
}

std::string generate_ice_credential(size_t length) {
    static const char alphabet[] =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::uniform_int_distribution<size_t> dist(0, sizeof(alphabet) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result += alphabet[dist(random_engine())];
    }
    return result;
}

std::string generate_candidate_foundation(const std::string& ip) {
    std::string base = "host_" + ip;
    std::hash<std::string> hasher;
    return std::to_string(hasher(base) % 1000000);
}

std::string generate_session_id() {
    std::uniform_int_distribution<uint64_t> dist(1, 9223372036854775807ULL);
    return std::to_string(dist(random_engine()));
}

} // namespace rtcdrop
