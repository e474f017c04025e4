#pragma once

#include <stdexcept>
#include <string>

namespace rtcdrop {

/**
 * Base of every error rtcdrop raises. Handlers that only need to log and
 * move on catch this type.
 */
class RtcdropError : public std::runtime_error {
public:
    explicit RtcdropError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed byte-safe token (bad base64, truncated line)
class DecodeError : public RtcdropError {
public:
    explicit DecodeError(const std::string& message) : RtcdropError(message) {}
};

// Malformed line or command, wrong message type, unexpected protocol state
class ProtocolError : public RtcdropError {
public:
    explicit ProtocolError(const std::string& message) : RtcdropError(message) {}
};

// The peer connection rejected an offer or answer, or the session is in the wrong state
class NegotiationError : public RtcdropError {
public:
    explicit NegotiationError(const std::string& message) : RtcdropError(message) {}
};

// Connection was not established within the configured bound
class TimeoutError : public RtcdropError {
public:
    explicit TimeoutError(const std::string& message) : RtcdropError(message) {}
};

// File open/read/write failure, or a data channel send failure
class IOError : public RtcdropError {
public:
    explicit IOError(const std::string& message) : RtcdropError(message) {}
};

} // namespace rtcdrop
