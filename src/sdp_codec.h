#pragma once

#include <string>

namespace rtcdrop {
namespace sdp_codec {

/**
 * Encode arbitrary bytes as standard padded base64 (RFC 4648 alphabet).
 * The result never contains ':' or '\n', so it can be the trailing field of a
 * "TYPE:payload" line or a colon-delimited data channel command.
 */
std::string encode(const std::string& raw);

/**
 * Decode a token produced by encode().
 * Surrounding whitespace is ignored; anything else outside the alphabet,
 * a length that is not a multiple of four, or misplaced padding is rejected.
 * @throws DecodeError if the token is not valid base64
 */
std::string decode(const std::string& token);

/**
 * Non-throwing variant of decode().
 * @return true and fills raw_out on success
 */
bool try_decode(const std::string& token, std::string& raw_out);

} // namespace sdp_codec
} // namespace rtcdrop
