#include "sdp_codec.h"
#include "errors.h"
#include <vector>
#include <cstdint>
#include <utility>

namespace rtcdrop {
namespace sdp_codec {

namespace {

const std::string base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

const std::vector<int>& decode_table() {
    static const std::vector<int> table = [] {
        std::vector<int> t(256, -1);
        for (int i = 0; i < 64; i++) t[static_cast<unsigned char>(base64_chars[i])] = i;
        return t;
    }();
    return table;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && is_space(s[start])) start++;
    while (end > start && is_space(s[end - 1])) end--;
    return s.substr(start, end - start);
}

// Returns an empty string on success, otherwise the reason for rejection
std::string decode_into(const std::string& token, std::string& out) {
    std::string input = trim(token);
    out.clear();

    if (input.size() % 4 != 0) {
        return "length " + std::to_string(input.size()) + " is not a multiple of 4";
    }

    const std::vector<int>& T = decode_table();
    out.reserve(input.size() / 4 * 3);

    for (size_t i = 0; i < input.size(); i += 4) {
        bool last_group = (i + 4 == input.size());
        int values[4];
        int padding = 0;

        for (size_t j = 0; j < 4; j++) {
            unsigned char c = static_cast<unsigned char>(input[i + j]);
            if (c == '=') {
                // Padding is only legal in the last two positions of the final group
                if (!last_group || j < 2) {
                    return "unexpected padding at offset " + std::to_string(i + j);
                }
                padding++;
                values[j] = 0;
                continue;
            }
            if (padding > 0) {
                return "data after padding at offset " + std::to_string(i + j);
            }
            if (T[c] == -1) {
                return "illegal character at offset " + std::to_string(i + j);
            }
            values[j] = T[c];
        }

        uint32_t triple = (static_cast<uint32_t>(values[0]) << 18) |
                          (static_cast<uint32_t>(values[1]) << 12) |
                          (static_cast<uint32_t>(values[2]) << 6) |
                           static_cast<uint32_t>(values[3]);

        out.push_back(static_cast<char>((triple >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<char>((triple >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<char>(triple & 0xFF));
    }

    return "";
}

} // namespace

std::string encode(const std::string& raw) {
    std::string out;
    out.reserve((raw.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < raw.size(); i += 3) {
        uint32_t triple = (static_cast<uint32_t>(static_cast<unsigned char>(raw[i])) << 16) |
                          (static_cast<uint32_t>(static_cast<unsigned char>(raw[i + 1])) << 8) |
                           static_cast<uint32_t>(static_cast<unsigned char>(raw[i + 2]));
        out.push_back(base64_chars[(triple >> 18) & 0x3F]);
        out.push_back(base64_chars[(triple >> 12) & 0x3F]);
        out.push_back(base64_chars[(triple >> 6) & 0x3F]);
        out.push_back(base64_chars[triple & 0x3F]);
    }

    size_t remaining = raw.size() - i;
    if (remaining == 1) {
        uint32_t triple = static_cast<uint32_t>(static_cast<unsigned char>(raw[i])) << 16;
        out.push_back(base64_chars[(triple >> 18) & 0x3F]);
        out.push_back(base64_chars[(triple >> 12) & 0x3F]);
        out += "==";
    } else if (remaining == 2) {
        uint32_t triple = (static_cast<uint32_t>(static_cast<unsigned char>(raw[i])) << 16) |
                          (static_cast<uint32_t>(static_cast<unsigned char>(raw[i + 1])) << 8);
        out.push_back(base64_chars[(triple >> 18) & 0x3F]);
        out.push_back(base64_chars[(triple >> 12) & 0x3F]);
        out.push_back(base64_chars[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

std::string decode(const std::string& token) {
    std::string raw;
    std::string reason = decode_into(token, raw);
    if (!reason.empty()) {
        throw DecodeError("invalid base64 token: " + reason);
    }
    return raw;
}

bool try_decode(const std::string& token, std::string& raw_out) {
    std::string raw;
    if (!decode_into(token, raw).empty()) {
        return false;
    }
    raw_out = std::move(raw);
    return true;
}

} // namespace sdp_codec
} // namespace rtcdrop
