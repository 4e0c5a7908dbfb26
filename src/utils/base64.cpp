#include "utils/base64.h"

#include <cctype>
#include <cstdint>

namespace sagegate {

namespace {
const char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

int decode_char(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}
}  // namespace

std::string encode_base64(std::string_view data) {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    const auto* bytes = reinterpret_cast<const unsigned char*>(data.data());
    while (i + 2 < data.size()) {
        uint32_t triple = (static_cast<uint32_t>(bytes[i]) << 16) |
                          (static_cast<uint32_t>(bytes[i + 1]) << 8) |
                          static_cast<uint32_t>(bytes[i + 2]);
        result += kBase64Chars[(triple >> 18) & 0x3F];
        result += kBase64Chars[(triple >> 12) & 0x3F];
        result += kBase64Chars[(triple >> 6) & 0x3F];
        result += kBase64Chars[triple & 0x3F];
        i += 3;
    }

    const size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t triple = static_cast<uint32_t>(bytes[i]) << 16;
        result += kBase64Chars[(triple >> 18) & 0x3F];
        result += kBase64Chars[(triple >> 12) & 0x3F];
        result += "==";
    } else if (rest == 2) {
        uint32_t triple = (static_cast<uint32_t>(bytes[i]) << 16) |
                          (static_cast<uint32_t>(bytes[i + 1]) << 8);
        result += kBase64Chars[(triple >> 18) & 0x3F];
        result += kBase64Chars[(triple >> 12) & 0x3F];
        result += kBase64Chars[(triple >> 6) & 0x3F];
        result += '=';
    }
    return result;
}

bool decode_base64(std::string_view encoded, std::string& out, std::string& error) {
    out.clear();
    out.reserve((encoded.size() / 4) * 3);

    int val = 0;
    int valb = -8;
    bool padding = false;
    for (unsigned char c : encoded) {
        if (std::isspace(c)) continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        if (padding) {
            error = "invalid base64 payload: data after padding";
            return false;
        }
        const int v = decode_char(c);
        if (v < 0) {
            error = "invalid base64 payload";
            return false;
        }
        val = (val << 6) + v;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return true;
}

}  // namespace sagegate
