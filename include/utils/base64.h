#pragma once

#include <string>
#include <string_view>

namespace sagegate {

// Standard base64 (RFC 4648) with padding.
std::string encode_base64(std::string_view data);

// Decodes standard or URL-safe base64. Whitespace is skipped and padding is
// optional. Returns false and fills error on an invalid character.
bool decode_base64(std::string_view encoded, std::string& out, std::string& error);

}  // namespace sagegate
