// request_id.h - per-invocation identifiers
#pragma once

#include <string>

namespace sagegate {

// Generate a random RFC 4122 version 4 UUID (lowercase, hyphenated).
std::string generate_uuid();

}  // namespace sagegate
