#include "utils/request_id.h"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace sagegate {

namespace {
std::mt19937_64& thread_rng() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}
}  // namespace

std::string generate_uuid() {
    uint64_t hi = thread_rng()();
    uint64_t lo = thread_rng()();
    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << static_cast<uint32_t>(hi >> 32) << '-'
        << std::setw(4) << static_cast<uint32_t>((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << static_cast<uint32_t>(hi & 0xFFFF) << '-'
        << std::setw(4) << static_cast<uint32_t>(lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

}  // namespace sagegate
