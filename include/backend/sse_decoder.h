#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace sagegate {

/// Incremental decoder for "data: <json>" line framing.
///
/// Chunks may split lines anywhere; only the current unfinished line is
/// buffered. Lines without the "data: " prefix are ignored. The payload
/// "[DONE]" ends the stream and everything after it is discarded.
/// Use one decoder per stream.
class SseDecoder {
public:
    static constexpr std::string_view kDataPrefix = "data: ";
    static constexpr std::string_view kDoneSentinel = "[DONE]";

    /// Appends every complete event found in the chunk to out.
    /// Returns false (and fills error) when a data line is not valid JSON.
    bool feed(std::string_view chunk, std::vector<nlohmann::json>& out, std::string* error = nullptr);

    /// Flushes a final line that was not newline-terminated.
    bool finish(std::vector<nlohmann::json>& out, std::string* error = nullptr);

    /// True once the sentinel was seen.
    bool done() const { return done_; }

private:
    bool processLine(std::string_view line, std::vector<nlohmann::json>& out, std::string* error);

    std::string partial_;
    bool done_{false};
};

}  // namespace sagegate
