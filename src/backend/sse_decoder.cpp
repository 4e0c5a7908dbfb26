#include "backend/sse_decoder.h"

#include "utils/json_utils.h"

namespace sagegate {

bool SseDecoder::feed(std::string_view chunk, std::vector<nlohmann::json>& out, std::string* error) {
    if (done_) return true;

    size_t start = 0;
    while (start < chunk.size()) {
        const size_t nl = chunk.find('\n', start);
        if (nl == std::string_view::npos) {
            partial_.append(chunk.data() + start, chunk.size() - start);
            break;
        }

        bool ok = true;
        if (partial_.empty()) {
            ok = processLine(chunk.substr(start, nl - start), out, error);
        } else {
            partial_.append(chunk.data() + start, nl - start);
            std::string line = std::move(partial_);
            partial_.clear();
            ok = processLine(line, out, error);
        }
        if (!ok) return false;
        if (done_) {
            partial_.clear();
            return true;
        }
        start = nl + 1;
    }
    return true;
}

bool SseDecoder::finish(std::vector<nlohmann::json>& out, std::string* error) {
    if (done_ || partial_.empty()) {
        partial_.clear();
        return true;
    }
    std::string line = std::move(partial_);
    partial_.clear();
    return processLine(line, out, error);
}

bool SseDecoder::processLine(std::string_view line, std::vector<nlohmann::json>& out, std::string* error) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.substr(0, kDataPrefix.size()) != kDataPrefix) {
        return true;  // keep-alive, comments, event:/id: fields
    }
    const std::string_view payload = line.substr(kDataPrefix.size());
    if (payload == kDoneSentinel) {
        done_ = true;
        return true;
    }

    std::string parse_error;
    auto event = parse_json(payload, &parse_error);
    if (!event) {
        if (error) *error = "malformed stream event: " + parse_error;
        return false;
    }
    out.push_back(std::move(*event));
    return true;
}

}  // namespace sagegate
