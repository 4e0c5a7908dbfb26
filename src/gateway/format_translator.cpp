#include "gateway/format_translator.h"

#include <cctype>
#include <chrono>
#include <limits>

#include "utils/json_utils.h"

namespace sagegate {

using json = nlohmann::json;

namespace {

Result<TranslatedRequest> invalid(std::string message) {
    return Result<TranslatedRequest>::failure(GatewayError::InvalidRequest, std::move(message));
}

// string, null, or [{"type":"text","text":...}]
bool readContent(const json& content, std::string& out, std::string& error) {
    if (content.is_null()) {
        out.clear();
        return true;
    }
    if (content.is_string()) {
        out = content.get<std::string>();
        return true;
    }
    if (content.is_array()) {
        out.clear();
        for (const auto& part : content) {
            if (!part.is_object()) {
                error = "content parts must be objects";
                return false;
            }
            const std::string type = get_or<std::string>(part, "type", "");
            if (type != "text") {
                error = "unsupported content part type: " + (type.empty() ? std::string("(missing)") : type);
                return false;
            }
            auto text = part.find("text");
            if (text == part.end() || !text->is_string()) {
                error = "text content part requires a string 'text'";
                return false;
            }
            out += text->get<std::string>();
        }
        return true;
    }
    error = "message content must be a string or an array of content parts";
    return false;
}

const char* objectTag(RequestShape shape, bool chunk) {
    if (shape == RequestShape::Chat) {
        return chunk ? "chat.completion.chunk" : "chat.completion";
    }
    return "text_completion";
}

json chunkEnvelope(RequestShape shape, const ResponseMeta& meta, json choices) {
    return {
        {"id", meta.id},
        {"object", objectTag(shape, true)},
        {"created", meta.created},
        {"model", meta.model},
        {"choices", std::move(choices)}
    };
}

}  // namespace

ChatRole parse_chat_role(const std::string& role) {
    if (role == "system") return ChatRole::System;
    if (role == "user") return ChatRole::User;
    if (role == "assistant") return ChatRole::Assistant;
    return ChatRole::Other;
}

BackendPayload TranslatedRequest::toBackendPayload() const {
    BackendPayload payload;
    payload.inputs = prompt;
    payload.parameters = parameters;
    return payload;
}

Result<TranslatedRequest> translateRequest(const json& payload) {
    if (!payload.is_object()) {
        return invalid("request body must be a JSON object");
    }

    TranslatedRequest req;
    auto messages = payload.find("messages");
    auto prompt = payload.find("prompt");
    if (messages != payload.end() && !messages->is_null()) {
        req.shape = RequestShape::Chat;
        if (!messages->is_array()) {
            return invalid("'messages' must be an array");
        }
        if (messages->empty()) {
            return invalid("'messages' must not be empty");
        }
        for (size_t i = 0; i < messages->size(); ++i) {
            const json& m = (*messages)[i];
            if (!m.is_object()) {
                return invalid("messages[" + std::to_string(i) + "] must be an object");
            }
            ChatMessage msg;
            auto role = m.find("role");
            if (role != m.end() && role->is_string()) {
                msg.role = parse_chat_role(role->get<std::string>());
            }
            auto content = m.find("content");
            if (content != m.end()) {
                std::string error;
                if (!readContent(*content, msg.content, error)) {
                    return invalid("messages[" + std::to_string(i) + "]: " + error);
                }
            }
            req.messages.push_back(std::move(msg));
        }
        req.prompt = flattenConversation(req.messages);
    } else if (prompt != payload.end() && !prompt->is_null()) {
        req.shape = RequestShape::Completion;
        if (prompt->is_string()) {
            req.prompt = prompt->get<std::string>();
        } else if (prompt->is_array()) {
            for (const auto& part : *prompt) {
                if (!part.is_string()) {
                    return invalid("'prompt' array must contain only strings");
                }
                if (!req.prompt.empty()) req.prompt.push_back('\n');
                req.prompt += part.get<std::string>();
            }
        } else {
            return invalid("'prompt' must be a string or an array of strings");
        }
    } else {
        return invalid("request must include 'messages' or 'prompt'");
    }

    auto max_tokens = payload.find("max_tokens");
    if (max_tokens != payload.end() && !max_tokens->is_null()) {
        if (!max_tokens->is_number_integer()) {
            return invalid("'max_tokens' must be a positive integer");
        }
        const int64_t value = max_tokens->get<int64_t>();
        if (max_tokens->is_number_unsigned() && max_tokens->get<uint64_t>() > std::numeric_limits<int>::max()) {
            return invalid("'max_tokens' is too large");
        }
        if (value <= 0) {
            return invalid("'max_tokens' must be a positive integer");
        }
        if (value > std::numeric_limits<int>::max()) {
            return invalid("'max_tokens' is too large");
        }
        req.parameters.max_new_tokens = static_cast<int>(value);
    }

    auto temperature = payload.find("temperature");
    if (temperature != payload.end() && !temperature->is_null()) {
        if (!temperature->is_number()) {
            return invalid("'temperature' must be a number");
        }
        const double value = temperature->get<double>();
        if (value < 0.0 || value > 2.0) {
            return invalid("'temperature' must be between 0 and 2");
        }
        req.parameters.temperature = value;
    }
    req.parameters.do_sample = true;

    auto stream = payload.find("stream");
    if (stream != payload.end() && !stream->is_null()) {
        if (!stream->is_boolean()) {
            return invalid("'stream' must be a boolean");
        }
        req.stream = stream->get<bool>();
    }
    auto stream_options = payload.find("stream_options");
    if (stream_options != payload.end() && stream_options->is_object()) {
        auto include_usage = stream_options->find("include_usage");
        req.include_usage = include_usage != stream_options->end() && include_usage->is_boolean() &&
                            include_usage->get<bool>();
    }

    return Result<TranslatedRequest>::success(std::move(req));
}

std::string flattenConversation(const std::vector<ChatMessage>& messages) {
    std::string out;
    for (size_t i = 0; i < messages.size(); ++i) {
        if (i > 0) out.push_back('\n');
        switch (messages[i].role) {
            case ChatRole::System:
                out += "System: ";
                break;
            case ChatRole::Assistant:
                out += "Assistant: ";
                break;
            case ChatRole::User:
            case ChatRole::Other:
                break;
        }
        out += messages[i].content;
    }
    return out;
}

size_t countWhitespaceTokens(std::string_view text) {
    size_t count = 0;
    bool in_token = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_token = false;
        } else if (!in_token) {
            in_token = true;
            ++count;
        }
    }
    return count;
}

json Usage::toJson() const {
    return {
        {"prompt_tokens", prompt_tokens},
        {"completion_tokens", completion_tokens},
        {"total_tokens", total_tokens}
    };
}

Usage computeUsage(std::string_view prompt, std::string_view generated) {
    Usage usage;
    usage.prompt_tokens = countWhitespaceTokens(prompt);
    usage.completion_tokens = countWhitespaceTokens(generated);
    usage.total_tokens = usage.prompt_tokens + usage.completion_tokens;
    return usage;
}

std::string makeResponseId(RequestShape shape, const std::string& request_id) {
    return (shape == RequestShape::Chat ? "chatcmpl-" : "cmpl-") + request_id;
}

int64_t currentUnixTimestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

json buildCompletionResponse(const TranslatedRequest& request,
                             const std::string& generated_text,
                             const ResponseMeta& meta) {
    json choice;
    if (request.shape == RequestShape::Chat) {
        choice = {
            {"index", 0},
            {"message", {{"role", "assistant"}, {"content", generated_text}}},
            {"finish_reason", "stop"}
        };
    } else {
        choice = {
            {"index", 0},
            {"text", generated_text},
            {"logprobs", nullptr},
            {"finish_reason", "stop"}
        };
    }
    return {
        {"id", meta.id},
        {"object", objectTag(request.shape, false)},
        {"created", meta.created},
        {"model", meta.model},
        {"choices", json::array({choice})},
        {"usage", computeUsage(request.prompt, generated_text).toJson()}
    };
}

json buildStreamChunk(RequestShape shape, const ResponseMeta& meta, const std::string& text, bool first) {
    json choice = {{"index", 0}, {"finish_reason", nullptr}};
    if (shape == RequestShape::Chat) {
        json delta = {{"content", text}};
        if (first) delta["role"] = "assistant";
        choice["delta"] = std::move(delta);
    } else {
        choice["text"] = text;
    }
    return chunkEnvelope(shape, meta, json::array({choice}));
}

json buildFinalStreamChunk(RequestShape shape, const ResponseMeta& meta) {
    json choice = {{"index", 0}, {"finish_reason", "stop"}};
    if (shape == RequestShape::Chat) {
        choice["delta"] = json::object();
    } else {
        choice["text"] = "";
    }
    return chunkEnvelope(shape, meta, json::array({choice}));
}

json buildUsageStreamChunk(RequestShape shape, const ResponseMeta& meta, const Usage& usage) {
    json chunk = chunkEnvelope(shape, meta, json::array());
    chunk["usage"] = usage.toJson();
    return chunk;
}

std::string extractStreamText(const json& event) {
    if (!event.is_object()) return "";
    auto choices = event.find("choices");
    if (choices != event.end() && choices->is_array() && !choices->empty()) {
        const json& choice = choices->front();
        if (choice.is_object()) {
            auto delta = choice.find("delta");
            if (delta != choice.end() && delta->is_object()) {
                auto content = delta->find("content");
                if (content != delta->end() && content->is_string()) {
                    return content->get<std::string>();
                }
            }
            auto text = choice.find("text");
            if (text != choice.end() && text->is_string()) {
                return text->get<std::string>();
            }
        }
    }
    auto token = event.find("token");
    if (token != event.end() && token->is_object()) {
        auto text = token->find("text");
        if (text != token->end() && text->is_string()) {
            // TGI marks prompt/special tokens; they are not part of the output
            if (get_or<bool>(*token, "special", false)) return "";
            return text->get<std::string>();
        }
    }
    return "";
}

}  // namespace sagegate
