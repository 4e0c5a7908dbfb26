#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "backend/backend_client.h"
#include "core/gateway_error.h"

namespace sagegate {

enum class ChatRole {
    System,
    User,
    Assistant,
    Other,
};

ChatRole parse_chat_role(const std::string& role);

struct ChatMessage {
    ChatRole role{ChatRole::User};
    std::string content;
};

// Decided by the payload: "messages" -> Chat, otherwise "prompt" -> Completion.
enum class RequestShape {
    Chat,
    Completion,
};

struct TranslatedRequest {
    RequestShape shape{RequestShape::Chat};
    std::vector<ChatMessage> messages;  // Chat only
    std::string prompt;                 // flattened text sent to the backend
    GenerationParameters parameters;
    bool stream{false};
    bool include_usage{false};  // stream_options.include_usage

    BackendPayload toBackendPayload() const;
};

/// Validates an OpenAI-style request object and maps it onto the backend
/// contract. All violations are InvalidRequest.
Result<TranslatedRequest> translateRequest(const nlohmann::json& payload);

// "System: ..." / "Assistant: ..." / bare user content, one message per line.
std::string flattenConversation(const std::vector<ChatMessage>& messages);

size_t countWhitespaceTokens(std::string_view text);

struct Usage {
    size_t prompt_tokens{0};
    size_t completion_tokens{0};
    size_t total_tokens{0};

    nlohmann::json toJson() const;
};

Usage computeUsage(std::string_view prompt, std::string_view generated);

// Identity shared by a response and all of its stream chunks.
struct ResponseMeta {
    std::string id;
    std::string model;
    int64_t created{0};
};

// "chatcmpl-<request id>" or "cmpl-<request id>".
std::string makeResponseId(RequestShape shape, const std::string& request_id);

int64_t currentUnixTimestamp();

// chat.completion or text_completion with usage.
nlohmann::json buildCompletionResponse(const TranslatedRequest& request,
                                       const std::string& generated_text,
                                       const ResponseMeta& meta);

// One incremental chunk. The first chat chunk announces the assistant role.
nlohmann::json buildStreamChunk(RequestShape shape, const ResponseMeta& meta, const std::string& text, bool first);

// Closing chunk with finish_reason "stop".
nlohmann::json buildFinalStreamChunk(RequestShape shape, const ResponseMeta& meta);

// Chunk with empty choices carrying the usage totals.
nlohmann::json buildUsageStreamChunk(RequestShape shape, const ResponseMeta& meta, const Usage& usage);

// Text of a backend stream event: choices[0].delta.content, choices[0].text or token.text.
std::string extractStreamText(const nlohmann::json& event);

}  // namespace sagegate
