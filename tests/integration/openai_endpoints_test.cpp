#include <gtest/gtest.h>
#include <httplib.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

#include "api/http_server.h"
#include "gateway/gateway.h"
#include "utils/config.h"

using namespace sagegate;
using json = nlohmann::json;

namespace {

// Text-generation server stand-in: /generate and /generate_stream.
class MockTextGeneration {
public:
    MockTextGeneration() {
        server_.Post("/generate", [this](const httplib::Request& req, httplib::Response& res) {
            record(req.body);
            if (fail_status_ != 0) {
                res.status = fail_status_;
                res.set_content(R"({"error":"CUDA out of memory"})", "application/json");
                return;
            }
            res.set_content(R"([{"generated_text":"Paris is the capital"}])", "application/json");
        });
        server_.Post("/generate_stream", [this](const httplib::Request& req, httplib::Response& res) {
            record(req.body);
            if (fail_status_ != 0) {
                res.status = fail_status_;
                res.set_content(R"({"error":"Input validation error"})", "application/json");
                return;
            }
            res.set_chunked_content_provider("text/event-stream", [](size_t, httplib::DataSink& sink) {
                // Event boundaries deliberately fall inside chunks.
                const std::vector<std::string> chunks = {
                    "data: {\"token\":{\"text\":\"Paris\",\"special\":false}}\n\ndata: {\"tok",
                    "en\":{\"text\":\" is\",\"special\":false}}\n\n",
                    "data: {\"token\":{\"text\":\"</s>\",\"special\":true}}\n\n",
                };
                for (const auto& chunk : chunks) {
                    if (!sink.write(chunk.data(), chunk.size())) return false;
                }
                sink.done();
                return true;
            });
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    ~MockTextGeneration() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    void failWith(int status) { fail_status_ = status; }

    json lastRequest() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_request_;
    }

private:
    void record(const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_request_ = json::parse(body, nullptr, false);
    }

    httplib::Server server_;
    std::thread thread_;
    int port_{0};
    int fail_status_{0};
    std::mutex mutex_;
    json last_request_;
};

GatewayConfig configFor(const std::string& backend_url) {
    GatewayConfig cfg;
    cfg.endpoint_name = "test-endpoint";
    cfg.backend = BackendKind::Http;
    cfg.backend_url = backend_url;
    cfg.request_timeout = std::chrono::milliseconds(5000);
    return cfg;
}

std::vector<json> dataEvents(const std::string& body) {
    std::vector<json> events;
    size_t pos = 0;
    while ((pos = body.find("data: ", pos)) != std::string::npos) {
        const size_t end = body.find("\n\n", pos);
        const std::string payload = body.substr(pos + 6, end - pos - 6);
        if (payload != "[DONE]") events.push_back(json::parse(payload));
        pos = end;
    }
    return events;
}

}  // namespace

TEST(OpenAIEndpointsTest, ListsConfiguredEndpointAsModel) {
    MockTextGeneration backend;
    Gateway gateway(configFor(backend.url()));
    HttpServer server(0, gateway, "127.0.0.1");
    server.start();

    httplib::Client cli("127.0.0.1", server.port());
    auto res = cli.Get("/v1/models");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["object"], "list");
    ASSERT_EQ(body["data"].size(), 1u);
    EXPECT_EQ(body["data"][0]["id"], "test-endpoint");
    EXPECT_EQ(body["data"][0]["owned_by"], "sagemaker");
    EXPECT_FALSE(gateway.backendInitialized());

    server.stop();
}

TEST(OpenAIEndpointsTest, ChatCompletionRoundTrip) {
    MockTextGeneration backend;
    Gateway gateway(configFor(backend.url()));
    HttpServer server(0, gateway, "127.0.0.1");
    server.start();

    httplib::Client cli("127.0.0.1", server.port());
    json req = {
        {"model", "ignored"},
        {"messages", json::array({
            {{"role", "system"}, {"content", "be brief"}},
            {{"role", "user"}, {"content", "capital of France?"}}
        })},
        {"max_tokens", 16},
        {"temperature", 0.1}
    };
    auto res = cli.Post("/v1/chat/completions", req.dump(), "application/json");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200) << res->body;
    auto body = json::parse(res->body);
    EXPECT_EQ(body["object"], "chat.completion");
    EXPECT_EQ(body["model"], "test-endpoint");
    EXPECT_EQ(body["choices"][0]["message"]["role"], "assistant");
    EXPECT_EQ(body["choices"][0]["message"]["content"], "Paris is the capital");
    EXPECT_EQ(body["choices"][0]["finish_reason"], "stop");
    EXPECT_EQ(body["usage"]["completion_tokens"], 4);

    auto sent = backend.lastRequest();
    EXPECT_EQ(sent["inputs"], "System: be brief\ncapital of France?");
    EXPECT_EQ(sent["parameters"]["max_new_tokens"], 16);
    EXPECT_DOUBLE_EQ(sent["parameters"]["temperature"].get<double>(), 0.1);
    EXPECT_FALSE(sent.contains("stream"));
    EXPECT_TRUE(gateway.backendInitialized());

    server.stop();
}

TEST(OpenAIEndpointsTest, TextCompletionRoundTrip) {
    MockTextGeneration backend;
    Gateway gateway(configFor(backend.url()));
    HttpServer server(0, gateway, "127.0.0.1");
    server.start();

    httplib::Client cli("127.0.0.1", server.port());
    json req = {{"prompt", "The capital of France"}};
    auto res = cli.Post("/v1/completions", req.dump(), "application/json");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200) << res->body;
    auto body = json::parse(res->body);
    EXPECT_EQ(body["object"], "text_completion");
    EXPECT_EQ(body["choices"][0]["text"], "Paris is the capital");
    EXPECT_EQ(backend.lastRequest()["inputs"], "The capital of France");

    server.stop();
}

TEST(OpenAIEndpointsTest, StreamsChatChunks) {
    MockTextGeneration backend;
    Gateway gateway(configFor(backend.url()));
    HttpServer server(0, gateway, "127.0.0.1");
    server.start();

    httplib::Client cli("127.0.0.1", server.port());
    json req = {
        {"messages", json::array({{{"role", "user"}, {"content", "capital of France?"}}})},
        {"stream", true},
        {"stream_options", {{"include_usage", true}}}
    };
    auto res = cli.Post("/v1/chat/completions", req.dump(), "application/json");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200);
    EXPECT_NE(res->get_header_value("Content-Type").find("text/event-stream"), std::string::npos);

    auto events = dataEvents(res->body);
    // two content chunks, final chunk, usage chunk
    ASSERT_EQ(events.size(), 4u) << res->body;
    EXPECT_EQ(events[0]["object"], "chat.completion.chunk");
    EXPECT_EQ(events[0]["choices"][0]["delta"]["role"], "assistant");
    EXPECT_EQ(events[0]["choices"][0]["delta"]["content"], "Paris");
    EXPECT_EQ(events[1]["choices"][0]["delta"]["content"], " is");
    EXPECT_EQ(events[2]["choices"][0]["finish_reason"], "stop");
    EXPECT_EQ(events[3]["usage"]["completion_tokens"], 2);
    EXPECT_NE(res->body.find("data: [DONE]\n\n"), std::string::npos);

    auto sent = backend.lastRequest();
    EXPECT_EQ(sent["stream"], true);

    server.stop();
}

TEST(OpenAIEndpointsTest, ModelFailureMapsToModelError) {
    MockTextGeneration backend;
    backend.failWith(424);
    Gateway gateway(configFor(backend.url()));
    HttpServer server(0, gateway, "127.0.0.1");
    server.start();

    httplib::Client cli("127.0.0.1", server.port());
    json req = {{"prompt", "hi"}};
    auto res = cli.Post("/v1/completions", req.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["error"]["type"], "model_error");
    EXPECT_EQ(body["error"]["message"], "Model error: CUDA out of memory");

    server.stop();
}

TEST(OpenAIEndpointsTest, BackendFailureMapsToServerError) {
    MockTextGeneration backend;
    backend.failWith(503);
    Gateway gateway(configFor(backend.url()));
    HttpServer server(0, gateway, "127.0.0.1");
    server.start();

    httplib::Client cli("127.0.0.1", server.port());
    json req = {{"prompt", "hi"}};
    auto res = cli.Post("/v1/completions", req.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["error"]["type"], "server_error");
    EXPECT_NE(body["error"]["message"].get<std::string>().find("Backend returned HTTP 503"), std::string::npos);

    server.stop();
}

TEST(OpenAIEndpointsTest, StreamFailureBeforeFirstByteIsJsonError) {
    MockTextGeneration backend;
    backend.failWith(424);
    Gateway gateway(configFor(backend.url()));
    HttpServer server(0, gateway, "127.0.0.1");
    server.start();

    httplib::Client cli("127.0.0.1", server.port());
    json req = {{"prompt", "hi"}, {"stream", true}};
    auto res = cli.Post("/v1/completions", req.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
    auto body = json::parse(res->body);
    EXPECT_EQ(body["error"]["type"], "model_error");
    EXPECT_EQ(res->body.find("data: "), std::string::npos);

    server.stop();
}

TEST(OpenAIEndpointsTest, UnreachableBackendIsServerError) {
    // Bind, serve and stop a throwaway server so the port is known to be closed.
    int closed_port = 0;
    {
        httplib::Server throwaway;
        closed_port = throwaway.bind_to_any_port("127.0.0.1");
        std::thread t([&throwaway]() { throwaway.listen_after_bind(); });
        while (!throwaway.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        throwaway.stop();
        t.join();
    }
    Gateway gateway(configFor("http://127.0.0.1:" + std::to_string(closed_port)));
    HttpServer server(0, gateway, "127.0.0.1");
    server.start();

    httplib::Client cli("127.0.0.1", server.port());
    json req = {{"prompt", "hi"}};
    auto res = cli.Post("/v1/completions", req.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["error"]["type"], "server_error");
    EXPECT_NE(body["error"]["message"].get<std::string>().find("Backend request failed"), std::string::npos);

    server.stop();
}

TEST(OpenAIEndpointsTest, InvalidRequestsNeverReachBackend) {
    MockTextGeneration backend;
    Gateway gateway(configFor(backend.url()));
    HttpServer server(0, gateway, "127.0.0.1");
    server.start();

    httplib::Client cli("127.0.0.1", server.port());
    for (const std::string payload : {R"({"messages":[]})", R"({"prompt":"hi","max_tokens":0})", R"({"model":"x"})"}) {
        auto res = cli.Post("/v1/chat/completions", payload, "application/json");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 400) << payload;
        EXPECT_EQ(json::parse(res->body)["error"]["type"], "invalid_request_error");
    }
    EXPECT_TRUE(backend.lastRequest().is_null());

    server.stop();
}
