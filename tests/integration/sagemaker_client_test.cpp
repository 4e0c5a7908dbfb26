#include <gtest/gtest.h>
#include <httplib.h>
#include <cstdlib>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "api/http_server.h"
#include "backend/sagemaker_client.h"
#include "event_stream_frames.h"
#include "gateway/gateway.h"

using namespace sagegate;
using json = nlohmann::json;

class EnvGuard {
public:
    explicit EnvGuard(std::vector<std::string> keys) : keys_(std::move(keys)) {
        for (const auto& key : keys_) {
            if (const char* value = std::getenv(key.c_str())) saved_[key] = value;
        }
    }
    ~EnvGuard() {
        for (const auto& key : keys_) {
            if (auto it = saved_.find(key); it != saved_.end()) {
                setenv(key.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(key.c_str());
            }
        }
    }

private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

namespace {

constexpr const char* kEndpoint = "test-endpoint";
constexpr const char* kEventStreamType = "application/vnd.amazon.eventstream";

using test::exceptionFrame;

std::string payloadPart(const std::string& bytes) { return test::payloadPartFrame(bytes); }

std::string sseToken(const std::string& text) {
    return "data: " + json{{"token", {{"text", text}, {"special", false}}}}.dump() + "\n\n";
}

// SageMaker runtime stand-in. Rejects unsigned requests with 403.
class MockRuntime {
public:
    MockRuntime() {
        const std::string base = std::string("/endpoints/") + kEndpoint;
        server_.Post(base + "/invocations", [this](const httplib::Request& req, httplib::Response& res) {
            if (!authorized(req, res)) return;
            if (!sync_error_type_.empty()) {
                res.status = 424;
                res.set_header("x-amzn-ErrorType", sync_error_type_);
                res.set_content(R"({"ErrorCode":"CLIENT_ERROR_FROM_MODEL","Message":"Received client error (424)"})",
                                "application/json");
                return;
            }
            res.set_content(R"([{"generated_text":"signed and delivered"}])", "application/json");
        });
        server_.Post(base + "/invocations-response-stream",
                     [this](const httplib::Request& req, httplib::Response& res) {
            if (!authorized(req, res)) return;
            if (fail_stream_) {
                res.status = 424;
                res.set_header("x-amzn-ErrorType", sync_error_type_);
                res.set_content(R"({"ErrorCode":"CLIENT_ERROR_FROM_MODEL","Message":"Received client error (424)"})",
                                "application/json");
                return;
            }
            const std::vector<std::string> frames = stream_frames_;
            res.set_chunked_content_provider(kEventStreamType, [frames](size_t, httplib::DataSink& sink) {
                for (const auto& frame : frames) {
                    if (!sink.write(frame.data(), frame.size())) return false;
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

    ~MockRuntime() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    void setStreamFrames(std::vector<std::string> frames) { stream_frames_ = std::move(frames); }
    void failSyncWith(std::string error_type) { sync_error_type_ = std::move(error_type); }
    void failStream() { fail_stream_ = true; }

    std::string lastAuthorization() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_authorization_;
    }

private:
    bool authorized(const httplib::Request& req, httplib::Response& res) {
        const std::string auth = req.get_header_value("Authorization");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_authorization_ = auth;
        }
        if (auth.rfind("AWS4-HMAC-SHA256 Credential=", 0) != 0 || !req.has_header("X-Amz-Date")) {
            res.status = 403;
            res.set_header("x-amzn-ErrorType", "AccessDeniedException");
            res.set_content(R"({"message":"Missing Authentication Token"})", "application/json");
            return false;
        }
        return true;
    }

    httplib::Server server_;
    std::thread thread_;
    int port_{0};
    std::vector<std::string> stream_frames_;
    std::string sync_error_type_;
    bool fail_stream_{false};
    std::mutex mutex_;
    std::string last_authorization_;
};

class SageMakerClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("AWS_ACCESS_KEY_ID", "AKIDEXAMPLE", 1);
        setenv("AWS_SECRET_ACCESS_KEY", "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY", 1);
        unsetenv("AWS_SESSION_TOKEN");
        // Keep the SDK provider chain away from the host's profiles and instance metadata.
        setenv("AWS_EC2_METADATA_DISABLED", "true", 1);
        setenv("AWS_SHARED_CREDENTIALS_FILE", "/nonexistent/credentials", 1);
        setenv("AWS_CONFIG_FILE", "/nonexistent/config", 1);
    }

    GatewayConfig config() const {
        GatewayConfig cfg;
        cfg.endpoint_name = kEndpoint;
        cfg.region = "us-east-1";
        cfg.backend = BackendKind::SageMaker;
        cfg.backend_url = runtime.url();
        cfg.request_timeout = std::chrono::milliseconds(5000);
        return cfg;
    }

    std::unique_ptr<BackendClient> client() const {
        auto created = SageMakerClient::create(config());
        EXPECT_TRUE(created.ok()) << created.error_message;
        return created.ok() ? std::move(*created.data) : nullptr;
    }

    EnvGuard env{{"AWS_ACCESS_KEY_ID", "AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN", "AWS_EC2_METADATA_DISABLED",
                  "AWS_SHARED_CREDENTIALS_FILE", "AWS_CONFIG_FILE"}};
    MockRuntime runtime;
};

BackendPayload samplePayload() {
    BackendPayload payload;
    payload.inputs = "hello";
    return payload;
}

}  // namespace

TEST_F(SageMakerClientTest, SignedInvokeEndpointReturnsText) {
    auto sm = client();
    ASSERT_TRUE(sm);

    auto result = sm->generate(samplePayload());
    ASSERT_TRUE(result.ok()) << result.error_message;
    EXPECT_EQ(*result.data, "signed and delivered");

    const std::string auth = runtime.lastAuthorization();
    EXPECT_NE(auth.find("Credential=AKIDEXAMPLE/"), std::string::npos);
    EXPECT_NE(auth.find("/us-east-1/sagemaker/aws4_request"), std::string::npos);
    EXPECT_NE(auth.find("SignedHeaders="), std::string::npos);
}

TEST_F(SageMakerClientTest, ModelErrorResponseIsClassified) {
    runtime.failSyncWith("ModelError:http://internal.amazon.com/coral/com.amazon.sagemaker/");
    auto sm = client();
    ASSERT_TRUE(sm);

    auto result = sm->generate(samplePayload());
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, GatewayError::ModelError);
    EXPECT_EQ(result.error_message, "Model error: Received client error (424)");
}

TEST_F(SageMakerClientTest, StreamsPayloadPartsAcrossFrameBoundaries) {
    const std::string first = sseToken("Hel");
    const std::string second = sseToken("lo");
    // The second event is split across two PayloadPart frames.
    runtime.setStreamFrames({
        payloadPart(first),
        payloadPart(second.substr(0, 10)),
        payloadPart(second.substr(10)),
        payloadPart("data: [DONE]\n\n"),
    });
    auto sm = client();
    ASSERT_TRUE(sm);

    std::vector<std::string> texts;
    auto result = sm->generateStream(samplePayload(), [&](const json& event) {
        texts.push_back(event["token"]["text"].get<std::string>());
        return true;
    });
    ASSERT_TRUE(result.ok()) << result.error_message;
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(texts[0], "Hel");
    EXPECT_EQ(texts[1], "lo");
}

TEST_F(SageMakerClientTest, ModelStreamErrorEndsStream) {
    runtime.setStreamFrames({
        payloadPart(sseToken("partial")),
        exceptionFrame("ModelStreamError", R"({"Message":"generation crashed","ErrorCode":"500"})"),
        payloadPart(sseToken("never delivered")),
    });
    auto sm = client();
    ASSERT_TRUE(sm);

    std::vector<std::string> texts;
    auto result = sm->generateStream(samplePayload(), [&](const json& event) {
        texts.push_back(event["token"]["text"].get<std::string>());
        return true;
    });
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, GatewayError::ModelError);
    EXPECT_EQ(result.error_message.rfind("Model error: ", 0), 0u) << result.error_message;
    EXPECT_NE(result.error_message.find("generation crashed"), std::string::npos);
    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts[0], "partial");
}

TEST_F(SageMakerClientTest, InternalStreamFailureIsServerError) {
    runtime.setStreamFrames({
        exceptionFrame("InternalStreamFailure", R"({"Message":"stream broke"})"),
    });
    auto sm = client();
    ASSERT_TRUE(sm);

    auto result = sm->generateStream(samplePayload(), [](const json&) { return true; });
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, GatewayError::ServerError);
    EXPECT_NE(result.error_message.find("stream broke"), std::string::npos) << result.error_message;
}

TEST_F(SageMakerClientTest, CallbackCanStopStream) {
    runtime.setStreamFrames({
        payloadPart(sseToken("one")),
        payloadPart(sseToken("two")),
        payloadPart(sseToken("three")),
    });
    auto sm = client();
    ASSERT_TRUE(sm);

    int seen = 0;
    auto result = sm->generateStream(samplePayload(), [&](const json&) {
        ++seen;
        return false;
    });
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(seen, 1);
}

TEST_F(SageMakerClientTest, UnsignedRequestIsRejectedAsServerError) {
    unsetenv("AWS_ACCESS_KEY_ID");
    unsetenv("AWS_SECRET_ACCESS_KEY");
    auto sm = client();
    ASSERT_TRUE(sm);

    auto result = sm->generate(samplePayload());
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, GatewayError::ServerError);
    EXPECT_NE(result.error_message.find("HTTP 403"), std::string::npos) << result.error_message;
}

TEST_F(SageMakerClientTest, StreamRejectedBeforeFirstEventIsJsonError) {
    runtime.failSyncWith("ModelError:http://internal.amazon.com/coral/com.amazon.sagemaker/");
    runtime.failStream();
    Gateway gateway(config());
    HttpServer server(0, gateway, "127.0.0.1");
    server.start();

    httplib::Client cli("127.0.0.1", server.port());
    json req = {{"prompt", "hi"}, {"stream", true}};
    auto res = cli.Post("/v1/completions", req.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["error"]["type"], "model_error");

    server.stop();
}

TEST_F(SageMakerClientTest, GatewayStreamsThroughRuntime) {
    runtime.setStreamFrames({
        payloadPart(sseToken("Bonjour") + sseToken(" monde")),
        payloadPart("data: [DONE]\n\n"),
    });
    Gateway gateway(config());
    HttpServer server(0, gateway, "127.0.0.1");
    server.start();

    httplib::Client cli("127.0.0.1", server.port());
    json req = {{"prompt", "Say hello in French"}, {"stream", true}};
    auto res = cli.Post("/v1/completions", req.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_NE(res->body.find("\"text\":\"Bonjour\""), std::string::npos) << res->body;
    EXPECT_NE(res->body.find("\"text\":\" monde\""), std::string::npos);
    EXPECT_NE(res->body.find("data: [DONE]\n\n"), std::string::npos);

    server.stop();
}
