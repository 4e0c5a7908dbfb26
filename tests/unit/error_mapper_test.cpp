#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "gateway/error_mapper.h"

using namespace sagegate;
using json = nlohmann::json;

TEST(ErrorMapperTest, TaxonomyMapsToStatus) {
    EXPECT_EQ(to_http_status(GatewayError::InvalidRequest), 400);
    EXPECT_EQ(to_http_status(GatewayError::ModelError), 500);
    EXPECT_EQ(to_http_status(GatewayError::ServerError), 500);
    EXPECT_EQ(to_http_status(GatewayError::NotFound), 404);
    EXPECT_STREQ(to_error_type(GatewayError::InvalidRequest), "invalid_request_error");
    EXPECT_STREQ(to_error_type(GatewayError::ModelError), "model_error");
    EXPECT_STREQ(to_error_type(GatewayError::ServerError), "server_error");
    EXPECT_STREQ(to_error_type(GatewayError::NotFound), "not_found");
}

TEST(ErrorMapperTest, ErrorResponseCarriesEnvelopeAndCors) {
    CorsPolicy cors;
    auto res = makeErrorResponse(GatewayError::NotFound, "Not found", cors);
    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(res.headers["Content-Type"], "application/json");
    EXPECT_EQ(res.headers["access-control-allow-origin"], "*");
    EXPECT_EQ(res.headers["Access-Control-Allow-Methods"], "GET, POST, OPTIONS");
    EXPECT_EQ(res.headers["Access-Control-Allow-Headers"], "Content-Type, Authorization");

    auto body = json::parse(res.body);
    EXPECT_EQ(body["error"]["message"], "Not found");
    EXPECT_EQ(body["error"]["type"], "not_found");
}

TEST(ErrorMapperTest, LongMessagesAreTruncated) {
    auto envelope = makeErrorEnvelope(GatewayError::ServerError, std::string(10000, 'x'));
    EXPECT_LT(envelope["error"]["message"].get<std::string>().size(), 2100u);
}

TEST(ErrorMapperTest, EveryResponseCarriesCors) {
    const auto cors = CorsPolicy::fromConfig(GatewayConfig{});
    for (const auto& res : {makeJsonResponse(200, json::object(), cors),
                            makeErrorResponse(GatewayError::InvalidRequest, "bad", cors),
                            makeErrorResponse(GatewayError::NotFound, "Not found", cors),
                            makeErrorResponse(GatewayError::ServerError, "boom", cors)}) {
        EXPECT_EQ(res.headers.at("Access-Control-Allow-Origin"), "*") << res.status;
        EXPECT_EQ(res.headers.at("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");
        EXPECT_EQ(res.headers.at("Access-Control-Allow-Headers"), "Content-Type, Authorization");
    }
}

TEST(ErrorMapperTest, CorsPolicyFollowsConfig) {
    GatewayConfig cfg;
    cfg.cors_allow_origin = "https://example.com";
    auto cors = CorsPolicy::fromConfig(cfg);
    HeaderMap headers;
    headers["Access-Control-Allow-Methods"] = "GET";
    applyCorsHeaders(headers, cors);
    EXPECT_EQ(headers["Access-Control-Allow-Origin"], "https://example.com");
    EXPECT_EQ(headers["Access-Control-Allow-Methods"], "GET");  // existing value kept
}
