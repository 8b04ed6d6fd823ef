#include <gtest/gtest.h>
#include "api_router.hpp"
#include "metrics.hpp"
#include <chrono>

using namespace passgen;

namespace {

Request make_request(http::verb verb, const std::string& target, const std::string& body = "") {
    Request req{verb, target, 11};
    req.set(http::field::host, "localhost");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();
    return req;
}

json::value body_of(const Response& res) {
    return json::parse(res.body());
}

} // namespace

class ApiRouterTest : public ::testing::Test {
protected:
    void SetUp() override { MetricsRegistry::instance().reset(); }

    ServerConfig config;
    FixedClock clock{1700000000};
    ApiRouter router{config, clock};

    Response send(http::verb verb, const std::string& target, const std::string& body = "",
                  const std::string& remote_addr = "203.0.113.7") {
        return router.route(make_request(verb, target, body), remote_addr);
    }
};

// --- Generation ---

TEST_F(ApiRouterTest, GenerateViaGet) {
    auto res = send(http::verb::get, "/generate?length=16&phrase=test");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = body_of(res).as_object();
    EXPECT_EQ(body.at("password").as_string(), "253f647956f2dfae");
    EXPECT_EQ(body.at("timestamp").as_int64(), 1700000000);
    EXPECT_EQ(body.at("length").as_int64(), 16);
}

TEST_F(ApiRouterTest, GenerateViaPost) {
    auto res = send(http::verb::post, "/generate", R"({"length": 16, "phrase": "test"})");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(body_of(res).as_object().at("password").as_string(), "253f647956f2dfae");
}

TEST_F(ApiRouterTest, RangeErrorsAreIdenticalAcrossBindings) {
    for (const char* length : {"0", "65"}) {
        auto via_get = send(http::verb::get, std::string("/generate?length=") + length);
        auto via_post = send(http::verb::post, "/generate", std::string("{\"length\": ") + length + "}");
        EXPECT_EQ(via_get.result(), http::status::bad_request);
        EXPECT_EQ(via_post.result(), http::status::bad_request);
        EXPECT_EQ(via_get.body(), R"({"detail":"Length must be between 1 and 64 characters"})");
        EXPECT_EQ(via_get.body(), via_post.body());
    }
}

TEST_F(ApiRouterTest, PasswordChangesWithClock) {
    auto first = send(http::verb::get, "/generate?length=64&phrase=test");
    clock.set(1700000001);
    auto second = send(http::verb::get, "/generate?length=64&phrase=test");
    EXPECT_NE(body_of(first).as_object().at("password"), body_of(second).as_object().at("password"));
    EXPECT_EQ(body_of(second).as_object().at("timestamp").as_int64(), 1700000001);
}

// --- Discovery and health ---

TEST_F(ApiRouterTest, RootDescribesService) {
    auto res = send(http::verb::get, "/");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = body_of(res).as_object();
    EXPECT_EQ(body.at("message").as_string(), "Password Generator API");
    EXPECT_EQ(body.at("author").as_string(), "rohan srivastav");

    const auto& endpoints = body.at("endpoints").as_array();
    ASSERT_EQ(endpoints.size(), 3u);
    EXPECT_EQ(endpoints[0].as_string(), "/generate");
    EXPECT_EQ(endpoints[1].as_string(), "/health");
    EXPECT_EQ(endpoints[2].as_string(), "/openapi.json");
}

TEST_F(ApiRouterTest, HealthReportsClock) {
    auto res = send(http::verb::get, "/health");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = body_of(res).as_object();
    EXPECT_EQ(body.at("status").as_string(), "healthy");
    EXPECT_EQ(body.at("timestamp").as_int64(), 1700000000);
    EXPECT_EQ(body.size(), 2u);
}

TEST(ApiRouterWallClockTest, HealthTimestampTracksSystemClock) {
    ServerConfig config;
    SystemClock clock;
    ApiRouter router(config, clock);

    auto epoch_now = [] {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    };

    auto before = epoch_now();
    auto res = router.route(make_request(http::verb::get, "/health"), "203.0.113.7");
    auto after = epoch_now();

    ASSERT_EQ(res.result(), http::status::ok);
    auto timestamp = body_of(res).as_object().at("timestamp").as_int64();
    EXPECT_GE(timestamp, before);
    EXPECT_LE(timestamp, after);
}

TEST_F(ApiRouterTest, OpenApiDocumentsGenerate) {
    auto res = send(http::verb::get, "/openapi.json");
    ASSERT_EQ(res.result(), http::status::ok);
    auto doc = body_of(res).as_object();
    EXPECT_EQ(doc.at("openapi").as_string(), "3.0.3");
    EXPECT_EQ(doc.at("info").as_object().at("title").as_string(), "Password Generator API");

    const auto& generate = doc.at("paths").as_object().at("/generate").as_object();
    ASSERT_TRUE(generate.contains("get"));
    ASSERT_TRUE(generate.contains("post"));

    const auto& length = generate.at("get").as_object().at("parameters").as_array()[0].as_object();
    EXPECT_EQ(length.at("name").as_string(), "length");
    EXPECT_TRUE(length.at("required").as_bool());
    EXPECT_EQ(length.at("schema").as_object().at("minimum").as_int64(), 1);
    EXPECT_EQ(length.at("schema").as_object().at("maximum").as_int64(), 64);
}

TEST_F(ApiRouterTest, MetricsOnlyForLoopback) {
    send(http::verb::get, "/generate?length=8");

    auto local = send(http::verb::get, "/metrics", "", "127.0.0.1");
    ASSERT_EQ(local.result(), http::status::ok);
    EXPECT_NE(local[http::field::content_type].find("text/plain"), beast::string_view::npos);
    EXPECT_NE(local.body().find("http_requests_total 1"), std::string::npos);
    EXPECT_NE(local.body().find("passwords_generated_total 1"), std::string::npos);

    auto remote = send(http::verb::get, "/metrics", "", "198.51.100.4");
    EXPECT_EQ(remote.result(), http::status::not_found);
    EXPECT_EQ(remote.body(), R"({"detail":"Not Found"})");
}

TEST_F(ApiRouterTest, LoopbackAddresses) {
    EXPECT_TRUE(ApiRouter::is_loopback("127.0.0.1"));
    EXPECT_TRUE(ApiRouter::is_loopback("::1"));
    EXPECT_TRUE(ApiRouter::is_loopback("::ffff:127.0.0.1"));
    EXPECT_FALSE(ApiRouter::is_loopback("10.0.0.1"));
    EXPECT_FALSE(ApiRouter::is_loopback("unknown"));
}

// --- Routing errors ---

TEST_F(ApiRouterTest, UnknownPathIsNotFound) {
    auto res = send(http::verb::get, "/docs");
    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(res.body(), R"({"detail":"Not Found"})");
    EXPECT_EQ(send(http::verb::get, "/generate/extra?length=8").result(), http::status::not_found);
}

TEST_F(ApiRouterTest, WrongMethodIsNotAllowed) {
    auto res = send(http::verb::delete_, "/generate");
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(res[http::field::allow], "GET, POST, OPTIONS");
    EXPECT_EQ(res.body(), R"({"detail":"Method Not Allowed"})");

    auto health = send(http::verb::post, "/health", "{}");
    EXPECT_EQ(health.result(), http::status::method_not_allowed);
    EXPECT_EQ(health[http::field::allow], "GET, OPTIONS");
}

// --- Headers ---

TEST_F(ApiRouterTest, PreflightReturnsNoContent) {
    auto req = make_request(http::verb::options, "/generate");
    req.set(http::field::origin, "https://app.example");
    auto res = router.route(req, "203.0.113.7");

    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_TRUE(res.body().empty());
    EXPECT_EQ(res[http::field::access_control_allow_origin], "https://app.example");
    EXPECT_EQ(res[http::field::access_control_allow_methods], "GET, POST, OPTIONS");
    EXPECT_EQ(res[http::field::access_control_allow_headers], "Content-Type");
}

TEST_F(ApiRouterTest, CorsRespectsAllowList) {
    config.allowed_origins = {"https://trusted.example"};

    auto trusted = make_request(http::verb::get, "/health");
    trusted.set(http::field::origin, "https://trusted.example");
    auto res = router.route(trusted, "203.0.113.7");
    EXPECT_EQ(res[http::field::access_control_allow_origin], "https://trusted.example");
    EXPECT_EQ(res[http::field::vary], "Origin");

    auto other = make_request(http::verb::get, "/health");
    other.set(http::field::origin, "https://evil.example");
    auto denied = router.route(other, "203.0.113.7");
    EXPECT_EQ(denied.result(), http::status::ok);
    EXPECT_EQ(denied.find(http::field::access_control_allow_origin), denied.end());
}

TEST_F(ApiRouterTest, SecurityHeadersOnEveryResponse) {
    for (const auto& res : {send(http::verb::get, "/health"), send(http::verb::get, "/nope"),
                            send(http::verb::get, "/generate?length=99")}) {
        EXPECT_EQ(res["X-Content-Type-Options"], "nosniff");
        EXPECT_EQ(res["X-Frame-Options"], "DENY");
        EXPECT_EQ(res[http::field::cache_control], "no-store");
        EXPECT_EQ(res[http::field::server], "passgen/1.0.0");
        EXPECT_EQ(res.find("Strict-Transport-Security"), res.end());
    }

    config.enable_tls = true;
    auto tls = send(http::verb::get, "/health");
    EXPECT_NE(tls.find("Strict-Transport-Security"), tls.end());
}

TEST_F(ApiRouterTest, KeepAliveFollowsRequest) {
    auto req = make_request(http::verb::get, "/health");
    EXPECT_TRUE(router.route(req, "203.0.113.7").keep_alive());

    req.keep_alive(false);
    EXPECT_FALSE(router.route(req, "203.0.113.7").keep_alive());
}

TEST_F(ApiRouterTest, CountsRequestsAndOutcomes) {
    send(http::verb::get, "/generate?length=8");
    send(http::verb::get, "/generate?length=0");
    send(http::verb::get, "/health");

    auto& metrics = MetricsRegistry::instance();
    EXPECT_EQ(metrics.get_counter(metric::HTTP_REQUESTS), 3.0);
    EXPECT_EQ(metrics.get_counter(metric::PASSWORDS_GENERATED), 1.0);
    EXPECT_EQ(metrics.get_counter(metric::GENERATE_REJECTED), 1.0);
}
