#include <catch2/catch.hpp>

#include <string>

#include "stream_config.h"

namespace {

    StreamConfig valid_config() {
        StreamConfig cfg;
        cfg.apiKey = "sk-test";
        return cfg;
    }

} /* anonymous namespace */

TEST_CASE("WebSocket URI validation", "[config]") {
    CHECK(validate_ws_uri("wss://dashscope.aliyuncs.com/api-ws/v1/realtime"));
    CHECK(validate_ws_uri("ws://127.0.0.1:8080/realtime"));
    CHECK(validate_ws_uri("ws://localhost"));
    CHECK(validate_ws_uri("wss://host.example?x=1"));

    CHECK_FALSE(validate_ws_uri(""));
    CHECK_FALSE(validate_ws_uri("https://example.com"));
    CHECK_FALSE(validate_ws_uri("ws://"));
    CHECK_FALSE(validate_ws_uri("ws://bad_host/"));
    CHECK_FALSE(validate_ws_uri("ws://host:/x"));
    CHECK_FALSE(validate_ws_uri("ws://host:80a/x"));
    CHECK_FALSE(validate_ws_uri("ws://" + std::string(MAX_WS_URI, 'a')));
}

TEST_CASE("Stream configuration validation", "[config]") {
    std::string err;
    CHECK(validate_stream_config(valid_config(), err));

    SECTION("MissingApiKey") {
        StreamConfig cfg = valid_config();
        cfg.apiKey.clear();
        CHECK_FALSE(validate_stream_config(cfg, err));
        CHECK(err.find("api key") != std::string::npos);
    }

    SECTION("BadEndpoint") {
        StreamConfig cfg = valid_config();
        cfg.endpoint = "http://example.com";
        CHECK_FALSE(validate_stream_config(cfg, err));
    }

    SECTION("VadThresholdRange") {
        StreamConfig cfg = valid_config();
        cfg.vadThreshold = 1.5;
        CHECK_FALSE(validate_stream_config(cfg, err));
        cfg.vadThreshold = 0.0;
        CHECK(validate_stream_config(cfg, err));
    }

    SECTION("ChunkMustHoldWholeFrames") {
        StreamConfig cfg = valid_config();
        cfg.chunkBytes = 6401;
        CHECK_FALSE(validate_stream_config(cfg, err));
        cfg.chunkBytes = 0;
        CHECK_FALSE(validate_stream_config(cfg, err));
    }

    SECTION("Timeouts") {
        StreamConfig cfg = valid_config();
        cfg.handshakeTimeoutMs = 0;
        CHECK_FALSE(validate_stream_config(cfg, err));
        cfg = valid_config();
        cfg.drainTimeoutMs = -1;
        CHECK_FALSE(validate_stream_config(cfg, err));
    }

    SECTION("SendLead") {
        StreamConfig cfg = valid_config();
        cfg.sendLeadMs = -1;
        CHECK_FALSE(validate_stream_config(cfg, err));
        CHECK(err.find("send lead") != std::string::npos);
        cfg.sendLeadMs = 0;
        CHECK(validate_stream_config(cfg, err));
    }

    SECTION("MalformedExtraHeaders") {
        StreamConfig cfg = valid_config();
        cfg.extraHeaders = "{\"X-Trace\": 5}";
        CHECK_FALSE(validate_stream_config(cfg, err));
        cfg.extraHeaders = "not json";
        CHECK_FALSE(validate_stream_config(cfg, err));
    }
}

TEST_CASE("Request URL and headers", "[config]") {
    StreamConfig cfg = valid_config();
    cfg.model = "qwen3-asr-flash-realtime";
    CHECK(stream_request_url(cfg) ==
          "wss://dashscope.aliyuncs.com/api-ws/v1/realtime?model=qwen3-asr-flash-realtime");

    cfg.endpoint = "ws://localhost:9000/rt?region=cn";
    CHECK(stream_request_url(cfg) == "ws://localhost:9000/rt?region=cn&model=qwen3-asr-flash-realtime");

    cfg.extraHeaders = "{\"X-DashScope-WorkSpace\":\"ws-1\"}";
    headerList_t headers;
    std::string err;
    REQUIRE(stream_request_headers(cfg, headers, err));
    REQUIRE(headers.size() == 3);
    CHECK(headers[0].first == "Authorization");
    CHECK(headers[0].second == "Bearer sk-test");
    CHECK(headers[1].first == "OpenAI-Beta");
    CHECK(headers[1].second == "realtime=v1");
    CHECK(headers[2].first == "X-DashScope-WorkSpace");
    CHECK(headers[2].second == "ws-1");
}
