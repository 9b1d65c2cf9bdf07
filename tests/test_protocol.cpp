#include <catch2/catch.hpp>

#include <memory>
#include <string>

#include <cjson/cJSON.h>
#include "base64.h"

#include "asr_protocol.h"
#include "audio_framer.h"
#include "stream_config.h"
#include "fake_transport.h"

namespace {

    using jsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

    jsonPtr parse(const std::string &text) {
        return jsonPtr(cJSON_Parse(text.c_str()), &cJSON_Delete);
    }

    const cJSON *path(const cJSON *obj, const char *a, const char *b = nullptr) {
        const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, a);
        if (item && b) item = cJSON_GetObjectItemCaseSensitive(item, b);
        return item;
    }

    bool is_event_id(const std::string &id) {
        if (id.size() != 6 + 32 || id.compare(0, 6, "event_") != 0) return false;
        for (size_t i = 6; i < id.size(); ++i) {
            const char c = id[i];
            if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
        }
        return true;
    }

} /* anonymous namespace */

TEST_CASE("Event ids are unique and well formed", "[protocol]") {
    const std::string a = make_event_id();
    const std::string b = make_event_id();
    CHECK(is_event_id(a));
    CHECK(is_event_id(b));
    CHECK(a != b);
}

TEST_CASE("session.update carries the session parameters", "[protocol]") {
    StreamConfig cfg;
    cfg.sampleRate   = 8000;
    cfg.language     = "en";
    cfg.vadThreshold = 0.5;
    cfg.vadSilenceMs = 400;

    const std::string text = encode_session_update(cfg);
    CHECK(text.find('\n') == std::string::npos);

    jsonPtr root = parse(text);
    REQUIRE(root);
    CHECK(std::string(path(root.get(), "type")->valuestring) == "session.update");
    CHECK(is_event_id(path(root.get(), "event_id")->valuestring));

    const cJSON *session = path(root.get(), "session");
    REQUIRE(cJSON_IsObject(session));
    CHECK(std::string(path(session, "input_audio_format")->valuestring) == "pcm");
    CHECK(path(session, "sample_rate")->valuedouble == 8000);
    CHECK(std::string(path(session, "input_audio_transcription", "language")->valuestring) == "en");
    CHECK(std::string(path(session, "turn_detection", "type")->valuestring) == "server_vad");
    CHECK(path(session, "turn_detection", "threshold")->valuedouble == Approx(0.5));
    CHECK(path(session, "turn_detection", "silence_duration_ms")->valuedouble == 400);

    const cJSON *modalities = path(session, "modalities");
    REQUIRE(cJSON_GetArraySize(modalities) == 1);
    CHECK(std::string(cJSON_GetArrayItem(modalities, 0)->valuestring) == "text");
}

TEST_CASE("input_audio_buffer.append carries base64 audio", "[protocol]") {
    const std::vector<uint8_t> bytes = test_audio(6400);
    AudioChunk chunk(3, bytes);

    const std::string text = encode_audio_append(chunk);
    jsonPtr root = parse(text);
    REQUIRE(root);
    CHECK(std::string(path(root.get(), "type")->valuestring) == "input_audio_buffer.append");

    const std::string decoded = base64_decode(path(root.get(), "audio")->valuestring);
    CHECK(decoded == std::string(bytes.begin(), bytes.end()));
}

TEST_CASE("session.finish has no payload", "[protocol]") {
    jsonPtr root = parse(encode_session_finish());
    REQUIRE(root);
    CHECK(std::string(path(root.get(), "type")->valuestring) == "session.finish");
    CHECK(cJSON_GetArraySize(root.get()) == 2);
}

TEST_CASE("Inbound events map to their kinds", "[protocol]") {
    SECTION("SessionCreated") {
        DecodeResult r = decode_service_event(
            event_json("session.created", "\"session\":{\"id\":\"sess_42\"}"));
        REQUIRE(r.ok);
        CHECK(r.event.kind == SVC_SESSION_CREATED);
        CHECK(r.event.sessionId == "sess_42");
        CHECK(r.event.eventId == "event_test");
    }

    SECTION("SessionUpdated") {
        DecodeResult r = decode_service_event(
            event_json("session.updated", "\"session\":{\"id\":\"sess_42\"}"));
        REQUIRE(r.ok);
        CHECK(r.event.kind == SVC_SESSION_UPDATED);
        CHECK(r.event.sessionId == "sess_42");
    }

    SECTION("SessionFinished") {
        DecodeResult r = decode_service_event(event_json("session.finished"));
        REQUIRE(r.ok);
        CHECK(r.event.kind == SVC_SESSION_FINISHED);
    }

    SECTION("SpeechStartedAndStopped") {
        DecodeResult s = decode_service_event(event_json(
            "input_audio_buffer.speech_started", "\"item_id\":\"item_1\",\"audio_start_ms\":320"));
        REQUIRE(s.ok);
        CHECK(s.event.kind == SVC_SPEECH_STARTED);
        CHECK(s.event.itemId == "item_1");
        CHECK(s.event.audioMs == 320);

        DecodeResult e = decode_service_event(event_json(
            "input_audio_buffer.speech_stopped", "\"item_id\":\"item_1\",\"audio_end_ms\":1880"));
        REQUIRE(e.ok);
        CHECK(e.event.kind == SVC_SPEECH_STOPPED);
        CHECK(e.event.audioMs == 1880);
    }

    SECTION("TranscriptionDelta") {
        DecodeResult d = decode_service_event(event_json(
            "conversation.item.input_audio_transcription.delta",
            "\"item_id\":\"item_1\",\"delta\":\"hel\""));
        REQUIRE(d.ok);
        CHECK(d.event.kind == SVC_TRANSCRIPTION_DELTA);
        CHECK(d.event.text == "hel");

        DecodeResult t = decode_service_event(event_json(
            "conversation.item.input_audio_transcription.text",
            "\"item_id\":\"item_1\",\"text\":\"hello\",\"stash\":\" wor\""));
        REQUIRE(t.ok);
        CHECK(t.event.kind == SVC_TRANSCRIPTION_DELTA);
        CHECK(t.event.text == "hello");
        CHECK(t.event.stash == " wor");
    }

    SECTION("TranscriptionCompleted") {
        DecodeResult r = decode_service_event(event_json(
            "conversation.item.input_audio_transcription.completed",
            "\"item_id\":\"item_1\",\"transcript\":\"你好世界\""));
        REQUIRE(r.ok);
        CHECK(r.event.kind == SVC_TRANSCRIPTION_COMPLETED);
        CHECK(r.event.text == "你好世界");
    }

    SECTION("Error") {
        DecodeResult r = decode_service_event(event_json(
            "error", "\"error\":{\"code\":\"InvalidParameter\",\"message\":\"bad rate\"}"));
        REQUIRE(r.ok);
        CHECK(r.event.kind == SVC_ERROR);
        CHECK(r.event.errorCode == "InvalidParameter");
        CHECK(r.event.errorMessage == "bad rate");

        DecodeResult f = decode_service_event(event_json(
            "conversation.item.input_audio_transcription.failed",
            "\"item_id\":\"item_2\",\"error\":{\"code\":500,\"message\":\"internal\"}"));
        REQUIRE(f.ok);
        CHECK(f.event.kind == SVC_ERROR);
        CHECK(f.event.errorCode == "500");
        CHECK(f.event.itemId == "item_2");
    }
}

TEST_CASE("Out of range numbers do not break decoding", "[protocol]") {
    SECTION("AudioOffset") {
        DecodeResult r = decode_service_event(event_json(
            "input_audio_buffer.speech_started", "\"item_id\":\"item_1\",\"audio_start_ms\":1e30"));
        REQUIRE(r.ok);
        CHECK(r.event.kind == SVC_SPEECH_STARTED);
        CHECK(r.event.audioMs == -1);

        DecodeResult n = decode_service_event(event_json(
            "input_audio_buffer.speech_stopped", "\"audio_end_ms\":-1e19"));
        REQUIRE(n.ok);
        CHECK(n.event.audioMs == -1);
    }

    SECTION("ErrorCode") {
        DecodeResult r = decode_service_event(event_json(
            "error", "\"error\":{\"code\":1e300,\"message\":\"overflow\"}"));
        REQUIRE(r.ok);
        CHECK(r.event.kind == SVC_ERROR);
        CHECK(r.event.errorCode == "1e+300");
        CHECK(r.event.errorMessage == "overflow");

        DecodeResult small = decode_service_event(event_json(
            "error", "\"error\":{\"code\":429,\"message\":\"throttled\"}"));
        REQUIRE(small.ok);
        CHECK(small.event.errorCode == "429");
    }
}

TEST_CASE("Unrecognized events are relayed as Unknown", "[protocol]") {
    const std::string text = event_json("response.audio_transcript.weird", "\"x\":[1,2,3]");
    DecodeResult r = decode_service_event(text);
    REQUIRE(r.ok);
    CHECK(r.event.kind == SVC_UNKNOWN);
    CHECK(r.event.type == "response.audio_transcript.weird");
    CHECK(r.event.raw == text);

    SECTION("TypelessObject") {
        DecodeResult t = decode_service_event("{\"hello\":1}");
        REQUIRE(t.ok);
        CHECK(t.event.kind == SVC_UNKNOWN);
        CHECK(t.event.type.empty());
    }

    SECTION("NonObjectJson") {
        DecodeResult t = decode_service_event("[1,2]");
        REQUIRE(t.ok);
        CHECK(t.event.kind == SVC_UNKNOWN);
    }

    SECTION("BinaryFrame") {
        DecodeResult b = decode_binary_frame(640);
        REQUIRE(b.ok);
        CHECK(b.event.kind == SVC_UNKNOWN);
        CHECK(b.event.raw == "{\"type\":\"binary\",\"bytes\":640}");
    }
}

TEST_CASE("Malformed payloads are decode errors", "[protocol]") {
    CHECK_FALSE(decode_service_event("").ok);
    CHECK_FALSE(decode_service_event("{\"type\":").ok);
    CHECK_FALSE(decode_service_event("{\"type\":\"error\"} trailing").ok);
    CHECK_FALSE(decode_service_event(std::string("{\"a\":\"\xff\xfe\"}")).ok);
    CHECK_FALSE(decode_service_event(std::string("{}\0{}", 5)).ok);

    DecodeResult r = decode_service_event("not json");
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.error.empty());
}

TEST_CASE("UTF-8 validation", "[protocol]") {
    const std::string ok = "abc \xe4\xbd\xa0\xe5\xa5\xbd \xf0\x9f\x8e\xa4";
    CHECK(is_valid_utf8(ok.data(), ok.size()));

    const std::string truncated = "\xe4\xbd";
    CHECK_FALSE(is_valid_utf8(truncated.data(), truncated.size()));

    const std::string badCont = "\xc3\x28";
    CHECK_FALSE(is_valid_utf8(badCont.data(), badCont.size()));
}
