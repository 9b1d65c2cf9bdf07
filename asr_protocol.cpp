/*
 * asr_protocol.cpp
 *
 * JSON codec for the realtime transcription protocol.
 *
 * Outbound: session.update (once, before any audio), input_audio_buffer.append
 * (one per AudioChunk, base64 audio) and session.finish.
 * Inbound: every text frame decodes to exactly one ServiceEvent. Types the
 * client does not know decode to SVC_UNKNOWN with the payload kept verbatim;
 * only payloads that are not UTF-8 JSON are decode errors.
 */

#include "asr_protocol.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <random>

#include <cjson/cJSON.h>
#include "base64.h"

#include "audio_framer.h"
#include "stream_config.h"

namespace {

    using jsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

    std::string print_json(const cJSON *item) {
        char *json_str = cJSON_PrintUnformatted(item);
        if (!json_str) return std::string();
        std::string out(json_str);
        std::free(json_str);
        return out;
    }

    const char *json_cstr(const cJSON *obj, const char *key) {
        if (!obj) return nullptr;
        const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, key);
        if (!cJSON_IsString(item) || !item->valuestring) return nullptr;
        return item->valuestring;
    }

    std::string json_string(const cJSON *obj, const char *key) {
        const char *s = json_cstr(obj, key);
        return s ? std::string(s) : std::string();
    }

    /* doubles outside this range do not convert to int64_t */
    bool fits_int64(double v) {
        return std::isfinite(v) && v > -9.2e18 && v < 9.2e18;
    }

    /* error codes arrive as strings or numbers depending on the error source */
    std::string json_code(const cJSON *obj, const char *key) {
        if (!obj) return std::string();
        const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, key);
        if (cJSON_IsString(item) && item->valuestring) return item->valuestring;
        if (!cJSON_IsNumber(item)) return std::string();
        if (fits_int64(item->valuedouble)) {
            return std::to_string(static_cast<long long>(item->valuedouble));
        }
        char buf[32];
        snprintf(buf, sizeof(buf), "%g", item->valuedouble);
        return buf;
    }

    int64_t json_int(const cJSON *obj, const char *key, int64_t fallback) {
        if (!obj) return fallback;
        const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, key);
        if (!cJSON_IsNumber(item) || !fits_int64(item->valuedouble)) return fallback;
        return static_cast<int64_t>(item->valuedouble);
    }

    jsonPtr new_message(const char *type) {
        jsonPtr root(cJSON_CreateObject(), &cJSON_Delete);
        cJSON_AddStringToObject(root.get(), "event_id", make_event_id().c_str());
        cJSON_AddStringToObject(root.get(), "type", type);
        return root;
    }

    serviceEventKind_t kind_for_type(const std::string &type) {
        if (type == EVT_SESSION_CREATED)   return SVC_SESSION_CREATED;
        if (type == EVT_SESSION_UPDATED)   return SVC_SESSION_UPDATED;
        if (type == EVT_SESSION_FINISHED)  return SVC_SESSION_FINISHED;
        if (type == EVT_SPEECH_STARTED)    return SVC_SPEECH_STARTED;
        if (type == EVT_SPEECH_STOPPED)    return SVC_SPEECH_STOPPED;
        if (type == EVT_TRANSCRIPT_DELTA ||
            type == EVT_TRANSCRIPT_TEXT)   return SVC_TRANSCRIPTION_DELTA;
        if (type == EVT_TRANSCRIPT_DONE)   return SVC_TRANSCRIPTION_COMPLETED;
        if (type == EVT_ERROR ||
            type == EVT_TRANSCRIPT_FAILED) return SVC_ERROR;
        return SVC_UNKNOWN;
    }

} /* anonymous namespace */

const char *service_event_kind_name(serviceEventKind_t kind) {
    switch (kind) {
        case SVC_SESSION_CREATED:         return "SessionCreated";
        case SVC_SESSION_UPDATED:         return "SessionUpdated";
        case SVC_SESSION_FINISHED:        return "SessionFinished";
        case SVC_SPEECH_STARTED:          return "SpeechStarted";
        case SVC_SPEECH_STOPPED:          return "SpeechStopped";
        case SVC_TRANSCRIPTION_DELTA:     return "TranscriptionDelta";
        case SVC_TRANSCRIPTION_COMPLETED: return "TranscriptionCompleted";
        case SVC_ERROR:                   return "Error";
        case SVC_UNKNOWN:                 return "Unknown";
    }
    return "Unknown";
}

std::string make_event_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    char buf[6 + 32 + 1];
    std::snprintf(buf, sizeof(buf), "event_%016llx%016llx",
                  static_cast<unsigned long long>(rng()),
                  static_cast<unsigned long long>(rng()));
    return std::string(buf);
}

/* ═══════════════════════════════════════════════════════════════════════════
 * Outbound
 * ═══════════════════════════════════════════════════════════════════════════ */
std::string encode_session_update(const StreamConfig &cfg) {
    jsonPtr root = new_message(MSG_SESSION_UPDATE);

    cJSON *session = cJSON_CreateObject();
    cJSON *modalities = cJSON_CreateArray();
    cJSON_AddItemToArray(modalities, cJSON_CreateString("text"));
    cJSON_AddItemToObject(session, "modalities", modalities);
    cJSON_AddStringToObject(session, "input_audio_format", "pcm");
    cJSON_AddNumberToObject(session, "sample_rate", cfg.sampleRate);

    cJSON *transcription = cJSON_CreateObject();
    cJSON_AddStringToObject(transcription, "language", cfg.language.c_str());
    cJSON_AddItemToObject(session, "input_audio_transcription", transcription);

    cJSON *turn = cJSON_CreateObject();
    cJSON_AddStringToObject(turn, "type", "server_vad");
    cJSON_AddNumberToObject(turn, "threshold", cfg.vadThreshold);
    cJSON_AddNumberToObject(turn, "silence_duration_ms", cfg.vadSilenceMs);
    cJSON_AddItemToObject(session, "turn_detection", turn);

    cJSON_AddItemToObject(root.get(), "session", session);
    return print_json(root.get());
}

std::string encode_audio_append(const AudioChunk &chunk) {
    jsonPtr root = new_message(MSG_AUDIO_APPEND);
    const std::string encoded = base64_encode(chunk.data().data(), chunk.size());
    cJSON_AddStringToObject(root.get(), "audio", encoded.c_str());
    return print_json(root.get());
}

std::string encode_session_finish() {
    jsonPtr root = new_message(MSG_SESSION_FINISH);
    return print_json(root.get());
}

/* ═══════════════════════════════════════════════════════════════════════════
 * Inbound
 * ═══════════════════════════════════════════════════════════════════════════ */
DecodeResult decode_service_event(const std::string &message) {
    DecodeResult out;

    if (message.find('\0') != std::string::npos) {
        out.error = "payload contains an embedded NUL byte";
        return out;
    }
    if (!is_valid_utf8(message.data(), message.size())) {
        out.error = "payload is not valid UTF-8";
        return out;
    }

    const char *end = nullptr;
    jsonPtr root(cJSON_ParseWithOpts(message.c_str(), &end, 1), &cJSON_Delete);
    if (!root) {
        const size_t at = end ? static_cast<size_t>(end - message.c_str()) : 0;
        out.error = "JSON parse error at offset " + std::to_string(at);
        return out;
    }

    ServiceEvent &ev = out.event;
    ev.raw  = print_json(root.get());
    ev.type = json_string(root.get(), "type");
    ev.eventId = json_string(root.get(), "event_id");
    ev.kind = cJSON_IsObject(root.get()) ? kind_for_type(ev.type) : SVC_UNKNOWN;

    const cJSON *obj = root.get();
    switch (ev.kind) {
        case SVC_SESSION_CREATED:
        case SVC_SESSION_UPDATED:
            ev.sessionId = json_string(cJSON_GetObjectItemCaseSensitive(obj, "session"), "id");
            break;

        case SVC_SPEECH_STARTED:
            ev.itemId  = json_string(obj, "item_id");
            ev.audioMs = json_int(obj, "audio_start_ms", -1);
            break;

        case SVC_SPEECH_STOPPED:
            ev.itemId  = json_string(obj, "item_id");
            ev.audioMs = json_int(obj, "audio_end_ms", -1);
            break;

        case SVC_TRANSCRIPTION_DELTA:
            ev.itemId = json_string(obj, "item_id");
            if (json_cstr(obj, "delta")) {
                ev.text = json_string(obj, "delta");
            } else {
                ev.text  = json_string(obj, "text");
                ev.stash = json_string(obj, "stash");
            }
            break;

        case SVC_TRANSCRIPTION_COMPLETED:
            ev.itemId = json_string(obj, "item_id");
            ev.text   = json_string(obj, "transcript");
            break;

        case SVC_ERROR: {
            ev.itemId = json_string(obj, "item_id");
            const cJSON *err = cJSON_GetObjectItemCaseSensitive(obj, "error");
            if (!cJSON_IsObject(err)) err = obj;
            ev.errorCode    = json_code(err, "code");
            ev.errorMessage = json_string(err, "message");
            if (ev.errorCode.empty()) ev.errorCode = json_string(err, "type");
            break;
        }

        case SVC_SESSION_FINISHED:
        case SVC_UNKNOWN:
            break;
    }

    out.ok = true;
    return out;
}

DecodeResult decode_binary_frame(size_t len) {
    DecodeResult out;
    jsonPtr root(cJSON_CreateObject(), &cJSON_Delete);
    cJSON_AddStringToObject(root.get(), "type", "binary");
    cJSON_AddNumberToObject(root.get(), "bytes", static_cast<double>(len));
    out.event.kind = SVC_UNKNOWN;
    out.event.type = "binary";
    out.event.raw  = print_json(root.get());
    out.ok = true;
    return out;
}

/* ── UTF-8 validation ────────────────────────────────────────────────────── */
bool is_valid_utf8(const char *str, size_t len) {
    const unsigned char *p   = reinterpret_cast<const unsigned char *>(str);
    const unsigned char *end = p + len;

    while (p < end) {
        size_t n = 0;
        if ((*p & 0x80) == 0x00)      n = 1;
        else if ((*p & 0xE0) == 0xC0) n = 2;
        else if ((*p & 0xF0) == 0xE0) n = 3;
        else if ((*p & 0xF8) == 0xF0) n = 4;
        else return false;

        if (static_cast<size_t>(end - p) < n) return false;
        for (size_t i = 1; i < n; ++i) {
            if ((p[i] & 0xC0) != 0x80) return false;
        }
        p += n;
    }
    return true;
}
