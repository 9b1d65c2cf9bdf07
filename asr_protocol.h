#ifndef ASR_PROTOCOL_H
#define ASR_PROTOCOL_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "asr_stream.h"

class AudioChunk;
struct StreamConfig;

enum serviceEventKind_t {
    SVC_SESSION_CREATED,
    SVC_SESSION_UPDATED,
    SVC_SESSION_FINISHED,
    SVC_SPEECH_STARTED,
    SVC_SPEECH_STOPPED,
    SVC_TRANSCRIPTION_DELTA,
    SVC_TRANSCRIPTION_COMPLETED,
    SVC_ERROR,
    SVC_UNKNOWN
};

/*
 * One decoded inbound message. Only the fields defined for `kind` are set;
 * `raw` always holds the payload re-serialized on a single line.
 */
struct ServiceEvent {
    serviceEventKind_t kind = SVC_UNKNOWN;
    std::string type;            /* wire "type" as received             */
    std::string eventId;         /* service "event_id", if any          */

    std::string sessionId;       /* SESSION_CREATED / SESSION_UPDATED   */
    std::string itemId;          /* speech + transcription events       */
    int64_t     audioMs = -1;    /* audio_start_ms / audio_end_ms       */
    std::string text;            /* delta text or final transcript      */
    std::string stash;           /* unconfirmed tail of a `.text` event */
    std::string errorCode;       /* ERROR                               */
    std::string errorMessage;    /* ERROR                               */

    std::string raw;
};

struct DecodeResult {
    bool         ok = false;
    ServiceEvent event;
    std::string  error;
};

const char *service_event_kind_name(serviceEventKind_t kind);

/* "event_" + 32 lowercase hex digits */
std::string make_event_id();

/* ── Outbound ─────────────────────────────────────────────────────────────── */
std::string encode_session_update(const StreamConfig &cfg);
std::string encode_audio_append(const AudioChunk &chunk);
std::string encode_session_finish();

/* ── Inbound ──────────────────────────────────────────────────────────────── */
DecodeResult decode_service_event(const std::string &message);

/* Binary frames carry nothing this protocol defines; they map to SVC_UNKNOWN. */
DecodeResult decode_binary_frame(size_t len);

bool is_valid_utf8(const char *str, size_t len);

#endif /* ASR_PROTOCOL_H */
