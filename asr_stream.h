#ifndef ASR_STREAM_H
#define ASR_STREAM_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#define ASR_STREAM_NAME    "asr-stream"
#define ASR_STREAM_VERSION "0.3.0"

#define ASR_DEFAULT_ENDPOINT "wss://dashscope.aliyuncs.com/api-ws/v1/realtime"
#define ASR_DEFAULT_MODEL    "qwen3-asr-flash-realtime"
#define ASR_API_KEY_ENV      "DASHSCOPE_API_KEY"

#define MAX_WS_URI (4096)

/* ── Outbound message types (client -> service) ─────────────────────────── */
#define MSG_SESSION_UPDATE      "session.update"
#define MSG_AUDIO_APPEND        "input_audio_buffer.append"
#define MSG_SESSION_FINISH      "session.finish"

/* ── Inbound event types (service -> client) ────────────────────────────── */
#define EVT_SESSION_CREATED     "session.created"
#define EVT_SESSION_UPDATED     "session.updated"
#define EVT_SESSION_FINISHED    "session.finished"
#define EVT_SPEECH_STARTED      "input_audio_buffer.speech_started"
#define EVT_SPEECH_STOPPED      "input_audio_buffer.speech_stopped"
#define EVT_TRANSCRIPT_DELTA    "conversation.item.input_audio_transcription.delta"
#define EVT_TRANSCRIPT_TEXT     "conversation.item.input_audio_transcription.text"
#define EVT_TRANSCRIPT_DONE     "conversation.item.input_audio_transcription.completed"
#define EVT_TRANSCRIPT_FAILED   "conversation.item.input_audio_transcription.failed"
#define EVT_ERROR               "error"

/* The only record type the client itself originates */
#define EVT_CLIENT_ERROR        "client.error"

/* Session lifecycle: CONNECTING -> CONFIGURING -> STREAMING -> DRAINING -> CLOSED,
 * with FAILED reachable from every non-terminal state. */
enum sessionState_t {
    SESSION_CONNECTING,
    SESSION_CONFIGURING,
    SESSION_STREAMING,
    SESSION_DRAINING,
    SESSION_CLOSED,
    SESSION_FAILED
};

enum errorKind_t {
    ERR_NONE,
    ERR_CONFIG,
    ERR_CONNECT_FAILURE,
    ERR_CONFIGURATION_REJECTED,
    ERR_FRAMING,
    ERR_TRANSPORT,
    ERR_DECODE,
    ERR_SERVICE,
    ERR_CANCELLED
};

/* Ordered request headers (name, value) */
typedef std::vector<std::pair<std::string, std::string>> headerList_t;

const char *session_state_name(sessionState_t state);
const char *error_kind_name(errorKind_t kind);
bool        session_state_terminal(sessionState_t state);

#endif /* ASR_STREAM_H */
