#ifndef ASR_SESSION_H
#define ASR_SESSION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "asr_stream.h"
#include "asr_protocol.h"
#include "audio_framer.h"
#include "audio_source.h"
#include "chunk_queue.h"
#include "event_sink.h"
#include "stream_config.h"
#include "transport.h"

struct SessionResult {
    sessionState_t state = SESSION_CONNECTING;
    errorKind_t    error = ERR_NONE;
    std::string    message;
    std::string    sessionId;
    uint64_t       chunksSent      = 0;
    uint64_t       bytesSent       = 0;
    uint64_t       eventsForwarded = 0;

    bool graceful() const { return state == SESSION_CLOSED && error == ERR_NONE; }
};

/*
 * One streaming transcription session over an injected transport.
 *
 * run() blocks the calling thread: it reads and frames audio from the source
 * while an internal sender thread pushes chunks to the transport. Inbound
 * messages are decoded on the transport's thread and forwarded to the sink in
 * arrival order. VAD events are relayed untouched; turn-taking stays with the
 * service.
 */
class AsrSession {
public:
    AsrSession(StreamConfig config, std::shared_ptr<Transport> transport, EventSink &sink);
    ~AsrSession();

    AsrSession(const AsrSession &) = delete;
    AsrSession &operator=(const AsrSession &) = delete;

    SessionResult run(AudioSource &source);

    /* Graceful stop: finish sending buffered audio, then drain. Thread-safe. */
    void requestStop();

    sessionState_t state() const;
    std::string sessionId() const;

private:
    using clock = std::chrono::steady_clock;

    /* ── Transport callbacks (transport thread) ──────────────────────────── */
    void bindHandlers();
    void onOpen();
    void onText(const std::string &message);
    void onBinary(size_t len);
    void onTransportError(int code, const std::string &msg);
    void onTransportClose(int code, const std::string &reason);
    void dispatch(const ServiceEvent &event);

    /* ── Phases (run thread) ─────────────────────────────────────────────── */
    bool connectPhase();
    bool configurePhase();
    void streamPhase(AudioSource &source);
    void drainPhase();
    bool enqueue(std::vector<AudioChunk> &chunks);
    void writerLoop();

    bool send(const std::string &text, const char *what);
    void setStateLocked(sessionState_t next);
    void fail(errorKind_t kind, const std::string &message);
    void closeSession(errorKind_t kind, const std::string &message);
    bool isTerminal() const;
    bool hardDeadlinePassed() const;
    clock::time_point boundedDeadlineLocked(clock::time_point phaseDeadline) const;
    std::string tagLocked() const;

    StreamConfig               m_config;
    std::shared_ptr<Transport> m_transport;
    EventSink                 &m_sink;
    AudioFramer                m_framer;
    ChunkQueue                 m_queue;
    std::thread                m_writer;

    std::mutex                 m_emitMutex;   /* orders sink writes, taken before m_mutex */
    mutable std::mutex         m_mutex;
    std::condition_variable    m_cv;
    sessionState_t             m_state = SESSION_CONNECTING;
    errorKind_t                m_error = ERR_NONE;
    std::string                m_errorMessage;
    std::string                m_sessionId;
    bool                       m_ran           = false;
    bool                       m_opened        = false;
    bool                       m_acked         = false;
    bool                       m_finishAcked   = false;
    bool                       m_peerClosed    = false;
    bool                       m_stopRequested = false;
    clock::time_point          m_stopAt;
    clock::time_point          m_drainStart;
    uint64_t                   m_eventsForwarded = 0;

    std::atomic<uint64_t>      m_chunksSent{0};
    std::atomic<uint64_t>      m_bytesSent{0};
};

#endif /* ASR_SESSION_H */
