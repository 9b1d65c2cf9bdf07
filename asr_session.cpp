/*
 * asr_session.cpp
 *
 * Session state machine for one realtime transcription stream.
 *
 *   CONNECTING ─ open ─▶ CONFIGURING ─ ack ─▶ STREAMING ─ end of input ─▶ DRAINING ─▶ CLOSED
 *        └──────────────────┴──────────────────────┴──────────────────────────┴──────▶ FAILED
 *
 * Threads
 * ───────
 * • run thread:       connect, configure, then read + frame audio into the queue.
 * • sender thread:    pops chunks, encodes and sends them; sends session.finish
 *                     once every queued chunk has gone out.
 * • transport thread: decodes inbound messages and forwards them to the sink.
 *
 * The queue is bounded, so a slow connection stalls the reader instead of
 * growing memory. No transport call is made with m_mutex held.
 */

#include "asr_session.h"

#include <algorithm>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#define READ_BUFFER_BYTES 8192
#define QUEUE_WAIT_MS     100

/* ═══════════════════════════════════════════════════════════════════════════
 * Names
 * ═══════════════════════════════════════════════════════════════════════════ */
const char *session_state_name(sessionState_t state) {
    switch (state) {
        case SESSION_CONNECTING:  return "Connecting";
        case SESSION_CONFIGURING: return "Configuring";
        case SESSION_STREAMING:   return "Streaming";
        case SESSION_DRAINING:    return "Draining";
        case SESSION_CLOSED:      return "Closed";
        case SESSION_FAILED:      return "Failed";
    }
    return "Unknown";
}

const char *error_kind_name(errorKind_t kind) {
    switch (kind) {
        case ERR_NONE:                   return "None";
        case ERR_CONFIG:                 return "ConfigError";
        case ERR_CONNECT_FAILURE:        return "ConnectFailure";
        case ERR_CONFIGURATION_REJECTED: return "ConfigurationRejected";
        case ERR_FRAMING:                return "FramingError";
        case ERR_TRANSPORT:              return "TransportError";
        case ERR_DECODE:                 return "DecodeError";
        case ERR_SERVICE:                return "ServiceError";
        case ERR_CANCELLED:              return "Cancelled";
    }
    return "Unknown";
}

bool session_state_terminal(sessionState_t state) {
    return state == SESSION_CLOSED || state == SESSION_FAILED;
}

/* ═══════════════════════════════════════════════════════════════════════════
 * AsrSession
 * ═══════════════════════════════════════════════════════════════════════════ */
AsrSession::AsrSession(StreamConfig config, std::shared_ptr<Transport> transport,
                       EventSink &sink)
    : m_config(std::move(config)),
      m_transport(std::move(transport)),
      m_sink(sink),
      m_framer(m_config.chunkBytes, m_config.frameBytes()),
      m_queue(m_config.maxPendingChunks)
{
}

AsrSession::~AsrSession() {
    if (m_writer.joinable()) {
        m_queue.abort();
        m_writer.join();
    }
}

sessionState_t AsrSession::state() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_state;
}

std::string AsrSession::sessionId() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_sessionId;
}

void AsrSession::requestStop() {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (m_stopRequested || session_state_terminal(m_state)) return;
        m_stopRequested = true;
        m_stopAt = clock::now();
        spdlog::info("({}) stop requested in state {}", tagLocked(),
                     session_state_name(m_state));
    }
    m_cv.notify_all();
}

SessionResult AsrSession::run(AudioSource &source) {
    SessionResult result;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (m_ran) {
            result.state   = m_state;
            result.error   = ERR_CONFIG;
            result.message = "session already ran";
            return result;
        }
        m_ran = true;
    }

    std::string err;
    if (!m_transport) {
        fail(ERR_CONFIG, "no transport");
    } else if (!validate_stream_config(m_config, err)) {
        fail(ERR_CONFIG, err);
    } else {
        bindHandlers();
        if (connectPhase() && configurePhase()) {
            streamPhase(source);
            drainPhase();
        }
    }

    if (m_writer.joinable()) {
        if (isTerminal()) m_queue.abort();
        m_writer.join();
    }
    if (m_transport) m_transport->close();

    std::lock_guard<std::mutex> lk(m_mutex);
    result.state           = m_state;
    result.error           = m_error;
    result.message         = m_errorMessage;
    result.sessionId       = m_sessionId;
    result.chunksSent      = m_chunksSent.load();
    result.bytesSent       = m_bytesSent.load();
    result.eventsForwarded = m_eventsForwarded;

    spdlog::info("({}) session ended: state={} chunks={} bytes={} events={}",
                 tagLocked(), session_state_name(m_state), result.chunksSent,
                 result.bytesSent, result.eventsForwarded);
    return result;
}

/* ── Transport callbacks ─────────────────────────────────────────────────── */
void AsrSession::bindHandlers() {
    Transport::Handlers h;
    h.onOpen   = [this]() { onOpen(); };
    h.onText   = [this](const std::string &message) { onText(message); };
    h.onBinary = [this](const void *, size_t len) { onBinary(len); };
    h.onError  = [this](int code, const std::string &msg) { onTransportError(code, msg); };
    h.onClose  = [this](int code, const std::string &reason) { onTransportClose(code, reason); };
    m_transport->setHandlers(std::move(h));
}

void AsrSession::onOpen() {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (session_state_terminal(m_state)) return;
        m_opened = true;
        spdlog::info("({}) connected", tagLocked());
    }
    m_cv.notify_all();
}

void AsrSession::onText(const std::string &message) {
    DecodeResult dr = decode_service_event(message);
    if (!dr.ok) {
        if (isTerminal()) return;
        fail(ERR_DECODE, "undecodable service message: " + dr.error);
        return;
    }
    dispatch(dr.event);
}

void AsrSession::onBinary(size_t len) {
    DecodeResult dr = decode_binary_frame(len);
    dispatch(dr.event);
}

void AsrSession::onTransportError(int code, const std::string &msg) {
    sessionState_t st;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        st = m_state;
    }
    if (session_state_terminal(st)) return;

    const std::string why = "transport error " + std::to_string(code) + ": " + msg;
    fail(st == SESSION_CONNECTING ? ERR_CONNECT_FAILURE : ERR_TRANSPORT, why);
}

void AsrSession::onTransportClose(int code, const std::string &reason) {
    sessionState_t st;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        st = m_state;
        if (session_state_terminal(st)) return;
        if (st == SESSION_DRAINING) {
            /* service hung up after the termination request */
            m_peerClosed = true;
            spdlog::info("({}) connection closed by service during drain ({})",
                         tagLocked(), code);
        }
    }
    if (st == SESSION_DRAINING) {
        m_cv.notify_all();
        return;
    }

    const std::string why = "connection closed by service (" + std::to_string(code) +
                            (reason.empty() ? ")" : "): " + reason);
    fail(st == SESSION_CONNECTING ? ERR_CONNECT_FAILURE : ERR_TRANSPORT, why);
}

/*
 * Every decoded event reaches the sink exactly once, in arrival order.
 * m_emitMutex orders sink writes; m_mutex is never held while writing, so a
 * stalled output consumer cannot block the sender.
 */
void AsrSession::dispatch(const ServiceEvent &event) {
    errorKind_t fatal = ERR_NONE;
    std::string why;
    {
        std::lock_guard<std::mutex> order(m_emitMutex);
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (session_state_terminal(m_state)) return;

            ++m_eventsForwarded;
            if (!m_config.suppressLog) {
                spdlog::debug("({}) response: {}", tagLocked(), event.raw);
            }

            switch (event.kind) {
                case SVC_SESSION_CREATED:
                case SVC_SESSION_UPDATED:
                    if (!event.sessionId.empty()) m_sessionId = event.sessionId;
                    if (m_state == SESSION_CONFIGURING) m_acked = true;
                    break;

                case SVC_SESSION_FINISHED:
                    m_finishAcked = true;
                    break;

                case SVC_ERROR:
                    if (m_state == SESSION_CONFIGURING) {
                        fatal = ERR_CONFIGURATION_REJECTED;
                        why   = "service rejected session configuration: " + event.raw;
                    } else {
                        spdlog::warn("({}) service error {}: {}", tagLocked(),
                                     event.errorCode, event.errorMessage);
                    }
                    break;

                case SVC_UNKNOWN:
                    spdlog::debug("({}) relaying unrecognized event type '{}'",
                                  tagLocked(), event.type);
                    break;

                default:
                    break;
            }
        }
        m_sink.emit(event);
    }
    m_cv.notify_all();

    if (fatal != ERR_NONE) fail(fatal, why);
}

/* ── Phases ──────────────────────────────────────────────────────────────── */
bool AsrSession::connectPhase() {
    headerList_t headers;
    std::string err;
    if (!stream_request_headers(m_config, headers, err)) {
        fail(ERR_CONFIG, err);
        return false;
    }
    const std::string url = stream_request_url(m_config);
    spdlog::info("connecting to {}", url);

    const clock::time_point deadline =
        clock::now() + std::chrono::milliseconds(m_config.handshakeTimeoutMs);
    m_transport->connect(url, headers);

    std::unique_lock<std::mutex> lk(m_mutex);
    m_cv.wait_until(lk, deadline, [this] {
        return m_opened || m_stopRequested || session_state_terminal(m_state);
    });
    if (session_state_terminal(m_state)) return false;
    if (m_opened) return true;

    const bool stopped = m_stopRequested;
    lk.unlock();
    if (stopped) {
        closeSession(ERR_CANCELLED, "stopped before the connection was established");
    } else {
        fail(ERR_CONNECT_FAILURE, "no connection within " +
             std::to_string(m_config.handshakeTimeoutMs) + " ms");
    }
    return false;
}

bool AsrSession::configurePhase() {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (session_state_terminal(m_state)) return false;
        setStateLocked(SESSION_CONFIGURING);
    }

    const clock::time_point deadline =
        clock::now() + std::chrono::milliseconds(m_config.handshakeTimeoutMs);
    if (!send(encode_session_update(m_config), "session configuration")) return false;

    std::unique_lock<std::mutex> lk(m_mutex);
    m_cv.wait_until(lk, deadline, [this] {
        return m_acked || m_stopRequested || session_state_terminal(m_state);
    });
    if (session_state_terminal(m_state)) return false;
    if (m_acked) {
        setStateLocked(SESSION_STREAMING);
        return true;
    }

    const bool stopped = m_stopRequested;
    lk.unlock();
    if (stopped) {
        closeSession(ERR_CANCELLED, "stopped before the session was configured");
    } else {
        fail(ERR_CONFIGURATION_REJECTED, "no session acknowledgement within " +
             std::to_string(m_config.handshakeTimeoutMs) + " ms");
    }
    return false;
}

void AsrSession::streamPhase(AudioSource &source) {
    try {
        m_writer = std::thread(&AsrSession::writerLoop, this);
    } catch (const std::system_error &e) {
        fail(ERR_TRANSPORT, std::string("cannot start sender thread: ") + e.what());
        return;
    }

    std::vector<uint8_t> buf(READ_BUFFER_BYTES);
    std::vector<AudioChunk> chunks;
    bool inputEnded = false;
    bool stopped    = false;

    while (!inputEnded) {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (session_state_terminal(m_state)) break;
            if (m_stopRequested) {
                inputEnded = stopped = true;
                break;
            }
        }

        size_t got = 0;
        std::string err;
        const audioRead_t rc = source.read(buf.data(), buf.size(), got, err);
        if (rc == AUDIO_READ_AGAIN) continue;
        if (rc == AUDIO_READ_ERROR) {
            fail(ERR_FRAMING, "audio input: " + err);
            break;
        }
        if (rc == AUDIO_READ_EOF) {
            spdlog::info("end of audio input after {} chunk(s)", m_framer.nextSeq());
            inputEnded = true;
            break;
        }

        chunks.clear();
        if (m_framer.push(buf.data(), got, chunks) != FRAMER_OK) {
            fail(ERR_FRAMING, m_framer.error());
            break;
        }
        if (!enqueue(chunks)) break;
    }

    if (inputEnded && !isTerminal()) {
        chunks.clear();
        if (stopped) {
            /* reading stopped between bursts, possibly inside a sample frame */
            const size_t dropped = m_framer.finishAligned(chunks);
            if (dropped) spdlog::debug("stop: dropped {} byte(s) of a partial sample frame", dropped);
        }
        if (!stopped && m_framer.finish(chunks) != FRAMER_OK) {
            fail(ERR_FRAMING, m_framer.error());
        } else if (enqueue(chunks) && m_config.keepOpen) {
            /* keep relaying events after end of input until told to stop */
            std::unique_lock<std::mutex> lk(m_mutex);
            m_cv.wait(lk, [this] {
                return m_stopRequested || session_state_terminal(m_state);
            });
        }
    }

    /* Draining starts only after every queued chunk has been sent */
    m_queue.close();
    if (m_writer.joinable()) m_writer.join();
}

bool AsrSession::enqueue(std::vector<AudioChunk> &chunks) {
    for (auto &chunk : chunks) {
        for (;;) {
            const queueStatus_t qs =
                m_queue.push(std::move(chunk), std::chrono::milliseconds(QUEUE_WAIT_MS));
            if (qs == QUEUE_OK) break;
            if (qs == QUEUE_CLOSED || isTerminal()) return false;
            if (hardDeadlinePassed()) {
                closeSession(ERR_CANCELLED, "stop deadline elapsed while audio was still queued");
                return false;
            }
        }
    }
    return true;
}

void AsrSession::writerLoop() {
    std::vector<AudioChunk> batch;
    while (m_queue.popAll(batch)) {
        for (const auto &chunk : batch) {
            if (hardDeadlinePassed()) {
                closeSession(ERR_CANCELLED, "stop deadline elapsed while audio was still queued");
                return;
            }
            if (!send(encode_audio_append(chunk), "audio chunk")) return;
            m_chunksSent.fetch_add(1);
            m_bytesSent.fetch_add(chunk.size());
        }
        batch.clear();
    }
    if (m_queue.aborted()) return;

    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (session_state_terminal(m_state)) return;
        setStateLocked(SESSION_DRAINING);
        m_drainStart = clock::now();
    }
    m_cv.notify_all();
    send(encode_session_finish(), "session termination");
}

void AsrSession::drainPhase() {
    std::unique_lock<std::mutex> lk(m_mutex);
    if (session_state_terminal(m_state) || m_state != SESSION_DRAINING) return;

    const clock::time_point budget =
        m_drainStart + std::chrono::milliseconds(m_config.drainTimeoutMs);

    for (;;) {
        const bool stopSeen = m_stopRequested;
        const clock::time_point deadline = boundedDeadlineLocked(budget);
        const bool woke = m_cv.wait_until(lk, deadline, [this, stopSeen] {
            return m_finishAcked || m_peerClosed || m_stopRequested != stopSeen ||
                   session_state_terminal(m_state);
        });
        if (session_state_terminal(m_state)) return;

        if (m_finishAcked || m_peerClosed) {
            lk.unlock();
            closeSession(ERR_NONE, std::string());
            return;
        }
        /* a stop request arrived and may have pulled the deadline in */
        if (woke) continue;

        const bool cancelled = m_stopRequested && deadline < budget;
        spdlog::warn("({}) no termination acknowledgement, closing", tagLocked());
        lk.unlock();
        if (cancelled) {
            closeSession(ERR_CANCELLED, "stop deadline elapsed while draining");
        } else {
            closeSession(ERR_NONE, std::string());
        }
        return;
    }
}

/* ── Helpers ─────────────────────────────────────────────────────────────── */
bool AsrSession::send(const std::string &text, const char *what) {
    if (isTerminal()) return false;
    if (!m_transport->sendText(text)) {
        fail(ERR_TRANSPORT, std::string("failed to send ") + what);
        return false;
    }
    return true;
}

void AsrSession::setStateLocked(sessionState_t next) {
    spdlog::info("({}) {} -> {}", tagLocked(), session_state_name(m_state),
                 session_state_name(next));
    m_state = next;
}

void AsrSession::fail(errorKind_t kind, const std::string &message) {
    std::string sid;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (session_state_terminal(m_state)) return;
        spdlog::error("({}) {} in state {}: {}", tagLocked(), error_kind_name(kind),
                      session_state_name(m_state), message);
        m_state        = SESSION_FAILED;
        m_error        = kind;
        m_errorMessage = message;
        sid            = m_sessionId;
    }
    m_cv.notify_all();
    m_queue.abort();

    std::lock_guard<std::mutex> order(m_emitMutex);
    m_sink.emitError(kind, message, sid);
}

void AsrSession::closeSession(errorKind_t kind, const std::string &message) {
    std::string sid;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (session_state_terminal(m_state)) return;
        setStateLocked(SESSION_CLOSED);
        m_error        = kind;
        m_errorMessage = message;
        sid            = m_sessionId;
    }
    m_cv.notify_all();
    m_queue.abort();
    if (kind == ERR_NONE) return;

    std::lock_guard<std::mutex> order(m_emitMutex);
    m_sink.emitError(kind, message, sid);
}

bool AsrSession::isTerminal() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return session_state_terminal(m_state);
}

bool AsrSession::hardDeadlinePassed() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (!m_stopRequested) return false;
    return clock::now() >= m_stopAt + std::chrono::milliseconds(m_config.stopDeadlineMs);
}

AsrSession::clock::time_point
AsrSession::boundedDeadlineLocked(clock::time_point phaseDeadline) const {
    if (!m_stopRequested) return phaseDeadline;
    return std::min(phaseDeadline,
                    m_stopAt + std::chrono::milliseconds(m_config.stopDeadlineMs));
}

std::string AsrSession::tagLocked() const {
    return m_sessionId.empty() ? std::string("-") : m_sessionId;
}
