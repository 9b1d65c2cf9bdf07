/*
 * send_pacer.cpp
 *
 * Outbound pacing for transports that give no write-drain signal. The
 * WebSocket client queues every message without bound, so the sender is
 * held to the audio clock plus a fixed lead instead.
 */

#include "send_pacer.h"

#include <spdlog/spdlog.h>

namespace {

    /* event_id, type and field names around the base64 audio */
    const double APPEND_ENVELOPE_BYTES = 128.0;

    double lead_bytes(const StreamConfig &cfg) {
        return stream_wire_rate(cfg) * cfg.sendLeadMs / 1000.0;
    }

    /* one append message always fits below the mark */
    size_t high_water_for(const StreamConfig &cfg) {
        if (cfg.sendLeadMs <= 0) return 0;
        const double chunkWire = (cfg.chunkBytes + 2) / 3 * 4 + APPEND_ENVELOPE_BYTES;
        const double lead = lead_bytes(cfg);
        return static_cast<size_t>(lead > chunkWire ? lead : chunkWire);
    }

} /* anonymous namespace */

double stream_wire_rate(const StreamConfig &cfg) {
    const double audioBps = static_cast<double>(cfg.sampleRate) * cfg.frameBytes();
    if (audioBps <= 0.0 || cfg.chunkBytes == 0) return 0.0;
    const double chunksPerSec = audioBps / cfg.chunkBytes;
    return audioBps * 4.0 / 3.0 + chunksPerSec * APPEND_ENVELOPE_BYTES;
}

SendPacer::SendPacer(double bytesPerSec, size_t highWater)
    : m_rate(bytesPerSec), m_highWater(highWater),
      m_last(std::chrono::steady_clock::now()) {}

SendPacer::SendPacer(const StreamConfig &cfg)
    : SendPacer(cfg.sendLeadMs > 0 ? stream_wire_rate(cfg) : 0.0, high_water_for(cfg)) {}

void SendPacer::leakLocked(std::chrono::steady_clock::time_point now) {
    const double secs = std::chrono::duration<double>(now - m_last).count();
    m_last = now;
    m_level -= secs * m_rate;
    if (m_level < 0.0) m_level = 0.0;
}

bool SendPacer::acquire(size_t bytes) {
    std::unique_lock<std::mutex> lk(m_mutex);
    if (m_aborted) return false;
    if (!enabled()) return true;

    bool waited = false;
    for (;;) {
        leakLocked(std::chrono::steady_clock::now());
        if (m_level <= 0.0 || m_level + bytes <= m_highWater) break;

        const double over = m_level + bytes - m_highWater;
        const double excess = over < m_level ? over : m_level;
        const auto wait = std::chrono::microseconds(
            static_cast<long long>(excess / m_rate * 1e6) + 1);
        waited = true;
        if (m_cv.wait_for(lk, wait, [this] { return m_aborted; })) return false;
    }
    if (waited) spdlog::trace("SendPacer: held {} byte message for the audio clock", bytes);
    m_level += bytes;
    return true;
}

void SendPacer::abort() {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_aborted = true;
    }
    m_cv.notify_all();
}

double SendPacer::level() {
    std::lock_guard<std::mutex> lk(m_mutex);
    leakLocked(std::chrono::steady_clock::now());
    return m_level;
}
