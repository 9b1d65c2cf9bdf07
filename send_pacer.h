#ifndef SEND_PACER_H
#define SEND_PACER_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "stream_config.h"

/*
 * Leaky bucket over outbound bytes. The bucket drains at the wire rate of
 * realtime audio; acquire() blocks while a message would lift it above the
 * high-water mark. A message larger than the mark is let through once the
 * bucket is empty. A zero rate disables pacing.
 */
class SendPacer {
public:
    SendPacer(double bytesPerSec, size_t highWater);

    /* sendLeadMs of audio may be in flight ahead of the audio clock */
    explicit SendPacer(const StreamConfig &cfg);

    /* Waits for room for `bytes`. Returns false once abort() was called. */
    bool acquire(size_t bytes);

    /* Wakes every waiter; later acquire() calls fail. */
    void abort();

    double level();
    bool   enabled() const { return m_rate > 0.0; }
    size_t highWater() const { return m_highWater; }

private:
    void leakLocked(std::chrono::steady_clock::time_point now);

    const double                          m_rate;
    const size_t                          m_highWater;
    std::mutex                            m_mutex;
    std::condition_variable               m_cv;
    double                                m_level   = 0.0;
    bool                                  m_aborted = false;
    std::chrono::steady_clock::time_point m_last;
};

/* Bytes per second the append messages of realtime audio occupy on the wire. */
double stream_wire_rate(const StreamConfig &cfg);

#endif /* SEND_PACER_H */
