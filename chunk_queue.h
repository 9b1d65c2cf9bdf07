#ifndef CHUNK_QUEUE_H
#define CHUNK_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

#include "audio_framer.h"

enum queueStatus_t {
    QUEUE_OK,
    QUEUE_FULL,     /* wait elapsed with no free slot; chunk not taken */
    QUEUE_CLOSED    /* closed or aborted; chunk not taken             */
};

/*
 * Bounded hand-off between the audio reader and the sender. A full queue
 * blocks the reader, which in turn stops draining the audio source.
 */
class ChunkQueue {
public:
    explicit ChunkQueue(size_t capacity) : m_capacity(capacity ? capacity : 1) {}

    /* Takes the chunk only when QUEUE_OK is returned. */
    queueStatus_t push(AudioChunk &&chunk, std::chrono::milliseconds wait) {
        std::unique_lock<std::mutex> lk(m_mu);
        const bool ready = m_cv.wait_for(lk, wait, [this] {
            return m_closed || m_aborted || m_queue.size() < m_capacity;
        });
        if (m_closed || m_aborted) return QUEUE_CLOSED;
        if (!ready) return QUEUE_FULL;
        m_queue.push_back(std::move(chunk));
        lk.unlock();
        m_cv.notify_all();
        return QUEUE_OK;
    }

    /* Moves every queued chunk into out. false once closed and empty, or aborted. */
    bool popAll(std::vector<AudioChunk> &out) {
        std::unique_lock<std::mutex> lk(m_mu);
        m_cv.wait(lk, [this] { return m_aborted || m_closed || !m_queue.empty(); });
        if (m_aborted) return false;
        if (m_queue.empty()) return false;
        while (!m_queue.empty()) {
            out.push_back(std::move(m_queue.front()));
            m_queue.pop_front();
        }
        lk.unlock();
        m_cv.notify_all();
        return true;
    }

    /* End of input: consumers drain what is queued, then stop. */
    void close() {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    /* Drop everything and wake all waiters. */
    void abort() {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_aborted = true;
            m_queue.clear();
        }
        m_cv.notify_all();
    }

    bool aborted() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_aborted;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_queue.size();
    }

private:
    const size_t              m_capacity;
    std::deque<AudioChunk>    m_queue;
    bool                      m_closed  = false;
    bool                      m_aborted = false;
    mutable std::mutex        m_mu;
    std::condition_variable   m_cv;
};

#endif /* CHUNK_QUEUE_H */
