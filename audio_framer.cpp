#include "audio_framer.h"

#include <utility>

AudioChunk::AudioChunk(uint64_t seq, std::vector<uint8_t> data)
    : m_seq(seq), m_data(std::move(data)) {}

AudioFramer::AudioFramer(size_t chunkBytes, size_t frameBytes, uint64_t firstSeq)
    : m_chunkBytes(chunkBytes),
      m_frameBytes(frameBytes ? frameBytes : 1),
      m_nextSeq(firstSeq)
{
    /* never split a sample frame across two chunks */
    m_chunkBytes -= m_chunkBytes % m_frameBytes;
    if (m_chunkBytes == 0) m_chunkBytes = m_frameBytes;
    m_pending.reserve(m_chunkBytes);
}

AudioChunk AudioFramer::emit(std::vector<uint8_t> &&bytes) {
    return AudioChunk(m_nextSeq++, std::move(bytes));
}

framerStatus_t AudioFramer::push(const uint8_t *data, size_t len,
                                 std::vector<AudioChunk> &out)
{
    if (m_halted || m_finished) return FRAMER_HALTED;
    if (!data || len == 0) return FRAMER_OK;

    size_t off = 0;
    while (off < len) {
        const size_t want = m_chunkBytes - m_pending.size();
        const size_t take = (len - off < want) ? (len - off) : want;
        m_pending.insert(m_pending.end(), data + off, data + off + take);
        off += take;

        if (m_pending.size() == m_chunkBytes) {
            std::vector<uint8_t> full;
            full.reserve(m_chunkBytes);
            full.swap(m_pending);
            out.push_back(emit(std::move(full)));
        }
    }
    return FRAMER_OK;
}

framerStatus_t AudioFramer::finish(std::vector<AudioChunk> &out) {
    if (m_halted || m_finished) return FRAMER_HALTED;
    m_finished = true;

    if (m_pending.empty()) return FRAMER_OK;

    if (m_pending.size() % m_frameBytes != 0) {
        m_error = "input ended with " + std::to_string(m_pending.size() % m_frameBytes) +
                  " trailing byte(s), not a whole " + std::to_string(m_frameBytes) +
                  "-byte sample frame";
        m_pending.clear();
        m_halted = true;
        return FRAMER_MISALIGNED;
    }

    std::vector<uint8_t> tail;
    tail.swap(m_pending);
    out.push_back(emit(std::move(tail)));
    return FRAMER_OK;
}

size_t AudioFramer::finishAligned(std::vector<AudioChunk> &out) {
    if (m_halted || m_finished) return 0;
    m_finished = true;

    const size_t dropped = m_pending.size() % m_frameBytes;
    m_pending.resize(m_pending.size() - dropped);
    if (m_pending.empty()) return dropped;

    std::vector<uint8_t> tail;
    tail.swap(m_pending);
    out.push_back(emit(std::move(tail)));
    return dropped;
}
