#ifndef AUDIO_FRAMER_H
#define AUDIO_FRAMER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/* One outbound slice of raw audio. Immutable once built. */
class AudioChunk {
public:
    AudioChunk(uint64_t seq, std::vector<uint8_t> data);

    uint64_t seq() const { return m_seq; }
    const std::vector<uint8_t> &data() const { return m_data; }
    size_t size() const { return m_data.size(); }

private:
    uint64_t             m_seq;
    std::vector<uint8_t> m_data;
};

enum framerStatus_t {
    FRAMER_OK,
    FRAMER_MISALIGNED,   /* input ended in the middle of a sample frame */
    FRAMER_HALTED        /* a previous error stopped this framer        */
};

/*
 * Cuts an arbitrary-burst byte stream into fixed-size chunks aligned to whole
 * sample frames. The partial remainder is held between push() calls and
 * flushed by finish() as a final, possibly shorter, chunk.
 */
class AudioFramer {
public:
    AudioFramer(size_t chunkBytes, size_t frameBytes, uint64_t firstSeq = 0);

    framerStatus_t push(const uint8_t *data, size_t len, std::vector<AudioChunk> &out);
    framerStatus_t finish(std::vector<AudioChunk> &out);

    /* Stop before end of input: flush the whole sample frames held and drop
     * a trailing partial frame. Returns the number of bytes dropped. */
    size_t finishAligned(std::vector<AudioChunk> &out);

    size_t   chunkBytes() const { return m_chunkBytes; }
    size_t   pending() const { return m_pending.size(); }
    uint64_t nextSeq() const { return m_nextSeq; }
    bool     halted() const { return m_halted; }
    const std::string &error() const { return m_error; }

private:
    AudioChunk emit(std::vector<uint8_t> &&bytes);

    size_t               m_chunkBytes;
    size_t               m_frameBytes;
    uint64_t             m_nextSeq;
    std::vector<uint8_t> m_pending;
    bool                 m_halted   = false;
    bool                 m_finished = false;
    std::string          m_error;
};

#endif /* AUDIO_FRAMER_H */
