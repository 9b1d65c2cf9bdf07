#ifndef AUDIO_SOURCE_H
#define AUDIO_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <string>

enum audioRead_t {
    AUDIO_READ_OK,      /* got > 0 bytes                         */
    AUDIO_READ_AGAIN,   /* nothing yet, poll window elapsed       */
    AUDIO_READ_EOF,     /* end of stream                          */
    AUDIO_READ_ERROR    /* I/O failure, err describes it          */
};

/* Blocking raw-audio byte source with an end-of-stream signal. */
class AudioSource {
public:
    virtual ~AudioSource() = default;
    virtual audioRead_t read(uint8_t *buf, size_t cap, size_t &got, std::string &err) = 0;
};

/*
 * Reads a file descriptor (stdin by default). Waits at most pollMs per call so
 * that the caller can observe a stop request while the producer is silent.
 */
class FdAudioSource : public AudioSource {
public:
    explicit FdAudioSource(int fd = 0, int pollMs = 100);

    audioRead_t read(uint8_t *buf, size_t cap, size_t &got, std::string &err) override;

private:
    int  m_fd;
    int  m_pollMs;
    bool m_eof = false;
};

#endif /* AUDIO_SOURCE_H */
