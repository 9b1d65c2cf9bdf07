#include "audio_source.h"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

FdAudioSource::FdAudioSource(int fd, int pollMs)
    : m_fd(fd), m_pollMs(pollMs) {}

audioRead_t FdAudioSource::read(uint8_t *buf, size_t cap, size_t &got, std::string &err) {
    got = 0;
    if (m_eof) return AUDIO_READ_EOF;
    if (!buf || cap == 0) return AUDIO_READ_AGAIN;

    struct pollfd pfd;
    pfd.fd      = m_fd;
    pfd.events  = POLLIN;
    pfd.revents = 0;

    const int rc = ::poll(&pfd, 1, m_pollMs);
    if (rc < 0) {
        if (errno == EINTR) return AUDIO_READ_AGAIN;
        err = std::string("poll() failed: ") + std::strerror(errno);
        return AUDIO_READ_ERROR;
    }
    if (rc == 0) return AUDIO_READ_AGAIN;

    /* POLLHUP with no POLLIN: writer went away, read() reports the EOF */
    const ssize_t n = ::read(m_fd, buf, cap);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return AUDIO_READ_AGAIN;
        err = std::string("read() failed: ") + std::strerror(errno);
        return AUDIO_READ_ERROR;
    }
    if (n == 0) {
        m_eof = true;
        return AUDIO_READ_EOF;
    }
    got = static_cast<size_t>(n);
    return AUDIO_READ_OK;
}
