#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <cstddef>
#include <functional>
#include <string>

#include "asr_stream.h"

/*
 * Bidirectional message channel to the remote service.
 *
 * connect() is asynchronous: exactly one of onOpen / onError (or onClose)
 * reports its outcome. Handlers run on the transport's own thread and must
 * not be invoked after close() returns.
 */
class Transport {
public:
    struct Handlers {
        std::function<void()>                          onOpen;
        std::function<void(const std::string &)>       onText;
        std::function<void(const void *, size_t)>      onBinary;
        std::function<void(int, const std::string &)>  onError;
        std::function<void(int, const std::string &)>  onClose;
    };

    virtual ~Transport() = default;

    virtual void setHandlers(Handlers handlers) = 0;
    virtual void connect(const std::string &url, const headerList_t &headers) = 0;

    /* May block while the outbound buffer is full. false = not sent. */
    virtual bool sendText(const std::string &text) = 0;

    /* Detaches all handlers, then disconnects. */
    virtual void close() = 0;
    virtual bool isConnected() = 0;
};

#endif /* TRANSPORT_H */
