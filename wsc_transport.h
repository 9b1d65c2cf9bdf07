#ifndef WSC_TRANSPORT_H
#define WSC_TRANSPORT_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "WebSocketClient.h"

#include "send_pacer.h"
#include "stream_config.h"
#include "transport.h"

/*
 * Transport over a libwsc WebSocketClient. The client runs its own event loop
 * thread; callbacks are bound through a weak_ptr so none fires into a
 * destroyed adapter, and close() detaches them before disconnecting.
 */
class WscTransport : public Transport {
public:
    static std::shared_ptr<WscTransport> create(const StreamConfig &cfg);

    ~WscTransport() override = default;

    void setHandlers(Handlers handlers) override;
    void connect(const std::string &url, const headerList_t &headers) override;
    bool sendText(const std::string &text) override;
    void close() override;
    bool isConnected() override;

private:
    explicit WscTransport(const StreamConfig &cfg);

    void bindCallbacks(std::weak_ptr<WscTransport> wp);
    bool isCleanedUp() const;
    Handlers handlers();

    WebSocketClient    client;
    SendPacer          m_pacer;
    std::mutex         m_handlersMutex;
    Handlers           m_handlers;
    std::atomic<bool>  m_cleanedUp{false};
};

#endif /* WSC_TRANSPORT_H */
