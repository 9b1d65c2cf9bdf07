/*
 * wsc_transport.cpp
 *
 * libwsc-backed Transport used by the asr-stream executable.
 *
 * • TLS options (CA / client cert / key, hostname validation) and the ping
 *   interval are fixed at construction from StreamConfig.
 * • Request headers, including the credential, are applied per connect() and
 *   never logged.
 * • libwsc queues outbound frames on its event loop; send failures surface
 *   through the error / close callbacks.
 */

#include "wsc_transport.h"

#include <utility>

#include <spdlog/spdlog.h>

/* ── Factory ─────────────────────────────────────────────────────────────── */
std::shared_ptr<WscTransport> WscTransport::create(const StreamConfig &cfg) {
    std::shared_ptr<WscTransport> sp(new WscTransport(cfg));
    sp->bindCallbacks(std::weak_ptr<WscTransport>(sp));
    return sp;
}

WscTransport::WscTransport(const StreamConfig &cfg) : m_pacer(cfg) {
    WebSocketTLSOptions tls;

    if (!cfg.tlsCaFile.empty())   tls.caFile   = cfg.tlsCaFile;
    if (!cfg.tlsKeyFile.empty())  tls.keyFile  = cfg.tlsKeyFile;
    if (!cfg.tlsCertFile.empty()) tls.certFile = cfg.tlsCertFile;
    tls.disableHostnameValidation = cfg.tlsDisableHostnameValidation;
    client.setTLSOptions(tls);

    if (cfg.pingIntervalSec > 0) client.setPingInterval(cfg.pingIntervalSec);
}

/* ── Transport ───────────────────────────────────────────────────────────── */
void WscTransport::setHandlers(Handlers handlers) {
    std::lock_guard<std::mutex> lk(m_handlersMutex);
    m_handlers = std::move(handlers);
}

void WscTransport::connect(const std::string &url, const headerList_t &headers) {
    WebSocketHeaders hdrs;
    for (const auto &h : headers) {
        hdrs.set(h.first, h.second);
    }

    client.setUrl(url);
    if (!hdrs.empty()) client.setHeaders(hdrs);

    spdlog::debug("WscTransport: connecting ({} header(s))", headers.size());
    client.connect();
}

bool WscTransport::sendText(const std::string &text) {
    if (isCleanedUp() || !isConnected()) return false;
    /* the client queues without bound, so hold the sender to the audio clock */
    if (!m_pacer.acquire(text.size())) return false;
    if (isCleanedUp()) return false;
    client.sendMessage(text.c_str(), text.size());
    return true;
}

void WscTransport::close() {
    if (m_cleanedUp.exchange(true)) return;
    m_pacer.abort();

    client.setMessageCallback({});
    client.setBinaryCallback({});
    client.setOpenCallback({});
    client.setErrorCallback({});
    client.setCloseCallback({});
    {
        std::lock_guard<std::mutex> lk(m_handlersMutex);
        m_handlers = Handlers();
    }

    spdlog::debug("WscTransport: disconnecting");
    client.disconnect();
}

bool WscTransport::isConnected() {
    return client.isConnected();
}

/* ── WS callback binding ─────────────────────────────────────────────────── */
bool WscTransport::isCleanedUp() const {
    return m_cleanedUp.load(std::memory_order_acquire);
}

Transport::Handlers WscTransport::handlers() {
    std::lock_guard<std::mutex> lk(m_handlersMutex);
    return m_handlers;
}

void WscTransport::bindCallbacks(std::weak_ptr<WscTransport> wp) {

    client.setMessageCallback([wp](const std::string &message) {
        auto self = wp.lock();
        if (!self || self->isCleanedUp()) return;
        auto h = self->handlers();
        if (h.onText) h.onText(message);
    });

    client.setBinaryCallback([wp](const void *data, size_t len) {
        auto self = wp.lock();
        if (!self || self->isCleanedUp()) return;
        auto h = self->handlers();
        if (h.onBinary) h.onBinary(data, len);
    });

    client.setOpenCallback([wp]() {
        auto self = wp.lock();
        if (!self || self->isCleanedUp()) return;
        auto h = self->handlers();
        if (h.onOpen) h.onOpen();
    });

    client.setErrorCallback([wp](int code, const std::string &msg) {
        auto self = wp.lock();
        if (!self || self->isCleanedUp()) return;
        spdlog::debug("WscTransport: error {}: {}", code, msg);
        auto h = self->handlers();
        if (h.onError) h.onError(code, msg);
    });

    client.setCloseCallback([wp](int code, const std::string &reason) {
        auto self = wp.lock();
        if (!self || self->isCleanedUp()) return;
        spdlog::debug("WscTransport: closed {}: {}", code, reason);
        auto h = self->handlers();
        if (h.onClose) h.onClose(code, reason);
    });
}
