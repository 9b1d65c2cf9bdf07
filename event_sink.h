#ifndef EVENT_SINK_H
#define EVENT_SINK_H

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

#include "asr_stream.h"
#include "asr_protocol.h"

/* Receives forwarded ServiceEvents in arrival order, one record per event. */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void emit(const ServiceEvent &event) = 0;

    /* The single terminal error report of a failed or cancelled session. */
    virtual void emitError(errorKind_t kind, const std::string &message,
                           const std::string &sessionId) = 0;
};

/* Newline-delimited JSON: every record is complete on its own line and flushed. */
class JsonLineSink : public EventSink {
public:
    explicit JsonLineSink(std::ostream &out) : m_out(out) {}

    void emit(const ServiceEvent &event) override;
    void emitError(errorKind_t kind, const std::string &message,
                   const std::string &sessionId) override;

    uint64_t records() const;

private:
    void writeLine(const std::string &line);

    std::ostream      &m_out;
    mutable std::mutex m_mu;
    uint64_t           m_records = 0;
};

#endif /* EVENT_SINK_H */
