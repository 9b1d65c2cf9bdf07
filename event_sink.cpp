#include "event_sink.h"

#include <cstdlib>
#include <memory>

#include <cjson/cJSON.h>
#include <spdlog/spdlog.h>

void JsonLineSink::emit(const ServiceEvent &event) {
    writeLine(event.raw);
}

void JsonLineSink::emitError(errorKind_t kind, const std::string &message,
                             const std::string &sessionId)
{
    using jsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;
    jsonPtr root(cJSON_CreateObject(), &cJSON_Delete);
    cJSON_AddStringToObject(root.get(), "type", EVT_CLIENT_ERROR);
    cJSON_AddStringToObject(root.get(), "kind", error_kind_name(kind));
    cJSON_AddStringToObject(root.get(), "message", message.c_str());
    if (!sessionId.empty())
        cJSON_AddStringToObject(root.get(), "session_id", sessionId.c_str());

    char *json_str = cJSON_PrintUnformatted(root.get());
    if (!json_str) {
        spdlog::error("event sink: cannot serialize error report ({})", message);
        return;
    }
    writeLine(json_str);
    std::free(json_str);
}

uint64_t JsonLineSink::records() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_records;
}

void JsonLineSink::writeLine(const std::string &line) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_out << line << '\n';
    m_out.flush();
    ++m_records;
    if (!m_out) {
        spdlog::error("event sink: output stream write failed");
    }
}
