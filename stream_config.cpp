#include "stream_config.h"

#include <cctype>
#include <cstring>
#include <memory>

#include <cjson/cJSON.h>

/* ── URI validation ──────────────────────────────────────────────────────── */
bool validate_ws_uri(const std::string &url) {
    if (url.empty() || url.size() >= MAX_WS_URI) return false;

    const char *hostStart = nullptr;
    const char *hostEnd   = nullptr;
    const char *portStart = nullptr;
    const char *str       = url.c_str();

    if (strncmp(str, "ws://", 5) == 0) {
        hostStart = str + 5;
    } else if (strncmp(str, "wss://", 6) == 0) {
        hostStart = str + 6;
    } else {
        return false;
    }

    hostEnd = hostStart;
    while (*hostEnd && *hostEnd != ':' && *hostEnd != '/' && *hostEnd != '?') {
        if (!std::isalnum((unsigned char)*hostEnd) &&
            *hostEnd != '-' && *hostEnd != '.') {
            return false;
        }
        ++hostEnd;
    }
    if (hostStart == hostEnd) return false;

    if (*hostEnd == ':') {
        portStart = hostEnd + 1;
        const char *p = portStart;
        while (*p && *p != '/' && *p != '?') {
            if (!std::isdigit((unsigned char)*p)) return false;
            ++p;
        }
        if (p == portStart) return false;
    }
    return true;
}

bool validate_stream_config(const StreamConfig &cfg, std::string &err) {
    if (!validate_ws_uri(cfg.endpoint)) {
        err = "endpoint: not a valid ws:// or wss:// URI: " + cfg.endpoint;
        return false;
    }
    if (cfg.model.empty()) {
        err = "model: must not be empty";
        return false;
    }
    if (cfg.apiKey.empty()) {
        err = std::string("api key: not set (use --api-key or ") + ASR_API_KEY_ENV + ")";
        return false;
    }
    if (cfg.sampleRate <= 0) {
        err = "sample rate: must be positive";
        return false;
    }
    if (cfg.language.empty()) {
        err = "language: must not be empty";
        return false;
    }
    if (!(cfg.vadThreshold >= 0.0 && cfg.vadThreshold <= 1.0)) {
        err = "vad threshold: must be within [0, 1]";
        return false;
    }
    if (cfg.vadSilenceMs <= 0) {
        err = "vad silence duration: must be positive";
        return false;
    }
    if (cfg.channels <= 0 || cfg.bytesPerSample <= 0) {
        err = "audio layout: channels and bytes per sample must be positive";
        return false;
    }
    if (cfg.chunkBytes == 0 || cfg.chunkBytes % cfg.frameBytes() != 0) {
        err = "chunk size: must be a positive multiple of " +
              std::to_string(cfg.frameBytes()) + " bytes";
        return false;
    }
    if (cfg.maxPendingChunks == 0) {
        err = "max pending chunks: must be positive";
        return false;
    }
    if (cfg.sendLeadMs < 0) {
        err = "send lead: must not be negative";
        return false;
    }
    if (cfg.handshakeTimeoutMs <= 0) {
        err = "handshake timeout: must be positive";
        return false;
    }
    if (cfg.drainTimeoutMs < 0 || cfg.stopDeadlineMs < 0 || cfg.pingIntervalSec < 0) {
        err = "timeouts: must not be negative";
        return false;
    }
    if (!cfg.extraHeaders.empty()) {
        headerList_t scratch;
        if (!stream_request_headers(cfg, scratch, err)) return false;
    }
    return true;
}

std::string stream_request_url(const StreamConfig &cfg) {
    const char sep = cfg.endpoint.find('?') == std::string::npos ? '?' : '&';
    return cfg.endpoint + sep + "model=" + cfg.model;
}

bool stream_request_headers(const StreamConfig &cfg, headerList_t &out, std::string &err) {
    out.clear();
    out.emplace_back("Authorization", "Bearer " + cfg.apiKey);
    out.emplace_back("OpenAI-Beta", "realtime=v1");

    if (cfg.extraHeaders.empty()) return true;

    using jsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;
    jsonPtr headers(cJSON_Parse(cfg.extraHeaders.c_str()), &cJSON_Delete);
    if (!headers || !cJSON_IsObject(headers.get())) {
        err = "extra headers: expected a JSON object";
        return false;
    }

    for (cJSON *it = headers->child; it; it = it->next) {
        if (!cJSON_IsString(it) || !it->valuestring || !it->string) {
            err = std::string("extra headers: value of '") +
                  (it->string ? it->string : "") + "' is not a string";
            return false;
        }
        out.emplace_back(it->string, it->valuestring);
    }
    return true;
}
