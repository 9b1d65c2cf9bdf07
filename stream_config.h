#ifndef STREAM_CONFIG_H
#define STREAM_CONFIG_H

#include <cstddef>
#include <string>

#include "asr_stream.h"

/* Finished configuration handed to the session engine by the CLI layer. */
struct StreamConfig {
    std::string endpoint   = ASR_DEFAULT_ENDPOINT;
    std::string model      = ASR_DEFAULT_MODEL;
    std::string apiKey;

    int         sampleRate     = 16000;
    std::string language       = "zh";
    double      vadThreshold   = 0.2;
    int         vadSilenceMs   = 800;

    /* raw input layout: s16le mono unless configured otherwise */
    int         channels       = 1;
    int         bytesPerSample = 2;

    size_t      chunkBytes       = 6400;   /* 200 ms @ 16 kHz mono s16le */
    size_t      maxPendingChunks = 128;    /* backpressure budget        */
    int         sendLeadMs       = 2000;   /* audio sent ahead of realtime, 0 unpaced */

    int         handshakeTimeoutMs = 10000;
    int         drainTimeoutMs     = 5000;
    int         stopDeadlineMs     = 3000;

    int         pingIntervalSec = 0;
    bool        keepOpen        = false;
    bool        suppressLog     = false;

    std::string extraHeaders;              /* JSON object of string values */
    std::string tlsCaFile;
    std::string tlsCertFile;
    std::string tlsKeyFile;
    bool        tlsDisableHostnameValidation = false;

    size_t frameBytes() const {
        return static_cast<size_t>(channels) * static_cast<size_t>(bytesPerSample);
    }
};

/* Accepts ws:// and wss:// URIs with a plausible host and optional numeric port. */
bool validate_ws_uri(const std::string &url);

/* Range / non-emptiness checks. On failure err names the offending field. */
bool validate_stream_config(const StreamConfig &cfg, std::string &err);

/* <endpoint>?model=<model> */
std::string stream_request_url(const StreamConfig &cfg);

/* Authorization, OpenAI-Beta and any extra headers. Fails only on malformed
 * extraHeaders JSON. */
bool stream_request_headers(const StreamConfig &cfg, headerList_t &out, std::string &err);

#endif /* STREAM_CONFIG_H */
