/*
 * main.cpp
 *
 * asr-stream: pipe raw PCM on stdin to a realtime speech recognition service
 * and print every service event as one JSON line on stdout.
 *
 *   arecord -f S16_LE -r 16000 -c 1 -t raw | asr-stream -l en
 *
 * Logs go to stderr. SIGINT / SIGTERM stop the stream gracefully; the session
 * is cut off if it has not closed within --stop-deadline-ms.
 */

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

#include <pthread.h>
#include <unistd.h>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "asr_stream.h"
#include "asr_session.h"
#include "audio_source.h"
#include "event_sink.h"
#include "stream_config.h"
#include "wsc_transport.h"

#define EXIT_GRACEFUL   0
#define EXIT_SESSION    1
#define EXIT_USAGE      2

namespace {

    struct cli_params {
        StreamConfig cfg;
        bool         debug = false;
        bool         quiet = false;
    };

    void print_usage(char **argv, const StreamConfig &c) {
        fprintf(stderr, "\n%s %s\n", ASR_STREAM_NAME, ASR_STREAM_VERSION);
        fprintf(stderr, "usage: %s [options] < audio.pcm\n", argv[0]);
        fprintf(stderr, "  -h, --help                  show this help\n");
        fprintf(stderr, "  --api-key K                 service credential [$%s]\n", ASR_API_KEY_ENV);
        fprintf(stderr, "  -m, --model M               model name [%s]\n", c.model.c_str());
        fprintf(stderr, "  --base-url U                ws:// or wss:// endpoint [%s]\n", c.endpoint.c_str());
        fprintf(stderr, "  -s, --sample-rate N         input sample rate in Hz [%d]\n", c.sampleRate);
        fprintf(stderr, "  -l, --language L            recognition language [%s]\n", c.language.c_str());
        fprintf(stderr, "  --vad-threshold F           server VAD threshold, 0..1 [%0.2f]\n", c.vadThreshold);
        fprintf(stderr, "  --vad-silence-ms N          silence that ends an utterance [%d]\n", c.vadSilenceMs);
        fprintf(stderr, "  --chunk-bytes N             bytes of audio per message [%zu]\n", c.chunkBytes);
        fprintf(stderr, "  --max-pending-chunks N      chunks buffered before input is throttled [%zu]\n", c.maxPendingChunks);
        fprintf(stderr, "  --send-lead-ms N            audio sent ahead of realtime, 0 unpaced [%d]\n", c.sendLeadMs);
        fprintf(stderr, "  --handshake-timeout-ms N    connect / configure timeout [%d]\n", c.handshakeTimeoutMs);
        fprintf(stderr, "  --drain-timeout-ms N        wait for final results after input ends [%d]\n", c.drainTimeoutMs);
        fprintf(stderr, "  --stop-deadline-ms N        hard limit after a stop signal [%d]\n", c.stopDeadlineMs);
        fprintf(stderr, "  --ping-interval N           websocket ping interval in s, 0 disables [%d]\n", c.pingIntervalSec);
        fprintf(stderr, "  --extra-headers JSON        additional request headers as a JSON object\n");
        fprintf(stderr, "  --tls-ca-file F             CA bundle for wss://\n");
        fprintf(stderr, "  --tls-cert-file F           client certificate\n");
        fprintf(stderr, "  --tls-key-file F            client private key\n");
        fprintf(stderr, "  --tls-no-verify-host        skip TLS hostname validation\n");
        fprintf(stderr, "  -k, --keep                  keep the session open after end of input\n");
        fprintf(stderr, "  --suppress-log              do not log event payloads\n");
        fprintf(stderr, "  -d, --debug                 enable debug logging\n");
        fprintf(stderr, "  -q, --quiet                 log warnings and errors only\n");
        fprintf(stderr, "\nexit status: 0 graceful close, 1 session failed or cancelled, 2 usage error\n");
    }

    bool to_long(const char *s, long &out) {
        if (!s || !*s) return false;
        char *end = nullptr;
        errno = 0;
        const long v = std::strtol(s, &end, 10);
        if (errno != 0 || *end != '\0') return false;
        out = v;
        return true;
    }

    bool to_int(const char *s, int &out) {
        long v = 0;
        if (!to_long(s, v) || v < INT32_MIN || v > INT32_MAX) return false;
        out = static_cast<int>(v);
        return true;
    }

    bool to_size(const char *s, size_t &out) {
        long v = 0;
        if (!to_long(s, v) || v < 0) return false;
        out = static_cast<size_t>(v);
        return true;
    }

    bool to_double(const char *s, double &out) {
        if (!s || !*s) return false;
        char *end = nullptr;
        errno = 0;
        const double v = std::strtod(s, &end);
        if (errno != 0 || *end != '\0') return false;
        out = v;
        return true;
    }

    /* Exits with EXIT_USAGE on a malformed command line. */
    void parse_args(int argc, char **argv, cli_params &p) {
        StreamConfig &c = p.cfg;

        auto need = [&](const char *flag, int &i) -> const char * {
            if (i + 1 >= argc) {
                fprintf(stderr, "missing arg for %s\n", flag);
                exit(EXIT_USAGE);
            }
            return argv[++i];
        };
        auto bad = [&](const std::string &flag, const char *val) {
            fprintf(stderr, "invalid value for %s: '%s'\n", flag.c_str(), val ? val : "");
            exit(EXIT_USAGE);
        };

        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            const char *v = nullptr;
            if (a == "-h" || a == "--help") {
                print_usage(argv, c);
                exit(EXIT_GRACEFUL);
            } else if (a == "--api-key") {
                c.apiKey = need(a.c_str(), i);
            } else if (a == "-m" || a == "--model") {
                c.model = need(a.c_str(), i);
            } else if (a == "--base-url") {
                c.endpoint = need(a.c_str(), i);
            } else if (a == "-s" || a == "--sample-rate") {
                if (!to_int(v = need(a.c_str(), i), c.sampleRate)) bad(a, v);
            } else if (a == "-l" || a == "--language") {
                c.language = need(a.c_str(), i);
            } else if (a == "--vad-threshold") {
                if (!to_double(v = need(a.c_str(), i), c.vadThreshold)) bad(a, v);
            } else if (a == "--vad-silence-ms") {
                if (!to_int(v = need(a.c_str(), i), c.vadSilenceMs)) bad(a, v);
            } else if (a == "--chunk-bytes") {
                if (!to_size(v = need(a.c_str(), i), c.chunkBytes)) bad(a, v);
            } else if (a == "--max-pending-chunks") {
                if (!to_size(v = need(a.c_str(), i), c.maxPendingChunks)) bad(a, v);
            } else if (a == "--send-lead-ms") {
                if (!to_int(v = need(a.c_str(), i), c.sendLeadMs)) bad(a, v);
            } else if (a == "--handshake-timeout-ms") {
                if (!to_int(v = need(a.c_str(), i), c.handshakeTimeoutMs)) bad(a, v);
            } else if (a == "--drain-timeout-ms") {
                if (!to_int(v = need(a.c_str(), i), c.drainTimeoutMs)) bad(a, v);
            } else if (a == "--stop-deadline-ms") {
                if (!to_int(v = need(a.c_str(), i), c.stopDeadlineMs)) bad(a, v);
            } else if (a == "--ping-interval") {
                if (!to_int(v = need(a.c_str(), i), c.pingIntervalSec)) bad(a, v);
            } else if (a == "--extra-headers") {
                c.extraHeaders = need(a.c_str(), i);
            } else if (a == "--tls-ca-file") {
                c.tlsCaFile = need(a.c_str(), i);
            } else if (a == "--tls-cert-file") {
                c.tlsCertFile = need(a.c_str(), i);
            } else if (a == "--tls-key-file") {
                c.tlsKeyFile = need(a.c_str(), i);
            } else if (a == "--tls-no-verify-host") {
                c.tlsDisableHostnameValidation = true;
            } else if (a == "-k" || a == "--keep") {
                c.keepOpen = true;
            } else if (a == "--suppress-log") {
                c.suppressLog = true;
            } else if (a == "-d" || a == "--debug") {
                p.debug = true;
            } else if (a == "-q" || a == "--quiet") {
                p.quiet = true;
            } else {
                fprintf(stderr, "unknown argument: %s\n", a.c_str());
                print_usage(argv, c);
                exit(EXIT_USAGE);
            }
        }

        if (c.apiKey.empty()) {
            const char *env = std::getenv(ASR_API_KEY_ENV);
            if (env) c.apiKey = env;
        }
    }

    void init_logging(const cli_params &p) {
        auto logger = spdlog::stderr_color_mt(ASR_STREAM_NAME);
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        if (p.debug)      spdlog::set_level(spdlog::level::debug);
        else if (p.quiet) spdlog::set_level(spdlog::level::warn);
        else              spdlog::set_level(spdlog::level::info);
    }

    /* ── Signals ────────────────────────────────────────────────────────── */
    /* SIGUSR1 is internal: it wakes the watcher once the session has ended. */
    void block_signals(sigset_t &set) {
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
    }

    void watch_signals(sigset_t set, AsrSession &session) {
        for (;;) {
            int sig = 0;
            if (sigwait(&set, &sig) != 0) return;
            if (sig == SIGUSR1) return;
            spdlog::info("received signal {}, stopping", sig);
            session.requestStop();
        }
    }

} /* anonymous namespace */

int main(int argc, char **argv) {
    cli_params p;
    parse_args(argc, argv, p);

    if (isatty(STDIN_FILENO)) {
        fprintf(stderr, "stdin is a terminal, pipe raw PCM audio into %s\n", argv[0]);
        print_usage(argv, p.cfg);
        return EXIT_GRACEFUL;
    }

    init_logging(p);

    std::string err;
    if (!validate_stream_config(p.cfg, err)) {
        spdlog::error("invalid configuration: {}", err);
        return EXIT_USAGE;
    }

    /* every thread created from here on inherits the blocked mask */
    sigset_t set;
    block_signals(set);

    JsonLineSink sink(std::cout);
    FdAudioSource source(STDIN_FILENO);
    std::shared_ptr<WscTransport> transport = WscTransport::create(p.cfg);
    AsrSession session(p.cfg, transport, sink);

    std::thread watcher;
    try {
        watcher = std::thread(watch_signals, set, std::ref(session));
    } catch (const std::system_error &e) {
        spdlog::error("cannot start signal watcher: {}", e.what());
        return EXIT_SESSION;
    }

    const SessionResult result = session.run(source);

    pthread_kill(watcher.native_handle(), SIGUSR1);
    watcher.join();

    if (result.graceful()) return EXIT_GRACEFUL;
    if (result.error == ERR_CONFIG) return EXIT_USAGE;
    return EXIT_SESSION;
}
