/**
 * scribed - Speech-to-text daemon
 *
 * A long-running process that transcribes audio files with whisper.cpp on
 * behalf of a host application. The host starts it as a subprocess, writes
 * commands to stdin and reads JSON events from stdout. Diagnostics go to
 * stderr.
 *
 * Usage:
 *   scribed [--model <id>] [--cache-dir <dir>] [--preload] ...
 *
 * Commands (stdin, one per line):
 *   LOAD_MODEL:<id>   - Load or switch model
 *   CHECK_MODEL:<id>  - Report whether a model is cached
 *   <path>            - Transcribe an audio file
 *   QUIT              - Clean shutdown
 *
 * Events (stdout JSON):
 *   {"type":"status","state":"...","details":"..."}
 *   {"type":"download_progress","progress":50,"model":"..."}
 *   {"type":"ready","model":"...","message":"..."}
 *   {"type":"model_status","model":"...","cached":true,"short_name":"..."}
 *   {"type":"transcription","text":"...","language":"...","duration":1.5}
 *   {"type":"error","message":"..."}
 *   {"type":"fatal","message":"..."}
 */

#include <iostream>
#include <string>
#include <vector>
#include <atomic>
#include <csignal>
#include <signal.h>

#include "json_protocol.h"
#include "daemon_config.h"
#include "model_cache.h"
#include "model_downloader.h"
#include "model_manager.h"
#include "transcription_executor.h"
#include "command_loop.h"
#include "whisper_backend.h"
#include "whisper_wrapper.h"

namespace {
    std::atomic<bool> g_shouldExit{false};
}

void signalHandler(int) {
    g_shouldExit.store(true);
}

void installSignalHandlers() {
    // No SA_RESTART: a signal interrupts the blocking read on stdin
    struct sigaction action = {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

int main(int argc, char* argv[]) {
    installSignalHandlers();

    scribe::EventWriter events(std::cout);

    std::vector<std::string> args(argv + 1, argv + argc);
    scribe::ConfigParseResult parsed = scribe::parseArguments(args);
    if (!parsed.ok) {
        std::cerr << scribe::usage();
        events.sendFatal(parsed.error);
        return 1;
    }
    const scribe::DaemonConfig& config = parsed.config;

    if (config.showHelp) {
        std::cerr << scribe::usage();
        return 0;
    }

    std::cerr << "[Main] scribed starting..." << std::endl;
    std::cerr << "[Main] Model cache: " << config.cacheDir << std::endl;
    std::cerr << "[Main] Default model: " << config.defaultModel << std::endl;

    std::string error;
    if (!scribe::ensureDirectory(config.cacheDir, error)) {
        events.sendFatal(error);
        return 1;
    }

    if (!scribe::ModelDownloader::globalInit(error)) {
        events.sendFatal(error);
        return 1;
    }

    scribe::WhisperWrapper::setVerboseLogging(config.verbose);

    {
        scribe::ModelCache cache(config.cacheDir);
        scribe::ModelDownloader downloader(config.endpoint);

        scribe::WhisperBackendOptions options;
        options.defaultFile = config.modelFile;
        options.threads = config.threads;
        options.useGpu = config.useGpu;
        scribe::WhisperBackend backend(cache, downloader, options);

        scribe::ModelManager models(backend, cache, events, config.defaultModel);
        scribe::TranscriptionExecutor executor(models, events, config.languageReport);
        scribe::CommandLoop loop(models, executor, events, config.language);

        if (config.preload) {
            events.sendStatus(scribe::StatusState::Initializing, "Starting speech engine");
            if (cache.isCached(config.defaultModel)) {
                events.sendStatus(scribe::StatusState::Cached,
                                  scribe::shortName(config.defaultModel) + " found in cache");
            }
            models.load(config.defaultModel);
        }

        loop.run(std::cin, &g_shouldExit);

        if (g_shouldExit.load()) {
            std::cerr << "[Main] Received termination signal" << std::endl;
        }

        std::cerr << "[Main] Shutting down..." << std::endl;
        models.unload();
    }

    scribe::ModelDownloader::globalCleanup();

    std::cerr << "[Main] Goodbye!" << std::endl;
    return 0;
}
