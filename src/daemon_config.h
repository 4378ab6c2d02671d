#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>

#include "transcription_executor.h"

namespace scribe {

struct DaemonConfig {
    // Model used when a transcription arrives before any LOAD_MODEL
    std::string defaultModel = "ggerganov/whisper.cpp/ggml-base.bin";
    std::string cacheDir;
    std::string endpoint = "https://huggingface.co";
    // Artifact downloaded for two-part identifiers ("org/repo")
    std::string modelFile = "ggml-model.bin";
    std::optional<std::string> language;
    LanguageReport languageReport = LanguageReport::Hint;
    int threads = 0;  // 0 = all cores
    bool useGpu = true;
    bool preload = false;
    bool verbose = false;
    bool showHelp = false;
};

struct ConfigParseResult {
    bool ok = false;
    DaemonConfig config;
    std::string error;
};

// Looks up an environment variable, nullopt if unset or empty
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

std::optional<std::string> systemEnv(const std::string& name);

/**
 * Parse command line arguments (without argv[0]).
 * Environment: SCRIBED_MODEL_CACHE, SCRIBED_ENDPOINT, XDG_DATA_HOME, HOME.
 */
ConfigParseResult parseArguments(const std::vector<std::string>& args, const EnvLookup& env = systemEnv);

/**
 * --cache-dir wins, then SCRIBED_MODEL_CACHE, then the per-user data
 * directory. Empty if no location can be determined.
 */
std::string resolveCacheDirectory(const std::string& option, const EnvLookup& env);

std::string usage();

} // namespace scribe
