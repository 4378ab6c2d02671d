#include "daemon_config.h"
#include "model_cache.h"
#include <cstdlib>
#include <stdexcept>

namespace scribe {

std::optional<std::string> systemEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::string resolveCacheDirectory(const std::string& option, const EnvLookup& env) {
    if (!option.empty()) {
        return option;
    }
    if (auto dir = env("SCRIBED_MODEL_CACHE")) {
        return *dir;
    }
    if (auto dataHome = env("XDG_DATA_HOME")) {
        return *dataHome + "/scribed/models";
    }
    if (auto home = env("HOME")) {
        return *home + "/.local/share/scribed/models";
    }
    return "";
}

std::string usage() {
    return
        "Usage: scribed [options]\n"
        "\n"
        "Reads commands from stdin, writes JSON events to stdout.\n"
        "\n"
        "Options:\n"
        "  -m, --model <id>           Default model (ggerganov/whisper.cpp/ggml-base.bin)\n"
        "      --cache-dir <dir>      Model cache directory (env SCRIBED_MODEL_CACHE)\n"
        "      --endpoint <url>       Download base URL (env SCRIBED_ENDPOINT)\n"
        "      --model-file <name>    Artifact for org/repo identifiers (ggml-model.bin)\n"
        "  -l, --language <code>      Language hint, \"auto\" to detect\n"
        "      --language-report <m>  hint|detected: language reported without a hint\n"
        "  -t, --threads <n>          Inference threads (default: all cores)\n"
        "      --no-gpu               Run inference on the CPU only\n"
        "      --preload              Load the default model at startup\n"
        "  -v, --verbose              Verbose diagnostics on stderr\n"
        "  -h, --help                 Show this help\n";
}

ConfigParseResult parseArguments(const std::vector<std::string>& args, const EnvLookup& env) {
    ConfigParseResult result;
    DaemonConfig& config = result.config;
    std::string cacheOption;

    if (auto endpoint = env("SCRIBED_ENDPOINT")) {
        config.endpoint = *endpoint;
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto takeValue = [&](std::string& out) {
            if (i + 1 >= args.size()) {
                result.error = "Missing value for " + arg;
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string value;
        if (arg == "--model" || arg == "-m") {
            if (!takeValue(config.defaultModel)) return result;
        } else if (arg == "--cache-dir") {
            if (!takeValue(cacheOption)) return result;
        } else if (arg == "--endpoint") {
            if (!takeValue(config.endpoint)) return result;
        } else if (arg == "--model-file") {
            if (!takeValue(config.modelFile)) return result;
        } else if (arg == "--language" || arg == "-l") {
            if (!takeValue(value)) return result;
            if (value.empty() || value == "auto") {
                config.language.reset();
            } else {
                config.language = value;
            }
        } else if (arg == "--language-report") {
            if (!takeValue(value)) return result;
            if (value == "hint") {
                config.languageReport = LanguageReport::Hint;
            } else if (value == "detected") {
                config.languageReport = LanguageReport::Detected;
            } else {
                result.error = "Invalid --language-report value: " + value;
                return result;
            }
        } else if (arg == "--threads" || arg == "-t") {
            if (!takeValue(value)) return result;
            try {
                size_t used = 0;
                config.threads = std::stoi(value, &used);
                if (used != value.size() || config.threads < 0) {
                    throw std::invalid_argument(value);
                }
            } catch (const std::exception&) {
                result.error = "Invalid thread count: " + value;
                return result;
            }
        } else if (arg == "--no-gpu") {
            config.useGpu = false;
        } else if (arg == "--preload") {
            config.preload = true;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else {
            result.error = "Unknown option: " + arg;
            return result;
        }
    }

    if (!isValidIdentifier(config.defaultModel)) {
        result.error = "Invalid default model: " + config.defaultModel;
        return result;
    }
    if (config.modelFile.empty()) {
        result.error = "Model file name must not be empty";
        return result;
    }

    config.cacheDir = resolveCacheDirectory(cacheOption, env);
    if (config.cacheDir.empty() && !config.showHelp) {
        result.error = "Cannot determine model cache directory; set SCRIBED_MODEL_CACHE or HOME";
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace scribe
