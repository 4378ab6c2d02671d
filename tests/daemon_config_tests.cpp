#include "daemon_config.h"

#include <map>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using scribe::LanguageReport;
using scribe::parseArguments;

namespace {

scribe::EnvLookup fakeEnv(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST_CASE("defaults without arguments", "[config]") {
    const auto result = parseArguments({}, fakeEnv({{"HOME", "/home/ada"}}));
    REQUIRE(result.ok);
    REQUIRE(result.config.defaultModel == "ggerganov/whisper.cpp/ggml-base.bin");
    REQUIRE(result.config.cacheDir == "/home/ada/.local/share/scribed/models");
    REQUIRE(result.config.endpoint == "https://huggingface.co");
    REQUIRE_FALSE(result.config.language);
    REQUIRE(result.config.languageReport == LanguageReport::Hint);
    REQUIRE(result.config.useGpu);
    REQUIRE_FALSE(result.config.preload);
}

TEST_CASE("cache directory precedence", "[config]") {
    const auto env = fakeEnv({{"HOME", "/home/ada"},
                              {"XDG_DATA_HOME", "/xdg"},
                              {"SCRIBED_MODEL_CACHE", "/override"}});

    REQUIRE(parseArguments({"--cache-dir", "/cli"}, env).config.cacheDir == "/cli");
    REQUIRE(parseArguments({}, env).config.cacheDir == "/override");
    REQUIRE(parseArguments({}, fakeEnv({{"HOME", "/home/ada"}, {"XDG_DATA_HOME", "/xdg"}})).config.cacheDir ==
            "/xdg/scribed/models");
}

TEST_CASE("no usable cache location is an error", "[config]") {
    const auto result = parseArguments({}, fakeEnv({}));
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.find("cache directory") != std::string::npos);
}

TEST_CASE("all options are parsed", "[config]") {
    const std::vector<std::string> args{"-m", "org/model", "--endpoint", "http://mirror.local/",
                                        "--model-file", "ggml-small.bin", "-l", "en",
                                        "--language-report", "detected", "-t", "4",
                                        "--no-gpu", "--preload", "-v"};
    const auto result = parseArguments(args, fakeEnv({{"HOME", "/h"}}));

    REQUIRE(result.ok);
    REQUIRE(result.config.defaultModel == "org/model");
    REQUIRE(result.config.endpoint == "http://mirror.local/");
    REQUIRE(result.config.modelFile == "ggml-small.bin");
    REQUIRE(result.config.language == std::string("en"));
    REQUIRE(result.config.languageReport == LanguageReport::Detected);
    REQUIRE(result.config.threads == 4);
    REQUIRE_FALSE(result.config.useGpu);
    REQUIRE(result.config.preload);
    REQUIRE(result.config.verbose);
}

TEST_CASE("auto language means no hint", "[config]") {
    const auto result = parseArguments({"--language", "auto"}, fakeEnv({{"HOME", "/h"}}));
    REQUIRE(result.ok);
    REQUIRE_FALSE(result.config.language);
}

TEST_CASE("endpoint can come from the environment", "[config]") {
    const auto env = fakeEnv({{"HOME", "/h"}, {"SCRIBED_ENDPOINT", "http://env.local"}});
    REQUIRE(parseArguments({}, env).config.endpoint == "http://env.local");
    REQUIRE(parseArguments({"--endpoint", "http://cli.local"}, env).config.endpoint == "http://cli.local");
}

TEST_CASE("bad arguments are rejected", "[config]") {
    const auto env = fakeEnv({{"HOME", "/h"}});

    auto unknown = parseArguments({"--frobnicate"}, env);
    REQUIRE_FALSE(unknown.ok);
    REQUIRE(unknown.error == "Unknown option: --frobnicate");

    auto missing = parseArguments({"--model"}, env);
    REQUIRE_FALSE(missing.ok);
    REQUIRE(missing.error == "Missing value for --model");

    REQUIRE_FALSE(parseArguments({"--threads", "four"}, env).ok);
    REQUIRE_FALSE(parseArguments({"--threads", "-2"}, env).ok);
    REQUIRE_FALSE(parseArguments({"--threads", "3x"}, env).ok);
    REQUIRE_FALSE(parseArguments({"--language-report", "model"}, env).ok);
    REQUIRE_FALSE(parseArguments({"--model", "not-an-id"}, env).ok);
    REQUIRE_FALSE(parseArguments({"--model-file", ""}, env).ok);
}

TEST_CASE("help does not need a cache directory", "[config]") {
    const auto result = parseArguments({"--help"}, fakeEnv({}));
    REQUIRE(result.ok);
    REQUIRE(result.config.showHelp);
    REQUIRE(scribe::usage().find("--cache-dir") != std::string::npos);
}
