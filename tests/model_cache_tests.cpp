#include "model_cache.h"

#include "fake_backend.h"

#include <filesystem>
#include <stdexcept>
#include <string>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using scribe::testing::TempDir;

TEST_CASE("identifier validation", "[cache]") {
    REQUIRE(scribe::isValidIdentifier("demo/model-a"));
    REQUIRE(scribe::isValidIdentifier("ggerganov/whisper.cpp/ggml-base.bin"));

    REQUIRE_FALSE(scribe::isValidIdentifier(""));
    REQUIRE_FALSE(scribe::isValidIdentifier("single"));
    REQUIRE_FALSE(scribe::isValidIdentifier("/abs/path"));
    REQUIRE_FALSE(scribe::isValidIdentifier("org/"));
    REQUIRE_FALSE(scribe::isValidIdentifier("org//model"));
    REQUIRE_FALSE(scribe::isValidIdentifier("org/../model"));
    REQUIRE_FALSE(scribe::isValidIdentifier("org/./model"));
    REQUIRE_FALSE(scribe::isValidIdentifier("org--x/model"));
    REQUIRE_FALSE(scribe::isValidIdentifier("org\\model"));
}

TEST_CASE("short name is the part after the last slash", "[cache]") {
    REQUIRE(scribe::shortName("mlx-community/Qwen3-ASR-1.7B-8bit") == "Qwen3-ASR-1.7B-8bit");
    REQUIRE(scribe::shortName("ggerganov/whisper.cpp/ggml-base.bin") == "ggml-base.bin");
    REQUIRE(scribe::shortName("plain") == "plain");
}

TEST_CASE("cache key follows the hub layout", "[cache]") {
    REQUIRE(scribe::cacheKey("mlx-community/Qwen3-ASR") == "models--mlx-community--Qwen3-ASR");
    REQUIRE(scribe::cacheKey("a/b/c") == "models--a--b--c");
    REQUIRE(scribe::cacheKey("a-b/c") != scribe::cacheKey("a/b-c"));
}

TEST_CASE("a model is cached only once its snapshot exists", "[cache]") {
    TempDir dir;
    scribe::ModelCache cache(dir.path());

    REQUIRE_FALSE(cache.isCached("demo/model-a"));

    fs::create_directories(cache.modelDir("demo/model-a") / "blobs");
    REQUIRE_FALSE(cache.isCached("demo/model-a"));

    fs::create_directories(cache.modelDir("demo/model-a") / "snapshots");
    REQUIRE_FALSE(cache.isCached("demo/model-a"));

    // An empty snapshot directory is not a finished download
    fs::create_directories(cache.modelDir("demo/model-a") / "snapshots" / "main" / "nested");
    REQUIRE_FALSE(cache.isCached("demo/model-a"));

    scribe::testing::seedCache(dir.path(), "demo/model-a");
    REQUIRE(cache.isCached("demo/model-a"));
    REQUIRE_FALSE(cache.isCached("demo/model-b"));
}

TEST_CASE("missing cache root reads as not cached", "[cache]") {
    scribe::ModelCache cache("/nonexistent/scribed/cache/root");
    REQUIRE_FALSE(cache.isCached("demo/model-a"));
}

TEST_CASE("invalid identifiers are never cached", "[cache]") {
    TempDir dir;
    scribe::ModelCache cache(dir.path());
    fs::create_directories(dir.path() / "models--" / "snapshots" / "main");
    REQUIRE_FALSE(cache.isCached(""));
    REQUIRE_FALSE(cache.isCached("../escape"));
}

TEST_CASE("completeness check is pluggable", "[cache]") {
    TempDir dir;
    scribe::ModelCache cache(dir.path(), [](const fs::path& modelDir) {
        return fs::exists(modelDir / "DONE");
    });

    scribe::testing::seedCache(dir.path(), "demo/model-a");
    REQUIRE_FALSE(cache.isCached("demo/model-a"));

    dir.write(scribe::cacheKey("demo/model-a") + "/DONE", "");
    REQUIRE(cache.isCached("demo/model-a"));
}

TEST_CASE("a throwing completeness check reads as not cached", "[cache]") {
    TempDir dir;
    scribe::ModelCache cache(dir.path(), [](const fs::path&) -> bool {
        throw std::runtime_error("permission denied");
    });
    scribe::testing::seedCache(dir.path(), "demo/model-a");
    REQUIRE_FALSE(cache.isCached("demo/model-a"));
}

TEST_CASE("ensureDirectory creates nested directories", "[cache]") {
    TempDir dir;
    std::string error;
    const fs::path nested = dir.path() / "a" / "b" / "models";
    REQUIRE(scribe::ensureDirectory(nested, error));
    REQUIRE(fs::is_directory(nested));
    REQUIRE(scribe::ensureDirectory(nested, error));

    const fs::path file = dir.write("plain-file", "x");
    REQUIRE_FALSE(scribe::ensureDirectory(file / "sub", error));
    REQUIRE_FALSE(error.empty());
}
