#include "transcription_executor.h"

#include "fake_backend.h"
#include "json_protocol.h"
#include "model_cache.h"
#include "model_manager.h"

#include <sstream>
#include <string>

#include <catch2/catch_test_macros.hpp>

using scribe::LanguageReport;
using scribe::TranscriptionRequest;
using scribe::testing::countEvents;
using scribe::testing::eventLines;
using scribe::testing::FakeBackend;
using scribe::testing::findEvent;
using scribe::testing::TempDir;

namespace {

struct ExecutorFixture {
    explicit ExecutorFixture(LanguageReport report = LanguageReport::Hint) : executor(models, events, report) {}

    TempDir dir;
    TempDir cacheDir;
    FakeBackend backend;
    scribe::ModelCache cache{cacheDir.path()};
    std::ostringstream out;
    scribe::EventWriter events{out};
    scribe::ModelManager models{backend, cache, events, "demo/default"};
    scribe::TranscriptionExecutor executor;

    std::string audio() const { return dir.write("clip.wav", "RIFF").string(); }
    std::vector<std::string> lines() const { return eventLines(out); }
};

} // namespace

TEST_CASE("transcription without a loaded model loads the default first", "[executor]") {
    ExecutorFixture f;
    TranscriptionRequest request{f.audio(), std::nullopt};

    REQUIRE(f.executor.transcribe(request));

    const auto lines = f.lines();
    REQUIRE(f.backend.loadCalls == std::vector<std::string>{"demo/default"});
    REQUIRE(findEvent(lines, "ready") < findEvent(lines, "transcription"));
    REQUIRE(countEvents(lines, "transcription") == 1);
    REQUIRE(f.backend.transcribeCalls.size() == 1);
    REQUIRE(f.backend.transcribeCalls[0].model == "demo/default");
}

TEST_CASE("transcription text is trimmed at the edges only", "[executor]") {
    ExecutorFixture f;
    REQUIRE(f.executor.transcribe({f.audio(), std::nullopt}));

    const std::string last = f.lines().back();
    REQUIRE(last.rfind("{\"type\":\"transcription\",\"text\":\"Hello,\\n  world.\",\"language\":\"auto\",\"duration\":", 0) == 0);
}

TEST_CASE("a transcribing status precedes the result", "[executor]") {
    ExecutorFixture f;
    REQUIRE(f.models.load("demo/model-a"));
    const std::string path = f.audio();

    REQUIRE(f.executor.transcribe({path, std::nullopt}));

    const auto lines = f.lines();
    REQUIRE(lines[lines.size() - 2] == "{\"type\":\"status\",\"state\":\"transcribing\",\"details\":\"Transcribing clip.wav\"}");
    REQUIRE(f.backend.transcribeCalls[0].path == path);
    REQUIRE(f.backend.transcribeCalls[0].model == "demo/model-a");
}

TEST_CASE("a missing file fails fast with one error", "[executor]") {
    ExecutorFixture f;
    REQUIRE(f.models.load("demo/model-a"));
    const size_t before = f.lines().size();

    REQUIRE_FALSE(f.executor.transcribe({"/nonexistent/file.wav", std::nullopt}));

    const auto lines = f.lines();
    REQUIRE(lines.size() == before + 1);
    REQUIRE(lines.back() == "{\"type\":\"error\",\"message\":\"File not found: /nonexistent/file.wav\"}");
    REQUIRE(f.backend.transcribeCalls.empty());
}

TEST_CASE("a directory is not a transcribable file", "[executor]") {
    ExecutorFixture f;
    REQUIRE(f.models.load("demo/model-a"));
    REQUIRE_FALSE(f.executor.transcribe({f.dir.path().string(), std::nullopt}));
    REQUIRE(countEvents(f.lines(), "error") == 1);
    REQUIRE(f.backend.transcribeCalls.empty());
}

TEST_CASE("nothing is transcribed when the default model cannot load", "[executor]") {
    ExecutorFixture f;
    f.backend.failing.insert("demo/default");

    REQUIRE_FALSE(f.executor.transcribe({f.audio(), std::nullopt}));

    const auto lines = f.lines();
    REQUIRE(countEvents(lines, "error") == 1);
    REQUIRE(lines.back().find("Failed to load model demo/default") != std::string::npos);
    REQUIRE(findEvent(lines, "transcription") == lines.size());
    REQUIRE(f.backend.transcribeCalls.empty());
}

TEST_CASE("an inference failure keeps the model loaded", "[executor]") {
    ExecutorFixture f;
    REQUIRE(f.models.load("demo/model-a"));
    f.backend.failTranscription = true;

    REQUIRE_FALSE(f.executor.transcribe({f.audio(), std::nullopt}));
    REQUIRE(f.lines().back() == "{\"type\":\"error\",\"message\":\"Transcription failed: decoder exploded\"}");
    REQUIRE(f.models.isReady());
    REQUIRE(f.models.currentIdentifier() == std::string("demo/model-a"));

    f.backend.failTranscription = false;
    REQUIRE(f.executor.transcribe({f.audio(), std::nullopt}));
    REQUIRE(f.backend.loadCalls.size() == 1);
}

TEST_CASE("the language hint is passed through and reported", "[executor]") {
    ExecutorFixture f(LanguageReport::Detected);
    REQUIRE(f.executor.transcribe({f.audio(), std::string("fr")}));

    REQUIRE(f.backend.transcribeCalls[0].language == std::string("fr"));
    REQUIRE(f.lines().back().find("\"language\":\"fr\"") != std::string::npos);
}

TEST_CASE("without a hint the language is auto in hint mode", "[executor]") {
    ExecutorFixture f(LanguageReport::Hint);
    REQUIRE(f.executor.transcribe({f.audio(), std::nullopt}));
    REQUIRE_FALSE(f.backend.transcribeCalls[0].language);
    REQUIRE(f.lines().back().find("\"language\":\"auto\"") != std::string::npos);
}

TEST_CASE("without a hint detected mode reports the model's language", "[executor]") {
    ExecutorFixture f(LanguageReport::Detected);
    REQUIRE(f.executor.transcribe({f.audio(), std::nullopt}));
    REQUIRE(f.lines().back().find("\"language\":\"de\"") != std::string::npos);

    f.backend.detectedLanguage.clear();
    REQUIRE(f.executor.transcribe({f.audio(), std::nullopt}));
    REQUIRE(f.lines().back().find("\"language\":\"auto\"") != std::string::npos);
}
