#pragma once

#include <string>
#include <memory>
#include <optional>
#include <functional>

namespace scribe {

struct TranscriptResult {
    std::string text;
    // Language reported by the model, empty if it cannot tell
    std::string language;
};

/**
 * A loaded, ready-to-use model. Expensive to create; the daemon keeps at
 * most one alive at a time.
 */
class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    /**
     * Transcribe an audio file
     * @param audioPath Path to an existing audio file
     * @param language Language code hint, or nullopt to auto-detect
     * @throws std::runtime_error on any failure
     */
    virtual TranscriptResult transcribe(const std::string& audioPath,
                                        const std::optional<std::string>& language) = 0;
};

/**
 * Progress hooks invoked while a model is being fetched and loaded.
 * Either may be empty.
 */
struct LoadCallbacks {
    // Download progress in percent, 0-100
    std::function<void(int percent)> onDownloadProgress;
    // Artifacts are local, weights are about to be loaded
    std::function<void()> onDownloaded;
};

/**
 * Turns a model identifier into a SpeechModel, downloading the artifacts
 * first when they are not cached.
 */
class SpeechBackend {
public:
    virtual ~SpeechBackend() = default;

    /**
     * @throws std::runtime_error if the model cannot be fetched or loaded
     */
    virtual std::unique_ptr<SpeechModel> load(const std::string& identifier,
                                              const LoadCallbacks& callbacks) = 0;
};

} // namespace scribe
