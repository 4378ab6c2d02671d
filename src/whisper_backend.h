#pragma once

#include <string>
#include <memory>

#include "speech_backend.h"

namespace scribe {

class ModelCache;
class ModelDownloader;

struct WhisperBackendOptions {
    // Artifact used when an identifier names only "org/repo"
    std::string defaultFile = "ggml-model.bin";
    int threads = 0;
    bool useGpu = true;
};

/**
 * whisper.cpp models fetched from a Hugging Face style endpoint into the
 * local cache.
 */
class WhisperBackend : public SpeechBackend {
public:
    WhisperBackend(const ModelCache& cache, ModelDownloader& downloader, WhisperBackendOptions options);

    std::unique_ptr<SpeechModel> load(const std::string& identifier,
                                      const LoadCallbacks& callbacks) override;

private:
    const ModelCache& m_cache;
    ModelDownloader& m_downloader;
    WhisperBackendOptions m_options;
};

} // namespace scribe
