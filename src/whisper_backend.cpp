#include "whisper_backend.h"
#include "whisper_wrapper.h"
#include "model_cache.h"
#include "model_artifact.h"
#include "model_downloader.h"
#include "audio_decoder.h"
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace scribe {

namespace {

class WhisperModel : public SpeechModel {
public:
    explicit WhisperModel(std::unique_ptr<WhisperWrapper> whisper)
        : m_whisper(std::move(whisper))
    {
    }

    TranscriptResult transcribe(const std::string& audioPath,
                                const std::optional<std::string>& language) override {
        std::vector<float> samples;
        AudioDecoder decoder;
        if (!decoder.decode(audioPath, samples)) {
            throw std::runtime_error(decoder.getLastError());
        }
        std::cerr << "[Whisper] " << audioPath << ": " << decoder.sourceSampleRate() << "Hz x"
                  << decoder.sourceChannels() << " -> " << samples.size() << " samples" << std::endl;

        TranscriptResult result;
        if (!m_whisper->transcribe(samples, language.value_or("auto"), result.text, result.language)) {
            throw std::runtime_error(m_whisper->getLastError());
        }
        return result;
    }

private:
    std::unique_ptr<WhisperWrapper> m_whisper;
};

} // namespace

WhisperBackend::WhisperBackend(const ModelCache& cache, ModelDownloader& downloader,
                               WhisperBackendOptions options)
    : m_cache(cache)
    , m_downloader(downloader)
    , m_options(std::move(options))
{
}

std::unique_ptr<SpeechModel> WhisperBackend::load(const std::string& identifier,
                                                  const LoadCallbacks& callbacks) {
    const ArtifactLocation location = locateArtifact(identifier, m_options.defaultFile);
    const fs::path modelDir = m_cache.modelDir(identifier);

    fs::path artifact = findArtifact(modelDir, location.file);
    if (artifact.empty()) {
        const fs::path destination = snapshotPath(modelDir, location.file);
        const fs::path partial = partialPath(modelDir, location.file);

        ModelDownloader::ProgressCallback progress;
        if (callbacks.onDownloadProgress) {
            progress = callbacks.onDownloadProgress;
        }

        const std::string url = m_downloader.urlFor(location.repo, location.file);
        if (!m_downloader.download(url, partial, destination, progress)) {
            throw std::runtime_error("download failed: " + m_downloader.getLastError());
        }
        artifact = destination;
    }

    if (callbacks.onDownloaded) {
        callbacks.onDownloaded();
    }

    auto whisper = std::make_unique<WhisperWrapper>();
    whisper->setThreads(m_options.threads);
    if (!whisper->loadModel(artifact.string(), m_options.useGpu)) {
        throw std::runtime_error(whisper->getLastError());
    }

    return std::make_unique<WhisperModel>(std::move(whisper));
}

} // namespace scribe
