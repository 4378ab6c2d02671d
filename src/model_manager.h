#pragma once

#include <string>
#include <memory>
#include <optional>

#include "speech_backend.h"

namespace scribe {

class EventWriter;
class ModelCache;

enum class ModelStatus {
    Unloaded,
    Downloading,
    Loading,
    Ready,
    Failed
};

const char* toString(ModelStatus status);

/**
 * Owns the single current model and drives its lifecycle.
 *
 * The handle is present iff the status is Ready, and it always belongs to
 * currentIdentifier(). Switching models releases the old handle before the
 * new one is created.
 */
class ModelManager {
public:
    ModelManager(SpeechBackend& backend, const ModelCache& cache, EventWriter& events,
                 std::string defaultModel);
    ~ModelManager();

    ModelManager(const ModelManager&) = delete;
    ModelManager& operator=(const ModelManager&) = delete;

    /**
     * Load a model, downloading it if needed. Returns immediately without
     * emitting anything if the same model is already Ready.
     * @return true if the model is Ready afterwards
     */
    bool load(const std::string& identifier);

    /**
     * Report whether a model is in the local cache. Does not touch the
     * current model.
     */
    void checkStatus(const std::string& identifier);

    /**
     * Make sure some model is Ready, loading the default model if needed.
     * The fallback also applies after an explicit load has failed: the
     * default is loaded rather than retrying the failed identifier.
     */
    bool ensureLoaded();

    /**
     * Release the current model, if any
     */
    void unload();

    ModelStatus status() const { return m_status; }
    bool isReady() const { return m_status == ModelStatus::Ready; }
    const std::optional<std::string>& currentIdentifier() const { return m_identifier; }
    const std::string& defaultModel() const { return m_defaultModel; }

    // Current model, or nullptr if none is Ready
    SpeechModel* currentModel() const { return m_handle.get(); }

private:
    void reportProgress(int percent, const std::string& model);

    SpeechBackend& m_backend;
    const ModelCache& m_cache;
    EventWriter& m_events;
    std::string m_defaultModel;

    std::optional<std::string> m_identifier;
    std::unique_ptr<SpeechModel> m_handle;
    ModelStatus m_status = ModelStatus::Unloaded;

    // Last download percentage reported for the load in progress
    int m_lastProgress = 0;
};

} // namespace scribe
