#include "model_manager.h"
#include "model_cache.h"
#include "json_protocol.h"
#include <iostream>
#include <stdexcept>

namespace scribe {

const char* toString(ModelStatus status) {
    switch (status) {
        case ModelStatus::Unloaded:    return "unloaded";
        case ModelStatus::Downloading: return "downloading";
        case ModelStatus::Loading:     return "loading";
        case ModelStatus::Ready:       return "ready";
        case ModelStatus::Failed:      return "failed";
    }
    return "unknown";
}

ModelManager::ModelManager(SpeechBackend& backend, const ModelCache& cache, EventWriter& events,
                           std::string defaultModel)
    : m_backend(backend)
    , m_cache(cache)
    , m_events(events)
    , m_defaultModel(std::move(defaultModel))
{
}

ModelManager::~ModelManager() {
    unload();
}

bool ModelManager::load(const std::string& identifier) {
    if (m_status == ModelStatus::Ready && m_identifier == identifier) {
        return true;
    }

    if (!isValidIdentifier(identifier)) {
        m_events.sendError("Invalid model identifier: " + identifier);
        return false;
    }

    const std::string name = shortName(identifier);

    // Never hold two models at once
    if (m_handle) {
        std::cerr << "[Models] Releasing " << *m_identifier << " before loading " << identifier << std::endl;
        unload();
    }

    if (m_cache.isCached(identifier)) {
        m_status = ModelStatus::Loading;
        m_events.sendStatus(StatusState::Loading, "Loading " + name + " (cached)");
    } else {
        m_status = ModelStatus::Downloading;
        m_events.sendStatus(StatusState::Downloading, "Downloading " + name + "...");
        m_events.sendDownloadProgress(0, name);
    }
    m_lastProgress = 0;

    LoadCallbacks callbacks;
    callbacks.onDownloadProgress = [this, name](int percent) {
        reportProgress(percent, name);
    };
    callbacks.onDownloaded = [this, name]() {
        if (m_status == ModelStatus::Downloading) {
            m_status = ModelStatus::Loading;
            m_events.sendStatus(StatusState::Loading, "Loading " + name);
        }
    };

    std::cerr << "[Models] Loading " << identifier << std::endl;

    try {
        std::unique_ptr<SpeechModel> handle = m_backend.load(identifier, callbacks);
        if (!handle) {
            throw std::runtime_error("backend returned no model");
        }
        m_handle = std::move(handle);
        m_identifier = identifier;
        m_status = ModelStatus::Ready;
    } catch (const std::exception& e) {
        m_handle.reset();
        m_identifier.reset();
        m_status = ModelStatus::Failed;

        std::cerr << "[Models] Failed to load " << identifier << ": " << e.what() << std::endl;
        m_events.sendError("Failed to load model " + identifier + ": " + e.what());
        return false;
    }

    std::cerr << "[Models] " << identifier << " is ready" << std::endl;
    m_events.sendDownloadProgress(100, name);
    m_events.sendReady(identifier, "Ready (" + name + ")");
    return true;
}

void ModelManager::reportProgress(int percent, const std::string& model) {
    if (m_status != ModelStatus::Downloading || percent >= 100 || percent <= m_lastProgress) {
        return;
    }

    // Coarse updates only: one per 10% step
    if (percent / 10 <= m_lastProgress / 10) {
        return;
    }

    m_lastProgress = percent;
    m_events.sendDownloadProgress(percent, model);
}

void ModelManager::checkStatus(const std::string& identifier) {
    m_events.sendModelStatus(identifier, m_cache.isCached(identifier), shortName(identifier));
}

bool ModelManager::ensureLoaded() {
    if (isReady()) {
        return true;
    }
    return load(m_defaultModel);
}

void ModelManager::unload() {
    if (m_handle) {
        std::cerr << "[Models] Unloading " << m_identifier.value_or("") << std::endl;
    }
    m_handle.reset();
    m_identifier.reset();
    m_status = ModelStatus::Unloaded;
}

} // namespace scribe
