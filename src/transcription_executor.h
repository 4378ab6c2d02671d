#pragma once

#include <string>
#include <optional>

namespace scribe {

class EventWriter;
class ModelManager;

struct TranscriptionRequest {
    std::string audioPath;
    std::optional<std::string> language;
};

/**
 * What the "language" field of a transcription reports when the caller gave
 * no hint.
 */
enum class LanguageReport {
    Hint,       // always "auto"
    Detected    // whatever the model detected, "auto" if it reports nothing
};

/**
 * Runs one transcription against the current model and reports the result
 * or failure as an event. Never throws.
 */
class TranscriptionExecutor {
public:
    TranscriptionExecutor(ModelManager& models, EventWriter& events,
                          LanguageReport languageReport = LanguageReport::Hint);

    /**
     * @return true if a transcription event was emitted
     */
    bool transcribe(const TranscriptionRequest& request);

private:
    ModelManager& m_models;
    EventWriter& m_events;
    LanguageReport m_languageReport;
};

} // namespace scribe
