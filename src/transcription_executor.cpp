#include "transcription_executor.h"
#include "model_manager.h"
#include "json_protocol.h"
#include <iostream>
#include <chrono>
#include <filesystem>
#include <system_error>

namespace scribe {

TranscriptionExecutor::TranscriptionExecutor(ModelManager& models, EventWriter& events,
                                             LanguageReport languageReport)
    : m_models(models)
    , m_events(events)
    , m_languageReport(languageReport)
{
}

bool TranscriptionExecutor::transcribe(const TranscriptionRequest& request) {
    if (!m_models.isReady() && !m_models.ensureLoaded()) {
        // The failed load already reported its error
        return false;
    }

    std::error_code ec;
    const std::filesystem::path path(request.audioPath);
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        m_events.sendError("File not found: " + request.audioPath);
        return false;
    }

    SpeechModel* model = m_models.currentModel();
    if (!model) {
        m_events.sendError("No model loaded");
        return false;
    }

    m_events.sendStatus(StatusState::Transcribing, "Transcribing " + path.filename().string());

    TranscriptResult result;
    const auto start = std::chrono::steady_clock::now();
    try {
        result = model->transcribe(request.audioPath, request.language);
    } catch (const std::exception& e) {
        std::cerr << "[Executor] Transcription of " << request.audioPath << " failed: " << e.what() << std::endl;
        m_events.sendError(std::string("Transcription failed: ") + e.what());
        return false;
    }
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    std::string language = "auto";
    if (request.language && !request.language->empty()) {
        language = *request.language;
    } else if (m_languageReport == LanguageReport::Detected && !result.language.empty()) {
        language = result.language;
    }

    const std::string text = trim(result.text);
    std::cerr << "[Executor] Transcribed " << request.audioPath << " in " << elapsed.count() << "s" << std::endl;

    m_events.sendTranscription(text, language, elapsed.count());
    return true;
}

} // namespace scribe
