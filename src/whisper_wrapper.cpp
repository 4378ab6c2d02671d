#include "whisper_wrapper.h"
#include "whisper.h"
#include <iostream>
#include <algorithm>
#include <chrono>
#include <thread>

namespace scribe {

namespace {

void quietLog(enum ggml_log_level, const char*, void*) {
}

void stderrLog(enum ggml_log_level, const char* text, void*) {
    std::cerr << text;
}

} // namespace

void WhisperWrapper::setVerboseLogging(bool verbose) {
    whisper_log_set(verbose ? stderrLog : quietLog, nullptr);
}

WhisperWrapper::WhisperWrapper() = default;

WhisperWrapper::~WhisperWrapper() {
    if (m_context) {
        whisper_free(m_context);
        m_context = nullptr;
    }
}

bool WhisperWrapper::loadModel(const std::string& modelPath, bool useGpu) {
    if (m_context) {
        whisper_free(m_context);
        m_context = nullptr;
    }

    std::cerr << "[Whisper] Loading model: " << modelPath << std::endl;

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = useGpu;

    m_context = whisper_init_from_file_with_params(modelPath.c_str(), cparams);

    if (!m_context) {
        m_lastError = "Failed to load Whisper model from: " + modelPath;
        std::cerr << "[Whisper] " << m_lastError << std::endl;
        return false;
    }

    std::cerr << "[Whisper] Model loaded successfully" << std::endl;
    return true;
}

bool WhisperWrapper::transcribe(const std::vector<float>& samples, const std::string& language,
                                std::string& text, std::string& detectedLanguage) {
    text.clear();
    detectedLanguage.clear();

    if (!m_context) {
        m_lastError = "No model loaded";
        return false;
    }
    if (samples.empty()) {
        m_lastError = "Audio contains no samples";
        return false;
    }

    const bool autoDetect = language.empty() || language == "auto";
    if (!autoDetect && whisper_lang_id(language.c_str()) < 0) {
        m_lastError = "Unsupported language: " + language;
        return false;
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.print_realtime = false;
    params.print_progress = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.translate = false;
    params.language = autoDetect ? "auto" : language.c_str();
    params.detect_language = false;
    params.n_threads = m_threads > 0
        ? m_threads
        : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    params.offset_ms = 0;
    params.no_context = true;
    params.suppress_blank = true;

    auto start = std::chrono::steady_clock::now();

    int result = whisper_full(m_context, params, samples.data(), static_cast<int>(samples.size()));

    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    if (result != 0) {
        m_lastError = "whisper_full failed with code " + std::to_string(result);
        std::cerr << "[Whisper] " << m_lastError << std::endl;
        return false;
    }

    // Segments carry their own leading spaces
    int numSegments = whisper_full_n_segments(m_context);
    for (int i = 0; i < numSegments; ++i) {
        const char* segment = whisper_full_get_segment_text(m_context, i);
        if (segment) {
            text += segment;
        }
    }

    const int langId = whisper_full_lang_id(m_context);
    if (langId >= 0) {
        const char* lang = whisper_lang_str(langId);
        if (lang) {
            detectedLanguage = lang;
        }
    }

    std::cerr << "[Whisper] " << numSegments << " segments in " << duration.count() << "ms" << std::endl;
    return true;
}

} // namespace scribe
