#pragma once

#include <string>
#include <vector>

// Forward declare whisper types
struct whisper_context;

namespace scribe {

/**
 * Wrapper around whisper.cpp for speech-to-text on complete recordings
 */
class WhisperWrapper {
public:
    WhisperWrapper();
    ~WhisperWrapper();

    WhisperWrapper(const WhisperWrapper&) = delete;
    WhisperWrapper& operator=(const WhisperWrapper&) = delete;

    /**
     * Load a Whisper model, replacing any model loaded before
     * @param modelPath Path to the GGML model file
     * @param useGpu Offload to CUDA/Metal when available
     * @return true if model loaded successfully
     */
    bool loadModel(const std::string& modelPath, bool useGpu = true);

    /**
     * Transcribe 16kHz mono samples
     * @param samples Audio to transcribe
     * @param language Language code, or "auto" to detect
     * @param text Receives the concatenated segment text
     * @param detectedLanguage Receives the language whisper decoded with
     * @return false on failure, see getLastError()
     */
    bool transcribe(const std::vector<float>& samples, const std::string& language,
                    std::string& text, std::string& detectedLanguage);

    /**
     * Check if model is loaded
     */
    bool isModelLoaded() const { return m_context != nullptr; }

    /**
     * Get last error message
     */
    const std::string& getLastError() const { return m_lastError; }

    /**
     * Number of inference threads, 0 for all cores
     */
    void setThreads(int threads) { m_threads = threads; }

    /**
     * Route whisper.cpp's own log output to stderr, or drop it
     */
    static void setVerboseLogging(bool verbose);

private:
    whisper_context* m_context = nullptr;
    std::string m_lastError;
    int m_threads = 0;
};

} // namespace scribe
