#pragma once

#include <string>
#include <vector>

namespace scribe {

// Sample rate expected by whisper.cpp
constexpr unsigned int DECODE_SAMPLE_RATE = 16000;

/**
 * Decodes an audio file (WAV, FLAC, MP3) with miniaudio into 16kHz mono
 * float samples, converting format, channel count and rate on the way.
 */
class AudioDecoder {
public:
    bool decode(const std::string& path, std::vector<float>& samples);

    // Rate and channel count of the last decoded file as stored on disk
    unsigned int sourceSampleRate() const { return m_sourceSampleRate; }
    unsigned int sourceChannels() const { return m_sourceChannels; }

    const std::string& getLastError() const { return m_lastError; }

private:
    unsigned int m_sourceSampleRate = 0;
    unsigned int m_sourceChannels = 0;
    std::string m_lastError;
};

} // namespace scribe
