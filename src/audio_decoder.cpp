#define MINIAUDIO_IMPLEMENTATION
#define MA_NO_DEVICE_IO
#define MA_NO_ENCODING
#define MA_NO_GENERATION
#include <miniaudio.h>

#include "audio_decoder.h"
#include <cstddef>

namespace scribe {

namespace {

// Frames pulled from the decoder per read
constexpr ma_uint64 CHUNK_FRAMES = 4096;

} // namespace

bool AudioDecoder::decode(const std::string& path, std::vector<float>& samples) {
    samples.clear();
    m_sourceSampleRate = 0;
    m_sourceChannels = 0;

    ma_decoder_config config = ma_decoder_config_init(ma_format_f32, 1, DECODE_SAMPLE_RATE);
    ma_decoder decoder;
    ma_result result = ma_decoder_init_file(path.c_str(), &config, &decoder);
    if (result != MA_SUCCESS) {
        m_lastError = "Cannot decode " + path + ": " + ma_result_description(result);
        return false;
    }

    ma_format sourceFormat;
    ma_uint32 sourceChannels = 0;
    ma_uint32 sourceRate = 0;
    if (decoder.pBackend != nullptr &&
        ma_data_source_get_data_format(decoder.pBackend, &sourceFormat, &sourceChannels,
                                       &sourceRate, nullptr, 0) == MA_SUCCESS) {
        m_sourceSampleRate = sourceRate;
        m_sourceChannels = sourceChannels;
    }

    ma_uint64 expected = 0;
    if (ma_decoder_get_length_in_pcm_frames(&decoder, &expected) == MA_SUCCESS && expected > 0) {
        samples.reserve(static_cast<size_t>(expected));
    }

    std::vector<float> chunk(CHUNK_FRAMES);
    for (;;) {
        ma_uint64 framesRead = 0;
        result = ma_decoder_read_pcm_frames(&decoder, chunk.data(), CHUNK_FRAMES, &framesRead);
        samples.insert(samples.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(framesRead));
        if (result != MA_SUCCESS && result != MA_AT_END) {
            m_lastError = "Error decoding " + path + ": " + ma_result_description(result);
            ma_decoder_uninit(&decoder);
            return false;
        }
        if (result == MA_AT_END || framesRead == 0) {
            break;
        }
    }

    ma_decoder_uninit(&decoder);

    if (samples.empty()) {
        m_lastError = "No audio in " + path;
        return false;
    }
    return true;
}

} // namespace scribe
