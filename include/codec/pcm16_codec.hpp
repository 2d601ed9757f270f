#ifndef SLIDE_VOICE_PCM16_CODEC_HPP
#define SLIDE_VOICE_PCM16_CODEC_HPP

#include <string>
#include <vector>
#include <cstdint>

// PCM16 <-> base64 text, the audio encoding carried in "audio.input" and
// "audio.output" messages. Samples are little-endian signed 16-bit, mono.
namespace codec {
    std::string encode(const std::vector<int16_t>& samples);

    // Throws core::VoiceError(MalformedAudioPayload) for invalid base64 or an
    // odd decoded byte count.
    std::vector<int16_t> decode(const std::string& text);

    // Clamps to [-1, 1] and rounds to the nearest 16-bit value.
    int16_t float_to_pcm16(float sample);
    float pcm16_to_float(int16_t sample);
}

#endif
