#include "codec/pcm16_codec.hpp"
#include "core/errors.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cmath>

namespace codec {

namespace {

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

// EVP_DecodeBlock tolerates surrounding whitespace and does not report the
// padding, so the alphabet and padding layout are checked here first.
size_t validate_base64(const std::string& text) {
    if (text.size() % 4 != 0) {
        throw core::VoiceError(core::ErrorKind::MalformedAudioPayload,
                               "base64 length is not a multiple of 4");
    }

    size_t padding = 0;
    while (padding < 2 && padding < text.size() && text[text.size() - 1 - padding] == '=') {
        ++padding;
    }

    for (size_t i = 0; i < text.size() - padding; ++i) {
        if (!is_base64_char(text[i])) {
            throw core::VoiceError(core::ErrorKind::MalformedAudioPayload,
                                   "invalid base64 character at offset " + std::to_string(i));
        }
    }
    return padding;
}

}

std::string encode(const std::vector<int16_t>& samples) {
    if (samples.empty()) {
        return {};
    }

    std::vector<unsigned char> bytes(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto value = static_cast<uint16_t>(samples[i]);
        bytes[2 * i]     = static_cast<unsigned char>(value & 0xFF);
        bytes[2 * i + 1] = static_cast<unsigned char>(value >> 8);
    }

    std::string text(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&text[0]),
                                        bytes.data(), static_cast<int>(bytes.size()));
    text.resize(static_cast<size_t>(written));
    return text;
}

std::vector<int16_t> decode(const std::string& text) {
    if (text.empty()) {
        return {};
    }

    const size_t padding = validate_base64(text);

    std::vector<unsigned char> bytes(3 * (text.size() / 4));
    const int decoded = EVP_DecodeBlock(bytes.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (decoded < 0) {
        throw core::VoiceError(core::ErrorKind::MalformedAudioPayload, "base64 decoding failed");
    }

    const size_t byte_count = static_cast<size_t>(decoded) - padding;
    if (byte_count % 2 != 0) {
        throw core::VoiceError(core::ErrorKind::MalformedAudioPayload,
                               "odd PCM16 byte count: " + std::to_string(byte_count));
    }

    std::vector<int16_t> samples(byte_count / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto value = static_cast<uint16_t>(bytes[2 * i] | (bytes[2 * i + 1] << 8));
        samples[i] = static_cast<int16_t>(value);
    }
    return samples;
}

int16_t float_to_pcm16(float sample) {
    if (std::isnan(sample)) {
        return 0;
    }
    const float clamped = std::clamp(sample, -1.0f, 1.0f);
    const float scaled = clamped < 0.0f ? clamped * 32768.0f : clamped * 32767.0f;
    return static_cast<int16_t>(std::lround(scaled));
}

float pcm16_to_float(int16_t sample) {
    return static_cast<float>(sample) / 32768.0f;
}

}
