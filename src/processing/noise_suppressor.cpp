#include "processing/noise_suppressor.hpp"
#include "codec/pcm16_codec.hpp"
#include <algorithm>
#include <numeric>
#include <cmath>

namespace processing {

namespace {

constexpr float kPi = 3.14159265358979323846f;
constexpr size_t kLearningBlocks = 8;
constexpr float kNoiseSmoothing = 0.95f;
constexpr float kSpeechEnergyRatio = 3.0f;
constexpr float kMaxVoicedZeroCrossings = 0.35f;

size_t next_power_of_two(size_t n) {
    size_t p = 2;
    while (p < n) p <<= 1;
    return p;
}

}

NoiseSuppressor::NoiseSuppressor(size_t block_size, float over_subtraction, float spectral_floor)
    : block_size_(next_power_of_two(block_size)),
      hop_size_(block_size_ / 2),
      over_subtraction_(over_subtraction),
      spectral_floor_(spectral_floor),
      window_(block_size_),
      spectrum_(block_size_),
      magnitude_(block_size_ / 2 + 1, 0.0f),
      noise_(block_size_ / 2 + 1, 0.0f),
      noise_energy_(0.0f),
      blocks_seen_(0),
      voice_activity_(false) {
    // Periodic sqrt-Hann on both analysis and synthesis sums to one at 50% overlap
    for (size_t i = 0; i < block_size_; ++i) {
        const float hann = 0.5f * (1.0f - std::cos(2.0f * kPi * i / block_size_));
        window_[i] = std::sqrt(hann);
    }
    reset();
}

void NoiseSuppressor::process(std::vector<int16_t>& samples) {
    for (auto& sample : samples) {
        current_hop_.push_back(codec::pcm16_to_float(sample));
        if (current_hop_.size() == hop_size_) {
            process_block();
        }

        sample = codec::float_to_pcm16(output_.front());
        output_.pop_front();
    }
}

void NoiseSuppressor::process_block() {
    std::vector<float> block(previous_hop_);
    block.insert(block.end(), current_hop_.begin(), current_hop_.end());

    voice_activity_ = detect_voice_activity(block);

    for (size_t i = 0; i < block_size_; ++i) {
        spectrum_[i] = std::complex<float>(block[i] * window_[i], 0.0f);
    }
    fft(spectrum_, false);

    for (size_t k = 0; k < magnitude_.size(); ++k) {
        magnitude_[k] = std::abs(spectrum_[k]);
    }

    if (!voice_activity_) {
        update_noise_estimate();
    }
    ++blocks_seen_;

    // Real input: bins k and N-k share one gain
    for (size_t k = 0; k < magnitude_.size(); ++k) {
        const float gain = gain_for_bin(k);
        spectrum_[k] *= gain;
        if (k != 0 && k != block_size_ / 2) {
            spectrum_[block_size_ - k] *= gain;
        }
    }
    fft(spectrum_, true);

    for (size_t i = 0; i < hop_size_; ++i) {
        output_.push_back(overlap_[i] + spectrum_[i].real() * window_[i]);
    }
    for (size_t i = 0; i < hop_size_; ++i) {
        overlap_[i] = spectrum_[i + hop_size_].real() * window_[i + hop_size_];
    }

    previous_hop_.swap(current_hop_);
    current_hop_.clear();
}

bool NoiseSuppressor::detect_voice_activity(const std::vector<float>& block) {
    const float energy = std::inner_product(block.begin(), block.end(), block.begin(), 0.0f) /
                         static_cast<float>(block.size());

    size_t crossings = 0;
    for (size_t i = 1; i < block.size(); ++i) {
        if ((block[i] >= 0.0f) != (block[i - 1] >= 0.0f)) {
            ++crossings;
        }
    }
    const float zero_crossing_rate = static_cast<float>(crossings) / static_cast<float>(block.size() - 1);

    if (blocks_seen_ < kLearningBlocks) {
        noise_energy_ += (energy - noise_energy_) / static_cast<float>(blocks_seen_ + 1);
        return false;
    }

    const bool speech = energy > 1e-7f &&
                        energy > noise_energy_ * kSpeechEnergyRatio &&
                        zero_crossing_rate < kMaxVoicedZeroCrossings;
    if (!speech) {
        noise_energy_ = kNoiseSmoothing * noise_energy_ + (1.0f - kNoiseSmoothing) * energy;
    }
    return speech;
}

void NoiseSuppressor::update_noise_estimate() {
    if (blocks_seen_ < kLearningBlocks) {
        const float weight = 1.0f / static_cast<float>(blocks_seen_ + 1);
        for (size_t k = 0; k < noise_.size(); ++k) {
            noise_[k] += (magnitude_[k] - noise_[k]) * weight;
        }
        return;
    }
    for (size_t k = 0; k < noise_.size(); ++k) {
        noise_[k] = kNoiseSmoothing * noise_[k] + (1.0f - kNoiseSmoothing) * magnitude_[k];
    }
}

float NoiseSuppressor::gain_for_bin(size_t bin) const {
    if (magnitude_[bin] <= 1e-9f) {
        return spectral_floor_;
    }
    const float gain = 1.0f - over_subtraction_ * noise_[bin] / magnitude_[bin];
    return std::clamp(gain, spectral_floor_, 1.0f);
}

void NoiseSuppressor::fft(std::vector<std::complex<float>>& data, bool inverse) {
    const size_t n = data.size();

    for (size_t i = 1, j = 0; i < n; ++i) {
        size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(data[i], data[j]);
        }
    }

    for (size_t len = 2; len <= n; len <<= 1) {
        const float angle = 2.0f * kPi / static_cast<float>(len) * (inverse ? 1.0f : -1.0f);
        const std::complex<float> step(std::cos(angle), std::sin(angle));
        for (size_t i = 0; i < n; i += len) {
            std::complex<float> w(1.0f, 0.0f);
            for (size_t k = 0; k < len / 2; ++k) {
                const auto even = data[i + k];
                const auto odd = data[i + k + len / 2] * w;
                data[i + k] = even + odd;
                data[i + k + len / 2] = even - odd;
                w *= step;
            }
        }
    }

    if (inverse) {
        for (auto& value : data) {
            value /= static_cast<float>(n);
        }
    }
}

void NoiseSuppressor::reset() {
    previous_hop_.assign(hop_size_, 0.0f);
    current_hop_.clear();
    current_hop_.reserve(hop_size_);
    overlap_.assign(hop_size_, 0.0f);

    // One hop of silence primes the output so every input sample has an output
    output_.assign(hop_size_, 0.0f);

    std::fill(magnitude_.begin(), magnitude_.end(), 0.0f);
    std::fill(noise_.begin(), noise_.end(), 0.0f);
    noise_energy_ = 0.0f;
    blocks_seen_ = 0;
    voice_activity_ = false;
}

}
