#ifndef SLIDE_VOICE_NOISE_SUPPRESSOR_HPP
#define SLIDE_VOICE_NOISE_SUPPRESSOR_HPP

#include "processing/sample_processor.hpp"
#include <vector>
#include <deque>
#include <cstdint>
#include <complex>

namespace processing {
    // Spectral subtraction over 50%-overlapped sqrt-Hann blocks. The noise
    // spectrum is learned from blocks the detector marks as non-speech.
    // Adds block_size / 2 samples of latency; frame length is preserved.
    class NoiseSuppressor : public SampleProcessor {
    public:
        explicit NoiseSuppressor(size_t block_size = 512, float over_subtraction = 1.5f,
                                 float spectral_floor = 0.08f);

        void process(std::vector<int16_t>& samples) override;
        void reset() override;

        bool voice_active() const { return voice_activity_; }
        size_t latency() const { return hop_size_; }

    private:
        void process_block();
        bool detect_voice_activity(const std::vector<float>& block);
        void update_noise_estimate();
        float gain_for_bin(size_t bin) const;

        static void fft(std::vector<std::complex<float>>& data, bool inverse);

        size_t block_size_;
        size_t hop_size_;
        float over_subtraction_;
        float spectral_floor_;

        std::vector<float> window_;
        std::vector<float> previous_hop_;
        std::vector<float> current_hop_;
        std::vector<float> overlap_;
        std::deque<float> output_;

        std::vector<std::complex<float>> spectrum_;
        std::vector<float> magnitude_;
        std::vector<float> noise_;

        float noise_energy_;
        size_t blocks_seen_;
        bool voice_activity_;
    };
}

#endif
