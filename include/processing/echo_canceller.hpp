#ifndef SLIDE_VOICE_ECHO_CANCELLER_HPP
#define SLIDE_VOICE_ECHO_CANCELLER_HPP

#include "processing/sample_processor.hpp"
#include <vector>
#include <deque>
#include <cstdint>
#include <cstddef>
#include <mutex>
#include <atomic>

namespace processing {
    // NLMS echo canceller. The playback side feeds rendered speaker samples
    // through on_playback(); process() pairs each captured sample with the
    // next far-end sample in arrival order and subtracts the estimated echo.
    class EchoCanceller : public SampleProcessor {
    public:
        explicit EchoCanceller(size_t filter_length = 512, float step_size = 0.1f,
                               size_t max_far_end_backlog = 24000);

        // Called from the output device thread.
        void on_playback(const int16_t* samples, size_t count);

        void process(std::vector<int16_t>& capture) override;
        void reset() override;

        size_t far_end_backlog() const;

    private:
        void take_reference(size_t count);
        void clear_filter();
        float filter_output() const;

        size_t filter_length_;
        float step_size_;
        size_t max_far_end_backlog_;

        // Capture worker only. Adaptive filter taps and the reference
        // history they run over.
        // history_ is mirrored (2 * filter_length_) so the newest
        // filter_length_ samples are always contiguous.
        std::vector<float> weights_;
        std::vector<float> history_;
        size_t history_pos_;
        float history_energy_;
        std::vector<int16_t> reference_;
        std::atomic<bool> reset_pending_;

        // Rendered speaker samples not yet paired with a capture sample.
        // Shared with the output device thread under mutex_.
        std::deque<int16_t> far_end_;

        mutable std::mutex mutex_;
    };
}

#endif
