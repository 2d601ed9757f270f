#include "processing/echo_canceller.hpp"
#include "codec/pcm16_codec.hpp"
#include <algorithm>
#include <cmath>

namespace processing {

namespace {
constexpr float kRegularization = 1e-3f;
}

EchoCanceller::EchoCanceller(size_t filter_length, float step_size, size_t max_far_end_backlog)
    : filter_length_(std::max<size_t>(filter_length, 1)),
      step_size_(step_size),
      max_far_end_backlog_(max_far_end_backlog),
      weights_(filter_length_, 0.0f),
      history_(filter_length_ * 2, 0.0f),
      history_pos_(0),
      history_energy_(0.0f),
      reset_pending_(false) {}

void EchoCanceller::on_playback(const int16_t* samples, size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    far_end_.insert(far_end_.end(), samples, samples + count);

    // Capture stalled: keep only the most recent second of reference
    if (far_end_.size() > max_far_end_backlog_) {
        far_end_.erase(far_end_.begin(),
                       far_end_.begin() + static_cast<std::ptrdiff_t>(far_end_.size() - max_far_end_backlog_));
    }
}

void EchoCanceller::take_reference(size_t count) {
    reference_.assign(count, 0);

    std::lock_guard<std::mutex> lock(mutex_);
    const size_t available = std::min(count, far_end_.size());
    std::copy_n(far_end_.begin(), available, reference_.begin());
    far_end_.erase(far_end_.begin(), far_end_.begin() + static_cast<std::ptrdiff_t>(available));
}

void EchoCanceller::clear_filter() {
    std::fill(weights_.begin(), weights_.end(), 0.0f);
    std::fill(history_.begin(), history_.end(), 0.0f);
    history_pos_ = 0;
    history_energy_ = 0.0f;
}

float EchoCanceller::filter_output() const {
    // history_[history_pos_ .. history_pos_ + filter_length_) runs newest to oldest
    const float* x = &history_[history_pos_];
    float estimate = 0.0f;
    for (size_t i = 0; i < filter_length_; ++i) {
        estimate += weights_[i] * x[i];
    }
    return estimate;
}

void EchoCanceller::process(std::vector<int16_t>& capture) {
    if (reset_pending_.exchange(false)) {
        clear_filter();
    }
    // The playback callback only waits for this copy, never for the filter
    take_reference(capture.size());

    for (size_t n = 0; n < capture.size(); ++n) {
        const float reference = codec::pcm16_to_float(reference_[n]);

        // Slide the reference window by one: oldest leaves, newest enters
        history_pos_ = (history_pos_ == 0) ? filter_length_ - 1 : history_pos_ - 1;
        const float oldest = history_[history_pos_ + filter_length_];
        history_energy_ = std::max(0.0f, history_energy_ - oldest * oldest + reference * reference);
        history_[history_pos_] = reference;
        history_[history_pos_ + filter_length_] = reference;

        const float near_end = codec::pcm16_to_float(capture[n]);
        const float error = near_end - filter_output();

        if (history_energy_ > kRegularization) {
            const float mu = step_size_ * error / (kRegularization + history_energy_);
            const float* x = &history_[history_pos_];
            for (size_t i = 0; i < filter_length_; ++i) {
                weights_[i] += mu * x[i];
            }
        }

        capture[n] = codec::float_to_pcm16(error);
    }
}

void EchoCanceller::reset() {
    // Filter state belongs to the capture worker; it clears it on its next frame
    reset_pending_ = true;
    std::lock_guard<std::mutex> lock(mutex_);
    far_end_.clear();
}

size_t EchoCanceller::far_end_backlog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return far_end_.size();
}

}
