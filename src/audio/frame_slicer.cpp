#include "audio/frame_slicer.hpp"
#include <stdexcept>

namespace audio {

FrameSlicer::FrameSlicer(size_t frame_size) : frame_size_(frame_size) {
    if (frame_size_ == 0) {
        throw std::invalid_argument("frame size must be positive");
    }
    staging_.reserve(frame_size_ * 2);
}

size_t FrameSlicer::push(const int16_t* samples, size_t count, const FrameCallback& on_frame) {
    staging_.insert(staging_.end(), samples, samples + count);

    size_t emitted = 0;
    size_t offset = 0;
    while (staging_.size() - offset >= frame_size_) {
        std::vector<int16_t> frame(staging_.begin() + offset,
                                   staging_.begin() + offset + frame_size_);
        offset += frame_size_;
        ++emitted;
        on_frame(std::move(frame));
    }

    // Partial frame stays at the front for the next cycle
    staging_.erase(staging_.begin(), staging_.begin() + offset);
    return emitted;
}

void FrameSlicer::clear() {
    staging_.clear();
}

}
