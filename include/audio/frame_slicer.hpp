#ifndef SLIDE_VOICE_FRAME_SLICER_HPP
#define SLIDE_VOICE_FRAME_SLICER_HPP

#include <vector>
#include <functional>
#include <cstdint>
#include <cstddef>

namespace audio {
    // Staging buffer that turns arbitrarily sized sample chunks into fixed-size
    // frames. Leftover samples stay staged until the next push.
    class FrameSlicer {
    public:
        using FrameCallback = std::function<void(std::vector<int16_t>&&)>;

        explicit FrameSlicer(size_t frame_size);

        // Returns the number of frames emitted by this push.
        size_t push(const int16_t* samples, size_t count, const FrameCallback& on_frame);
        void clear();

        size_t frame_size() const { return frame_size_; }
        size_t staged() const { return staging_.size(); }

    private:
        size_t frame_size_;
        std::vector<int16_t> staging_;
    };
}

#endif
