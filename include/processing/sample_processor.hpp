#ifndef SLIDE_VOICE_SAMPLE_PROCESSOR_HPP
#define SLIDE_VOICE_SAMPLE_PROCESSOR_HPP

#include <vector>
#include <cstdint>

namespace processing {
    // In-place capture stage. Output length always equals input length.
    class SampleProcessor {
    public:
        virtual ~SampleProcessor() = default;
        virtual void process(std::vector<int16_t>& samples) = 0;
        virtual void reset() = 0;
    };
}

#endif
