#ifndef SLIDE_VOICE_CAPTURE_PIPELINE_HPP
#define SLIDE_VOICE_CAPTURE_PIPELINE_HPP

#include "core/non_copyable.hpp"
#include "audio/audio_device.hpp"
#include "audio/frame_slicer.hpp"
#include "processing/sample_processor.hpp"
#include <memory>
#include <vector>
#include <deque>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <cstdint>

namespace audio {
    // Microphone -> fixed-size PCM16 frames. The device callback only queues
    // raw chunks; conversion, processing and slicing run on a dedicated worker
    // thread so the device thread never blocks on downstream work.
    class CapturePipeline : private core::NonCopyable {
    public:
        using FrameSink = std::function<void(std::vector<int16_t>&&)>;
        using Processors = std::vector<std::shared_ptr<processing::SampleProcessor>>;

        static constexpr size_t MAX_PENDING_CHUNKS = 256;

        CapturePipeline(std::unique_ptr<InputDevice> device, size_t frame_size,
                        Processors processors, FrameSink sink);
        ~CapturePipeline();

        // Throws core::VoiceError(CaptureUnavailable); nothing stays acquired on failure.
        void start();

        // Releases the device and joins the worker. Safe to call repeatedly.
        void stop();

        bool is_running() const { return running_; }
        size_t frames_emitted() const { return frames_emitted_; }
        size_t chunks_dropped() const { return chunks_dropped_; }

    private:
        void on_device_samples(const float* samples, size_t count);
        void worker_loop();

        std::unique_ptr<InputDevice> device_;
        FrameSlicer slicer_;
        Processors processors_;
        FrameSink sink_;

        std::thread worker_;
        std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<std::vector<int16_t>> pending_;
        bool stopping_ = false;

        std::atomic<bool> running_{false};
        std::atomic<size_t> frames_emitted_{0};
        std::atomic<size_t> chunks_dropped_{0};
    };
}

#endif
