#include "audio/capture_pipeline.hpp"
#include "codec/pcm16_codec.hpp"
#include "core/errors.hpp"
#include <iostream>

namespace audio {

CapturePipeline::CapturePipeline(std::unique_ptr<InputDevice> device, size_t frame_size,
                                 Processors processors, FrameSink sink)
    : device_(std::move(device)),
      slicer_(frame_size),
      processors_(std::move(processors)),
      sink_(std::move(sink)) {
    if (!device_) {
        throw core::VoiceError(core::ErrorKind::CaptureUnavailable, "no input device");
    }
}

CapturePipeline::~CapturePipeline() {
    stop();
}

void CapturePipeline::start() {
    if (running_) {
        return;
    }

    slicer_.clear();
    for (auto& processor : processors_) {
        processor->reset();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.clear();
        stopping_ = false;
    }

    worker_ = std::thread(&CapturePipeline::worker_loop, this);

    try {
        device_->open([this](const float* samples, size_t count) {
            on_device_samples(samples, count);
        });
    } catch (...) {
        // Tear the worker down before the failure leaves start()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_one();
        worker_.join();
        throw;
    }

    running_ = true;
    std::cout << "🎤 Capture started (" << slicer_.frame_size() << " samples/frame)" << std::endl;
}

void CapturePipeline::stop() {
    if (device_ && device_->is_open()) {
        device_->close();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }

    if (running_.exchange(false)) {
        std::cout << "🎤 Capture stopped (" << frames_emitted_ << " frames, "
                  << chunks_dropped_ << " chunks dropped)" << std::endl;
    }
}

void CapturePipeline::on_device_samples(const float* samples, size_t count) {
    if (count == 0) {
        return;
    }

    std::vector<int16_t> chunk(count);
    for (size_t i = 0; i < count; ++i) {
        chunk[i] = codec::float_to_pcm16(samples[i]);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        // Worker stalled: shed the oldest audio instead of growing without bound
        if (pending_.size() >= MAX_PENDING_CHUNKS) {
            pending_.pop_front();
            ++chunks_dropped_;
        }
        pending_.push_back(std::move(chunk));
    }
    cv_.notify_one();
}

void CapturePipeline::worker_loop() {
    for (;;) {
        std::deque<std::vector<int16_t>> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            if (stopping_) {
                return;
            }
            batch.swap(pending_);
        }

        for (const auto& chunk : batch) {
            slicer_.push(chunk.data(), chunk.size(), [this](std::vector<int16_t>&& frame) {
                for (auto& processor : processors_) {
                    processor->process(frame);
                }
                ++frames_emitted_;
                sink_(std::move(frame));
            });
        }
    }
}

}
