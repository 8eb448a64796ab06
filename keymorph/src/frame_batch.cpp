// frame_batch.cpp - Parallel frame evaluation

#include "keymorph/frame_batch.hpp"
#include "keymorph/debug_log.hpp"

#include <stdexcept>

namespace keymorph {

FrameBatch::FrameBatch(std::size_t num_threads)
    : jobs_(num_threads) {
    jobs_.start();
}

FrameBatch::~FrameBatch() {
    jobs_.shutdown();
}

std::vector<double> FrameBatch::frame_times(std::size_t frame_count) {
    if (frame_count == 0) {
        throw std::invalid_argument("frame count must be at least 1");
    }

    std::vector<double> times(frame_count, 0.0);
    if (frame_count == 1) return times;

    for (std::size_t i = 0; i < frame_count; ++i) {
        times[i] = static_cast<double>(i) / static_cast<double>(frame_count - 1);
    }
    return times;
}

std::vector<Snapshot> FrameBatch::render(const Animation& animation, std::size_t frame_count) {
    return render_times(animation, frame_times(frame_count));
}

std::vector<Snapshot> FrameBatch::render_times(const Animation& animation, const std::vector<double>& times) {
    std::lock_guard<std::mutex> lock(render_mutex_);
    std::vector<Snapshot> frames(times.size());

    for (std::size_t i = 0; i < times.size(); ++i) {
        jobs_.submit_function([&animation, &frames, &times, i]() {
            frames[i] = animation.state_at(times[i]);
        }, FrameJobType::EVALUATE_FRAME, ScheduleMode::FIFO);
    }
    jobs_.wait_for_completion();

    KEYMORPH_DEBUG_LOG("Rendered %zu frames on %zu workers", times.size(), jobs_.get_num_workers());

    if (jobs_.has_error()) {
        KEYMORPH_DEBUG_LOG("Frame batch failed: %s", jobs_.get_error_description());
        try {
            jobs_.rethrow_if_error();
        } catch (...) {
            jobs_.clear_error();
            throw;
        }
    }
    return frames;
}

} // namespace keymorph
