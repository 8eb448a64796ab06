#ifndef KEYMORPH_FRAME_BATCH_HPP
#define KEYMORPH_FRAME_BATCH_HPP

#include <keymorph/animation.hpp>
#include <keymorph/job_system.hpp>
#include <cstddef>
#include <mutex>
#include <vector>

namespace keymorph {

enum class FrameJobType {
    EVALUATE_FRAME
};

/**
 * Renders many frames of one animation on a worker pool. Frames are
 * independent and share the animation read-only. The first exception thrown
 * while evaluating a frame is rethrown on the calling thread.
 */
class FrameBatch {
private:
    JobSystem<FrameJobType> jobs_;
    std::mutex render_mutex_;

public:
    // 0 threads: one per hardware thread
    explicit FrameBatch(std::size_t num_threads = 0);
    ~FrameBatch();

    FrameBatch(const FrameBatch&) = delete;
    FrameBatch& operator=(const FrameBatch&) = delete;

    /**
     * `frame_count` frames at t = i / (frame_count - 1); a single frame is
     * taken at t = 0. Throws std::invalid_argument for zero frames.
     */
    std::vector<Snapshot> render(const Animation& animation, std::size_t frame_count);

    // One frame per entry of `times`, in the same order
    std::vector<Snapshot> render_times(const Animation& animation, const std::vector<double>& times);

    std::size_t num_workers() const { return jobs_.get_num_workers(); }

    static std::vector<double> frame_times(std::size_t frame_count);
};

} // namespace keymorph

#endif // KEYMORPH_FRAME_BATCH_HPP
