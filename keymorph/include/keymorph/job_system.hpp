#ifndef KEYMORPH_JOB_SYSTEM_HPP
#define KEYMORPH_JOB_SYSTEM_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <new>
#include <random>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace keymorph {

template<typename JobType>
class Job {
public:
    virtual ~Job() = default;

    virtual void execute() = 0;
    virtual JobType get_type() const = 0;
};

template<typename JobType, typename Func>
class FunctionJob : public Job<JobType> {
private:
    Func function_;
    JobType type_;

public:
    template<typename F>
    FunctionJob(F&& func, JobType type)
        : function_(std::forward<F>(func)), type_(type) {}

    void execute() override {
        static_assert(std::is_invocable_v<Func>, "Function must be callable");
        function_();
    }

    JobType get_type() const override {
        return type_;
    }
};

template<typename JobType, typename Func>
auto make_job(Func&& func, JobType type) {
    return std::make_unique<FunctionJob<JobType, std::decay_t<Func>>>(std::forward<Func>(func), type);
}

template<typename JobType>
using JobPtr = std::unique_ptr<Job<JobType>>;

enum class ScheduleMode {
    LIFO,  // Last In, First Out (cache-friendly for related tasks)
    FIFO   // First In, First Out (fair scheduling)
};

// Error types that can occur during job execution
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

/**
 * Work-stealing thread pool. Each worker owns a deque; idle workers steal
 * half of a random victim's queue.
 *
 * The first exception thrown by a job is captured and kept until
 * clear_error(); once an error is recorded the remaining queued jobs are
 * drained without running.
 */
template<typename JobType>
class JobSystem {
private:
    struct WorkerData {
        std::deque<JobPtr<JobType>> tasks;
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        std::atomic<size_t> jobs_executed{0};
        std::atomic<size_t> jobs_executing{0};
        std::atomic<size_t> jobs_stolen{0};
    };

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};

    // Global work tracking for completion detection
    std::atomic<size_t> total_submitted_{0};
    std::atomic<size_t> total_completed_{0};
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    std::atomic<ErrorType> error_type_{ErrorType::None};
    std::mutex error_mutex_;
    std::exception_ptr first_error_;

    std::vector<JobPtr<JobType>> try_steal_from(WorkerData* victim) {
        std::vector<JobPtr<JobType>> stolen;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);

        if (!lock.owns_lock() || victim->tasks.empty()) {
            return stolen;
        }

        // Take half from the front, the end the owner does not pop from
        size_t steal_count = std::max(size_t(1), victim->tasks.size() / 2);
        stolen.reserve(steal_count);
        for (size_t i = 0; i < steal_count && !victim->tasks.empty(); ++i) {
            stolen.push_back(std::move(victim->tasks.front()));
            victim->tasks.pop_front();
        }
        return stolen;
    }

    void record_error(ErrorType type, std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (!first_error_) {
            first_error_ = std::move(error);
            error_type_.store(type, std::memory_order_release);
        }
    }

    void worker_loop(WorkerData* data) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<size_t> dist(0, workers_.size() - 1);

        while (true) {
            JobPtr<JobType> job;

            {
                std::unique_lock<std::mutex> lock(data->mutex);

                if (data->tasks.empty() && !data->stop.load()) {
                    lock.unlock();

                    for (size_t attempt = 0; attempt < workers_.size(); ++attempt) {
                        auto* victim = workers_[dist(gen)].get();
                        if (victim == data) continue;

                        auto stolen = try_steal_from(victim);
                        if (!stolen.empty()) {
                            std::lock_guard<std::mutex> local_lock(data->mutex);
                            for (auto& stolen_job : stolen) {
                                data->tasks.push_back(std::move(stolen_job));
                            }
                            data->jobs_stolen.fetch_add(stolen.size());
                            break;
                        }
                    }

                    lock.lock();
                }

                data->cv.wait_for(lock, std::chrono::milliseconds(1), [data] {
                    return data->stop.load() || !data->tasks.empty();
                });

                if (data->stop.load() && data->tasks.empty()) {
                    break;
                }

                if (!data->tasks.empty()) {
                    job = std::move(data->tasks.back());
                    data->tasks.pop_back();
                }
            }

            if (job) {
                data->jobs_executing.fetch_add(1);

                if (!has_error()) {
                    try {
                        job->execute();
                    } catch (const std::bad_alloc&) {
                        record_error(ErrorType::OutOfMemory, std::current_exception());
                    } catch (const std::exception&) {
                        record_error(ErrorType::Exception, std::current_exception());
                    } catch (...) {
                        record_error(ErrorType::Unhandled, std::current_exception());
                    }
                }

                data->jobs_executing.fetch_sub(1);
                data->jobs_executed.fetch_add(1);

                total_completed_.fetch_add(1);
                completion_cv_.notify_all();
            }
        }
    }

    void enqueue(WorkerData* worker, JobPtr<JobType> job, ScheduleMode mode) {
        total_submitted_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            if (mode == ScheduleMode::LIFO) {
                worker->tasks.push_back(std::move(job));
            } else {
                // Oldest job sits at the back, where the owner pops
                worker->tasks.push_front(std::move(job));
            }
        }
        worker->cv.notify_one();
    }

public:
    explicit JobSystem(size_t num_threads = 0) {
        size_t count = num_threads == 0 ? std::thread::hardware_concurrency() : num_threads;
        if (count == 0) count = 1;

        workers_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    ~JobSystem() {
        shutdown();
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    void start() {
        if (is_running_.load()) return;

        total_submitted_.store(0);
        total_completed_.store(0);
        clear_error();

        for (auto& worker : workers_) {
            WorkerData* data = worker.get();
            data->stop.store(false);
            data->thread = std::thread([this, data] {
                worker_loop(data);
            });
        }

        is_running_.store(true);
    }

    void shutdown() {
        if (!is_running_.load()) return;

        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop.store(true);
            }
            worker->cv.notify_all();
        }

        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }

        is_running_.store(false);
    }

    void submit(JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        enqueue(workers_[worker_idx].get(), std::move(job), mode);
    }

    void submit_to_worker(size_t worker_id, JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }
        if (worker_id >= workers_.size()) {
            throw std::out_of_range("Invalid worker ID");
        }

        enqueue(workers_[worker_id].get(), std::move(job), mode);
    }

    template<typename F>
    void submit_function(F&& func, JobType job_type, ScheduleMode mode = ScheduleMode::LIFO) {
        submit(make_job(std::forward<F>(func), job_type), mode);
    }

    /**
     * Block until every submitted job has run (or been drained after an
     * error) and no worker is mid-job.
     */
    void wait_for_completion() {
        while (true) {
            std::unique_lock<std::mutex> lock(completion_mutex_);
            completion_cv_.wait_for(lock, std::chrono::milliseconds(10), [this] {
                return total_submitted_.load() == total_completed_.load();
            });

            if (total_submitted_.load() != total_completed_.load()) continue;

            bool truly_done = true;
            for (const auto& worker : workers_) {
                std::lock_guard<std::mutex> worker_lock(worker->mutex);
                if (!worker->tasks.empty() || worker->jobs_executing.load() > 0) {
                    truly_done = false;
                    break;
                }
            }

            if (truly_done) {
                std::atomic_thread_fence(std::memory_order_acquire);
                if (total_submitted_.load() == total_completed_.load()) break;
            }
        }
    }

    size_t get_num_workers() const {
        return workers_.size();
    }

    // Submitted but not yet completed
    size_t get_pending_count() const {
        size_t submitted = total_submitted_.load(std::memory_order_relaxed);
        size_t completed = total_completed_.load(std::memory_order_relaxed);
        return submitted > completed ? submitted - completed : 0;
    }

    bool is_running() const {
        return is_running_.load();
    }

    ErrorType get_error_type() const {
        return error_type_.load(std::memory_order_acquire);
    }

    bool has_error() const {
        return get_error_type() != ErrorType::None;
    }

    const char* get_error_description() const {
        switch (get_error_type()) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

    // Rethrows the first captured job exception, if any
    void rethrow_if_error() {
        std::exception_ptr error;
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            error = first_error_;
        }
        if (error) std::rethrow_exception(error);
    }

    void clear_error() {
        std::lock_guard<std::mutex> lock(error_mutex_);
        first_error_ = nullptr;
        error_type_.store(ErrorType::None, std::memory_order_release);
    }

    struct SystemStatistics {
        size_t total_jobs_executed;
        size_t total_jobs_stolen;
    };

    SystemStatistics get_statistics() const {
        size_t total_executed = 0;
        size_t total_stolen = 0;
        for (const auto& worker : workers_) {
            total_executed += worker->jobs_executed.load();
            total_stolen += worker->jobs_stolen.load();
        }
        return SystemStatistics{total_executed, total_stolen};
    }
};

} // namespace keymorph

#endif // KEYMORPH_JOB_SYSTEM_HPP
