#pragma once

/// @file job_scheduler.hpp
/// @brief JobScheduler wrapping kcenon thread_system for backend compute jobs.

#include "arank/foundation/rank_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace arank::foundation {

/// Priority levels for scheduled jobs.
///
/// Maps to kcenon::thread::job_priority internally:
///   Critical -> highest, High -> high, Normal -> normal, Low -> low
enum class JobPriority { Critical, High, Normal, Low };

/// Priority job scheduler over a kcenon thread pool.
///
/// Authoritative backend requests run at High priority and speculative
/// precomputation at Low, so speculation never delays a committed call
/// once the pool is saturated. PIMPL keeps thread_system headers out of the
/// public API.
///
/// Example:
/// @code
///   JobScheduler scheduler(2);
///   auto id = scheduler.schedule([] { refit(); }, JobPriority::High);
///   scheduler.wait(id.value());
/// @endcode
class JobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    /// Construct a scheduler backed by @p numThreads workers (at least one).
    explicit JobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;
    JobScheduler(JobScheduler&&) noexcept;
    JobScheduler& operator=(JobScheduler&&) noexcept;

    /// Schedule a tracked job that can be awaited with wait().
    /// @return The assigned JobId, or JobScheduleFailed.
    RankResult<JobId> schedule(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Enqueue a fire-and-forget job. Nothing is retained after it runs.
    RankResult<void> post(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Block until the tracked job @p id completes, then forget it.
    /// @return Success, JobNotFound, or ThreadError if the job threw.
    RankResult<void> wait(JobId id);

    /// Stop accepting jobs and join the workers after running jobs finish.
    void shutdown();

    [[nodiscard]] bool running() const noexcept;

    /// Number of tracked jobs not yet awaited.
    [[nodiscard]] std::size_t trackedCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace arank::foundation
