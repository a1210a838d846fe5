/// @file job_scheduler.cpp
/// @brief JobScheduler implementation wrapping kcenon thread_system.

#include "arank/foundation/job_scheduler.hpp"
#include "arank/foundation/rank_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace arank::foundation {

// ---------------------------------------------------------------------------
// Priority mapping: arank -> kcenon
// ---------------------------------------------------------------------------
static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::Critical: return kcenon::thread::job_priority::highest;
        case JobPriority::High:     return kcenon::thread::job_priority::high;
        case JobPriority::Normal:   return kcenon::thread::job_priority::normal;
        case JobPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct JobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJobId{1};
    std::atomic<bool> running{false};

    // JobId -> shared_future for wait() support (tracked jobs only)
    std::unordered_map<JobId, std::shared_future<void>> futures;

    mutable std::mutex mutex;

    bool enqueue(std::string name, JobPriority priority,
                 std::function<void()> body) {
        if (!running.load(std::memory_order_acquire)) {
            return false;
        }
        auto threadJob = kcenon::thread::job_builder()
            .name(std::move(name))
            .priority(mapPriority(priority))
            .work([fn = std::move(body)]() -> kcenon::common::VoidResult {
                fn();
                return kcenon::common::VoidResult::ok(std::monostate{});
            })
            .build();
        return !pool->enqueue(std::move(threadJob)).is_err();
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
JobScheduler::JobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("arank_backend");

    numThreads = std::max<std::size_t>(numThreads, 1);
    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
    impl_->running.store(true, std::memory_order_release);
}

JobScheduler::~JobScheduler() {
    if (impl_) {
        shutdown();
    }
}

JobScheduler::JobScheduler(JobScheduler&&) noexcept = default;
JobScheduler& JobScheduler::operator=(JobScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
RankResult<JobScheduler::JobId> JobScheduler::schedule(
    JobFunc job, JobPriority priority)
{
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    // Register before enqueueing so a fast job cannot finish untracked.
    {
        std::lock_guard lock(impl_->mutex);
        impl_->futures[id] = future;
    }

    bool queued = impl_->enqueue(
        "arank_job_" + std::to_string(id), priority,
        [fn = std::move(job), promise]() {
            try {
                fn();
                promise->set_value();
            } catch (...) {
                // Handed to wait(), which reports it as ThreadError.
                promise->set_exception(std::current_exception());
            }
        });

    if (!queued) {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.erase(id);
        return RankResult<JobId>::err(
            RankError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return RankResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// post()
// ---------------------------------------------------------------------------
RankResult<void> JobScheduler::post(JobFunc job, JobPriority priority) {
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    bool queued = impl_->enqueue(
        "arank_post_" + std::to_string(id), priority,
        [fn = std::move(job), id]() {
            try {
                fn();
            } catch (const std::exception& e) {
                ARANK_LOG_ERROR(LogCategory::Core,
                    "detached job " + std::to_string(id) + " threw: " + e.what());
            }
        });
    if (!queued) {
        return RankResult<void>::err(
            RankError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return RankResult<void>::ok();
}

// ---------------------------------------------------------------------------
// wait()
// ---------------------------------------------------------------------------
RankResult<void> JobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return RankResult<void>::err(
                RankError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second;
    }

    RankResult<void> outcome = RankResult<void>::ok();
    try {
        future.get();
    } catch (const std::exception& e) {
        outcome = RankResult<void>::err(
            RankError(ErrorCode::ThreadError, std::string("job execution failed: ") + e.what()));
    } catch (...) {
        outcome = RankResult<void>::err(
            RankError(ErrorCode::ThreadError, "job execution failed"));
    }

    std::lock_guard lock(impl_->mutex);
    impl_->futures.erase(id);
    return outcome;
}

// ---------------------------------------------------------------------------
// shutdown() / observers
// ---------------------------------------------------------------------------
void JobScheduler::shutdown() {
    if (impl_->running.exchange(false, std::memory_order_acq_rel)) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

bool JobScheduler::running() const noexcept {
    return impl_->running.load(std::memory_order_acquire);
}

std::size_t JobScheduler::trackedCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->futures.size();
}

} // namespace arank::foundation
