/// @file worker_backend.cpp
/// @brief WorkerBackend implementation.

#include "arank/service/worker_backend.hpp"

#include <vector>

#include "arank/foundation/rank_logger.hpp"

namespace arank::service {

using foundation::ErrorCode;
using foundation::JobPriority;
using foundation::JobScheduler;
using foundation::LogCategory;
using foundation::RankError;
using foundation::RankResult;

WorkerBackend::WorkerBackend(std::size_t workerThreads,
                             std::shared_ptr<BackendEngine> engine)
    : workerThreads_(workerThreads), engine_(std::move(engine)) {}

WorkerBackend::~WorkerBackend() {
    shutdown();
}

// ── Lifecycle ───────────────────────────────────────────────────────────────

RankResult<void> WorkerBackend::start() {
    if (!engine_) {
        return RankResult<void>::err(
            RankError(ErrorCode::BackendUnavailable, "worker backend has no engine"));
    }
    if (running()) {
        return RankResult<void>::ok();
    }
    scheduler_ = std::make_unique<JobScheduler>(workerThreads_);
    running_.store(true, std::memory_order_release);
    ARANK_LOG_INFO(LogCategory::Backend,
        "worker backend started with " + std::to_string(workerThreads_) + " threads");
    return RankResult<void>::ok();
}

void WorkerBackend::shutdown() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    scheduler_->shutdown();

    // Jobs still queued when the pool stopped will never answer.
    std::unordered_map<RequestId, ResponseHandler> orphaned;
    {
        std::lock_guard lock(pendingMutex_);
        orphaned.swap(pending_);
    }
    for (auto& [id, handler] : orphaned) {
        handler(RankResult<BackendResponse>::err(
            RankError(ErrorCode::BackendUnavailable,
                      "backend shut down before request " +
                          std::to_string(id.value()) + " ran")));
    }
    ARANK_LOG_INFO(LogCategory::Backend,
        "worker backend stopped, " + std::to_string(orphaned.size()) + " requests abandoned");
}

bool WorkerBackend::running() const {
    return running_.load(std::memory_order_acquire);
}

// ── Requests ────────────────────────────────────────────────────────────────

RankResult<RequestId> WorkerBackend::post(BackendRequest request,
                                          ResponseHandler handler,
                                          RequestPriority priority) {
    if (!running()) {
        return RankResult<RequestId>::err(
            RankError(ErrorCode::BackendUnavailable, "backend is not running"));
    }

    RequestId id(nextId_.fetch_add(1, std::memory_order_relaxed));
    assignRequestId(request, id);

    {
        std::lock_guard lock(pendingMutex_);
        pending_.emplace(id, std::move(handler));
    }

    auto jobPriority = priority == RequestPriority::Authoritative ? JobPriority::High
                                                                  : JobPriority::Low;
    auto queued = scheduler_->post(
        [this, id, req = std::move(request)]() {
            complete(id, engine_->handle(req));
        },
        jobPriority);

    if (!queued) {
        std::lock_guard lock(pendingMutex_);
        pending_.erase(id);
        return RankResult<RequestId>::err(
            RankError(ErrorCode::BackendUnavailable,
                      "failed to queue request: " + std::string(queued.error().message())));
    }
    return RankResult<RequestId>::ok(id);
}

void WorkerBackend::complete(RequestId id, RankResult<BackendResponse> response) {
    ResponseHandler handler;
    {
        std::lock_guard lock(pendingMutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return;
        }
        handler = std::move(it->second);
        pending_.erase(it);
    }

    if (!response) {
        foundation::LogContext ctx;
        ctx.requestId = id;
        foundation::RankLogger::instance().logWithContext(
            foundation::LogLevel::Debug, LogCategory::Backend,
            "request failed: " + std::string(response.error().message()), ctx);
    }
    handler(std::move(response));
}

std::size_t WorkerBackend::pendingCount() const {
    std::lock_guard lock(pendingMutex_);
    return pending_.size();
}

} // namespace arank::service
