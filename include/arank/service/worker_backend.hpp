#pragma once

/// @file worker_backend.hpp
/// @brief Backend that runs requests on a kcenon thread pool.

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "arank/foundation/job_scheduler.hpp"
#include "arank/service/backend_engine.hpp"
#include "arank/service/compute_backend.hpp"

namespace arank::service {

/// Asynchronous backend over a JobScheduler.
///
/// Authoritative requests are queued at High priority, speculative ones at
/// Low. Each response is routed back to its handler through the pending
/// table keyed by correlator. On shutdown, handlers of requests that never
/// ran receive BackendUnavailable.
class WorkerBackend final : public ComputeBackend {
public:
    explicit WorkerBackend(std::size_t workerThreads = 2,
                           std::shared_ptr<BackendEngine> engine =
                               std::make_shared<BackendEngine>());
    ~WorkerBackend() override;

    WorkerBackend(const WorkerBackend&) = delete;
    WorkerBackend& operator=(const WorkerBackend&) = delete;

    foundation::RankResult<void> start() override;
    void shutdown() override;
    [[nodiscard]] bool running() const override;
    [[nodiscard]] bool asynchronous() const override { return true; }

    foundation::RankResult<RequestId> post(BackendRequest request,
                                           ResponseHandler handler,
                                           RequestPriority priority) override;

    /// Requests accepted but not yet answered.
    [[nodiscard]] std::size_t pendingCount() const;

    [[nodiscard]] BackendEngine& engine() noexcept { return *engine_; }

private:
    void complete(RequestId id, foundation::RankResult<BackendResponse> response);

    std::size_t workerThreads_;
    std::shared_ptr<BackendEngine> engine_;
    std::unique_ptr<foundation::JobScheduler> scheduler_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> nextId_{1};

    mutable std::mutex pendingMutex_;
    std::unordered_map<RequestId, ResponseHandler> pending_;
};

} // namespace arank::service
