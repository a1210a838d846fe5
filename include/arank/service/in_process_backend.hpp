#pragma once

/// @file in_process_backend.hpp
/// @brief Backend that answers every request on the calling thread.

#include <atomic>
#include <memory>

#include "arank/service/backend_engine.hpp"
#include "arank/service/compute_backend.hpp"

namespace arank::service {

/// Synchronous backend: post() runs the request and invokes the handler
/// before returning. Sessions skip speculation on it.
class InProcessBackend final : public ComputeBackend {
public:
    explicit InProcessBackend(std::shared_ptr<BackendEngine> engine =
                                  std::make_shared<BackendEngine>());

    foundation::RankResult<void> start() override;
    void shutdown() override;
    [[nodiscard]] bool running() const override;
    [[nodiscard]] bool asynchronous() const override { return false; }

    foundation::RankResult<RequestId> post(BackendRequest request,
                                           ResponseHandler handler,
                                           RequestPriority priority) override;

    [[nodiscard]] BackendEngine& engine() noexcept { return *engine_; }

private:
    std::shared_ptr<BackendEngine> engine_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> nextId_{1};
};

} // namespace arank::service
