/// @file in_process_backend.cpp
/// @brief InProcessBackend implementation.

#include "arank/service/in_process_backend.hpp"

#include "arank/foundation/rank_logger.hpp"

namespace arank::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RankError;
using foundation::RankResult;

InProcessBackend::InProcessBackend(std::shared_ptr<BackendEngine> engine)
    : engine_(std::move(engine)) {}

RankResult<void> InProcessBackend::start() {
    if (!engine_) {
        return RankResult<void>::err(
            RankError(ErrorCode::BackendUnavailable, "in-process backend has no engine"));
    }
    running_.store(true, std::memory_order_release);
    ARANK_LOG_INFO(LogCategory::Backend, "in-process backend started");
    return RankResult<void>::ok();
}

void InProcessBackend::shutdown() {
    if (running_.exchange(false, std::memory_order_acq_rel)) {
        ARANK_LOG_INFO(LogCategory::Backend, "in-process backend stopped");
    }
}

bool InProcessBackend::running() const {
    return running_.load(std::memory_order_acquire);
}

RankResult<RequestId> InProcessBackend::post(BackendRequest request,
                                             ResponseHandler handler,
                                             RequestPriority /*priority*/) {
    if (!running()) {
        return RankResult<RequestId>::err(
            RankError(ErrorCode::BackendUnavailable, "backend is not running"));
    }

    RequestId id(nextId_.fetch_add(1, std::memory_order_relaxed));
    assignRequestId(request, id);

    auto response = engine_->handle(request);
    if (!response) {
        foundation::LogContext ctx;
        ctx.requestId = id;
        foundation::RankLogger::instance().logWithContext(
            foundation::LogLevel::Debug, LogCategory::Backend,
            "request failed: " + std::string(response.error().message()), ctx);
    }
    handler(std::move(response));
    return RankResult<RequestId>::ok(id);
}

} // namespace arank::service
