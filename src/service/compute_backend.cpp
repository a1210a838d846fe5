/// @file compute_backend.cpp
/// @brief Protocol helpers and the blocking request adapter.

#include "arank/service/compute_backend.hpp"

namespace arank::service {

using foundation::ErrorCode;
using foundation::RankError;
using foundation::RankResult;

RequestId requestIdOf(const BackendRequest& request) noexcept {
    return std::visit([](const auto& r) { return r.id; }, request);
}

RequestId requestIdOf(const BackendResponse& response) noexcept {
    return std::visit([](const auto& r) { return r.id; }, response);
}

void assignRequestId(BackendRequest& request, RequestId id) noexcept {
    std::visit([id](auto& r) { r.id = id; }, request);
}

RankResult<BackendResponse> awaitResponse(ComputeBackend& backend,
                                          BackendRequest request,
                                          RequestPriority priority) {
    const std::size_t expectedKind = request.index();

    auto promise = std::make_shared<std::promise<RankResult<BackendResponse>>>();
    auto future = promise->get_future();

    auto posted = backend.post(
        std::move(request),
        [promise](RankResult<BackendResponse> response) {
            promise->set_value(std::move(response));
        },
        priority);
    if (!posted) {
        return RankResult<BackendResponse>::err(posted.error());
    }

    auto response = future.get();
    if (!response) {
        return response;
    }
    if (response.value().index() != expectedKind ||
        requestIdOf(response.value()) != posted.value()) {
        return RankResult<BackendResponse>::err(
            RankError(ErrorCode::BackendResponseMismatch,
                      "response does not match request " +
                          std::to_string(posted.value().value())));
    }
    return response;
}

} // namespace arank::service
