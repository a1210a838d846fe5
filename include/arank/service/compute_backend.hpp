#pragma once

/// @file compute_backend.hpp
/// @brief Request/response protocol between a ranking session and the
///        engine that performs pair selection and refits.
///
/// Every request carries a correlator that its response echoes. A backend
/// may answer on any thread; the orchestrator blocks on authoritative
/// requests and lets speculative ones run free.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <variant>
#include <vector>

#include "arank/foundation/rank_result.hpp"
#include "arank/foundation/types.hpp"
#include "arank/math/types.hpp"
#include "arank/math/uncertainty_estimator.hpp"

namespace arank::service {

using foundation::RequestId;

// ── Requests ────────────────────────────────────────────────────────────────

struct SelectPairRequest {
    RequestId id;
    std::vector<double> mu;
    std::vector<double> sigma;
    math::ComparisonHistory history;
    std::size_t k = 1;
    std::size_t n = 0;
    double priorVariance = 1.0;
    double recencyDiscount = 1.0;
    math::EstimatorKind estimator = math::EstimatorKind::Quadrature;
    std::size_t precision = 7;
    uint32_t seed = 0;
    bool noCache = false;
};

struct RefitRequest {
    RequestId id;
    math::ComparisonHistory history;
    std::size_t n = 0;
    double priorVariance = 1.0;
    bool noCache = false;
};

using BackendRequest = std::variant<SelectPairRequest, RefitRequest>;

// ── Responses ───────────────────────────────────────────────────────────────

struct SelectPairResponse {
    RequestId id;
    math::IndexPair pair;
};

struct RefitResponse {
    RequestId id;
    std::vector<double> mu;
    std::vector<double> sigma;
};

using BackendResponse = std::variant<SelectPairResponse, RefitResponse>;

/// Correlator of a request or response.
[[nodiscard]] RequestId requestIdOf(const BackendRequest& request) noexcept;
[[nodiscard]] RequestId requestIdOf(const BackendResponse& response) noexcept;

/// Stamp @p id onto @p request.
void assignRequestId(BackendRequest& request, RequestId id) noexcept;

/// Scheduling hint; speculative work must never delay committed calls.
enum class RequestPriority : uint8_t {
    Authoritative,
    Speculative
};

/// Invoked exactly once per accepted request, possibly on another thread.
using ResponseHandler = std::function<void(foundation::RankResult<BackendResponse>)>;

// ── Backend interface ───────────────────────────────────────────────────────

/// Executes ranking computations for one or more sessions.
///
/// Implementations assign the correlator; any id set by the caller is
/// overwritten.
class ComputeBackend {
public:
    virtual ~ComputeBackend() = default;

    virtual foundation::RankResult<void> start() = 0;

    /// Stop accepting requests. Requests already accepted still complete.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool running() const = 0;

    /// True when post() returns before the request runs. Speculation is
    /// only worthwhile on such backends; on a synchronous one it would
    /// run on the caller's thread ahead of the committed path.
    [[nodiscard]] virtual bool asynchronous() const = 0;

    /// Submit @p request; @p handler receives the response or the error.
    /// @return The assigned correlator, or BackendUnavailable.
    virtual foundation::RankResult<RequestId> post(BackendRequest request,
                                                   ResponseHandler handler,
                                                   RequestPriority priority) = 0;
};

/// Post @p request and block until its response arrives.
///
/// Checks that the response kind matches the request and that the
/// correlator is echoed; otherwise BackendResponseMismatch.
foundation::RankResult<BackendResponse> awaitResponse(
    ComputeBackend& backend, BackendRequest request,
    RequestPriority priority = RequestPriority::Authoritative);

} // namespace arank::service
