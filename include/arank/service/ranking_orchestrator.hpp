#pragma once

/// @file ranking_orchestrator.hpp
/// @brief Stateful active-ranking session over item indices.
///
/// The orchestrator owns the committed session state (history, posterior,
/// stability tracking, stop state) and delegates every heavy computation
/// to a ComputeBackend. Mutating calls block until the backend's
/// authoritative response arrives and commit only on success, so a failed
/// call leaves the session exactly as it was.
///
/// After each pair selection on an asynchronous backend, both possible
/// outcomes are precomputed at low priority to warm the backend caches. Those speculative results are
/// tagged with the generation they were issued under; any commit bumps
/// the generation and later arrivals are dropped.

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "arank/foundation/rank_result.hpp"
#include "arank/foundation/types.hpp"
#include "arank/math/stopping_policy.hpp"
#include "arank/math/types.hpp"
#include "arank/service/compute_backend.hpp"
#include "arank/service/ranking_types.hpp"

namespace arank::service {

/// Precomputed consequence of one hypothetical outcome.
struct SpeculativeResult {
    math::StrengthEstimate belief;
    std::optional<math::IndexPair> nextPair;
};

/// Side table of speculative results shared with in-flight callbacks.
///
/// Callbacks hold it through a weak_ptr, so they become no-ops once the
/// owning orchestrator is gone. Callbacks never own the backend: they
/// borrow it through acquireBackend(), and detach() waits until every
/// borrow has been returned.
class SpeculationLedger {
public:
    [[nodiscard]] uint64_t generation() const noexcept {
        return generation_.load(std::memory_order_acquire);
    }

    /// Invalidate everything issued so far.
    void advance();

    void noteIssued();

    /// Store a refit for @p outcome. False (and counted as discarded) when
    /// @p generation is stale.
    bool storeBelief(uint64_t generation, math::WinLoss outcome, math::StrengthEstimate belief);

    /// Store the follow-up pair for @p outcome.
    bool storeNextPair(uint64_t generation, math::WinLoss outcome, math::IndexPair pair);

    /// Record a failed or stale speculative request.
    void discard();

    /// Bind the backend that follow-up requests are posted to.
    void attach(ComputeBackend* backend);

    /// Invalidate everything, unbind the backend and block until no
    /// callback is still using it.
    void detach();

    /// Backend for a follow-up issued under @p generation, or nullptr when
    /// the generation is stale or the ledger is detached. A non-null
    /// result must be returned with releaseBackend().
    [[nodiscard]] ComputeBackend* acquireBackend(uint64_t generation);

    void releaseBackend();

    [[nodiscard]] std::optional<SpeculativeResult> lookup(math::WinLoss outcome) const;

    [[nodiscard]] SpeculationStats stats() const;

private:
    using Key = std::pair<std::size_t, std::size_t>;

    std::atomic<uint64_t> generation_{0};
    mutable std::mutex mutex_;
    std::map<Key, SpeculativeResult> results_;
    SpeculationStats stats_;

    ComputeBackend* backend_ = nullptr;
    std::size_t backendUsers_ = 0;
    std::condition_variable idle_;
};

/// Active top-K ranking session over items 0..n-1.
///
/// Mutating calls must be serialized by the caller. Observers are cheap
/// and synchronous.
class RankingOrchestrator {
public:
    /// @return InvalidArgument for n == 0 or an invalid config,
    ///         BackendUnavailable for a missing backend.
    static foundation::RankResult<RankingOrchestrator> create(
        std::size_t n, RankingConfig config, std::shared_ptr<ComputeBackend> backend);

    /// Drops pending speculation and waits for callbacks that are
    /// currently posting to the backend.
    ~RankingOrchestrator();

    RankingOrchestrator(RankingOrchestrator&& other) noexcept = default;
    RankingOrchestrator& operator=(RankingOrchestrator&& other) noexcept;

    RankingOrchestrator(const RankingOrchestrator&) = delete;
    RankingOrchestrator& operator=(const RankingOrchestrator&) = delete;

    /// Most informative next comparison, first < second.
    /// @return IllegalState once stopped; backend errors are forwarded.
    foundation::RankResult<math::IndexPair> selectPair();

    /// Commit "winner beat loser", refit and evaluate the stopping rules.
    /// @return IllegalState once stopped, InvalidItem for an unknown or
    ///         repeated index; any refit failure leaves the session intact.
    foundation::RankResult<RecordOutcome> recordComparison(std::size_t winner,
                                                           std::size_t loser);

    /// Revert the last comparison and re-enter the active state.
    /// @return The removed comparison, or IllegalState with empty history.
    foundation::RankResult<math::WinLoss> undoLastComparison();

    [[nodiscard]] std::size_t itemCount() const noexcept { return n_; }
    [[nodiscard]] std::size_t round() const noexcept { return history_.size(); }
    [[nodiscard]] bool stopped() const noexcept { return stopReason_.has_value(); }
    [[nodiscard]] std::optional<StopReason> stopReason() const noexcept { return stopReason_; }

    [[nodiscard]] const std::vector<double>& mu() const noexcept { return belief_.mu; }
    [[nodiscard]] const std::vector<double>& sigma() const noexcept { return belief_.sigma; }
    [[nodiscard]] const math::StrengthEstimate& belief() const noexcept { return belief_; }

    /// Current top-K indices, strongest first.
    [[nodiscard]] std::vector<std::size_t> topKIndices() const;

    [[nodiscard]] const math::ComparisonHistory& history() const noexcept { return history_; }
    [[nodiscard]] const std::vector<bool>& flipHistory() const noexcept { return flipHistory_; }
    [[nodiscard]] std::size_t stableCount() const noexcept { return stableCount_; }
    [[nodiscard]] const std::optional<std::vector<std::size_t>>& previousTopK() const noexcept {
        return previousTopK_;
    }

    /// Forecast of rounds until the stability stop, capped by the budget
    /// left under maxComparisons.
    [[nodiscard]] std::optional<math::RemainingEstimate> estimateRemaining() const;

    [[nodiscard]] SpeculationStats speculationStats() const;

    /// Speculative result for @p outcome under the current generation.
    [[nodiscard]] std::optional<SpeculativeResult> speculativeResult(math::WinLoss outcome) const;

    [[nodiscard]] const RankingConfig& config() const noexcept { return config_; }
    [[nodiscard]] foundation::SessionId sessionId() const noexcept { return sessionId_; }

    /// Independent session with identical committed state and the same
    /// backend. Speculation state is not copied.
    [[nodiscard]] RankingOrchestrator clone() const;

private:
    RankingOrchestrator(std::size_t n, RankingConfig config,
                        std::shared_ptr<ComputeBackend> backend);

    foundation::RankResult<math::StrengthEstimate> refit(const math::ComparisonHistory& history);

    SelectPairRequest makeSelectRequest(const math::StrengthEstimate& belief,
                                        const math::ComparisonHistory& history) const;

    void speculate(math::IndexPair pair);

    void releaseSpeculation() noexcept;

    void logStop(StopReason reason) const;

    std::size_t n_;
    RankingConfig config_;
    std::shared_ptr<ComputeBackend> backend_;
    foundation::SessionId sessionId_;

    math::ComparisonHistory history_;
    math::StrengthEstimate belief_;
    std::optional<std::vector<std::size_t>> previousTopK_;
    std::size_t stableCount_ = 0;
    std::vector<bool> flipHistory_;
    std::optional<StopReason> stopReason_;

    std::shared_ptr<SpeculationLedger> ledger_;
};

} // namespace arank::service
