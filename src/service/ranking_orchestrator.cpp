/// @file ranking_orchestrator.cpp
/// @brief RankingOrchestrator session state machine and speculation.

#include "arank/service/ranking_orchestrator.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "arank/foundation/rank_logger.hpp"
#include "arank/math/random.hpp"

namespace arank::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::RankError;
using foundation::RankLogger;
using foundation::RankResult;
using foundation::SessionId;

namespace {

std::atomic<uint64_t> gNextSessionId{1};

SessionId nextSessionId() {
    return SessionId(gNextSessionId.fetch_add(1, std::memory_order_relaxed));
}

std::string describe(math::WinLoss c) {
    return std::to_string(c.winner) + ">" + std::to_string(c.loser);
}

} // namespace

// ---------------------------------------------------------------------------
// SpeculationLedger
// ---------------------------------------------------------------------------

void SpeculationLedger::advance() {
    std::lock_guard lock(mutex_);
    generation_.fetch_add(1, std::memory_order_acq_rel);
    results_.clear();
}

void SpeculationLedger::noteIssued() {
    std::lock_guard lock(mutex_);
    ++stats_.issued;
}

bool SpeculationLedger::storeBelief(uint64_t generation, math::WinLoss outcome,
                                    math::StrengthEstimate belief) {
    std::lock_guard lock(mutex_);
    if (generation != generation_.load(std::memory_order_acquire)) {
        ++stats_.discarded;
        return false;
    }
    results_[{outcome.winner, outcome.loser}].belief = std::move(belief);
    ++stats_.completed;
    return true;
}

bool SpeculationLedger::storeNextPair(uint64_t generation, math::WinLoss outcome,
                                      math::IndexPair pair) {
    std::lock_guard lock(mutex_);
    if (generation != generation_.load(std::memory_order_acquire)) {
        ++stats_.discarded;
        return false;
    }
    results_[{outcome.winner, outcome.loser}].nextPair = pair;
    ++stats_.completed;
    return true;
}

void SpeculationLedger::discard() {
    std::lock_guard lock(mutex_);
    ++stats_.discarded;
}

void SpeculationLedger::attach(ComputeBackend* backend) {
    std::lock_guard lock(mutex_);
    backend_ = backend;
}

void SpeculationLedger::detach() {
    std::unique_lock lock(mutex_);
    generation_.fetch_add(1, std::memory_order_acq_rel);
    results_.clear();
    backend_ = nullptr;
    idle_.wait(lock, [this] { return backendUsers_ == 0; });
}

ComputeBackend* SpeculationLedger::acquireBackend(uint64_t generation) {
    std::lock_guard lock(mutex_);
    if (backend_ == nullptr || generation != generation_.load(std::memory_order_acquire)) {
        return nullptr;
    }
    ++backendUsers_;
    return backend_;
}

void SpeculationLedger::releaseBackend() {
    {
        std::lock_guard lock(mutex_);
        --backendUsers_;
    }
    idle_.notify_all();
}

std::optional<SpeculativeResult> SpeculationLedger::lookup(math::WinLoss outcome) const {
    std::lock_guard lock(mutex_);
    auto it = results_.find({outcome.winner, outcome.loser});
    if (it == results_.end()) {
        return std::nullopt;
    }
    return it->second;
}

SpeculationStats SpeculationLedger::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

RankResult<RankingOrchestrator> RankingOrchestrator::create(
    std::size_t n, RankingConfig config, std::shared_ptr<ComputeBackend> backend) {
    if (n == 0) {
        return RankResult<RankingOrchestrator>::err(
            RankError(ErrorCode::InvalidArgument, "a session needs at least one item"));
    }
    auto valid = validateConfig(config);
    if (!valid) {
        return RankResult<RankingOrchestrator>::err(valid.error());
    }
    if (!backend) {
        return RankResult<RankingOrchestrator>::err(
            RankError(ErrorCode::BackendUnavailable, "no compute backend supplied"));
    }
    return RankResult<RankingOrchestrator>::ok(
        RankingOrchestrator(n, std::move(config), std::move(backend)));
}

RankingOrchestrator::RankingOrchestrator(std::size_t n, RankingConfig config,
                                         std::shared_ptr<ComputeBackend> backend)
    : n_(n),
      config_(std::move(config)),
      backend_(std::move(backend)),
      sessionId_(nextSessionId()),
      ledger_(std::make_shared<SpeculationLedger>()) {
    // The prior needs no backend round trip.
    belief_.mu.assign(n_, 0.0);
    belief_.sigma.assign(n_, std::sqrt(config_.priorVariance));
    ledger_->attach(backend_.get());
}

RankingOrchestrator::~RankingOrchestrator() {
    releaseSpeculation();
}

RankingOrchestrator& RankingOrchestrator::operator=(RankingOrchestrator&& other) noexcept {
    if (this != &other) {
        releaseSpeculation();
        n_ = other.n_;
        config_ = std::move(other.config_);
        backend_ = std::move(other.backend_);
        sessionId_ = other.sessionId_;
        history_ = std::move(other.history_);
        belief_ = std::move(other.belief_);
        previousTopK_ = std::move(other.previousTopK_);
        stableCount_ = other.stableCount_;
        flipHistory_ = std::move(other.flipHistory_);
        stopReason_ = other.stopReason_;
        ledger_ = std::move(other.ledger_);
    }
    return *this;
}

void RankingOrchestrator::releaseSpeculation() noexcept {
    // Moved-from sessions own no ledger.
    if (ledger_) {
        ledger_->detach();
    }
}

// ---------------------------------------------------------------------------
// Backend helpers
// ---------------------------------------------------------------------------

RankResult<math::StrengthEstimate> RankingOrchestrator::refit(
    const math::ComparisonHistory& history) {
    RefitRequest request{
        .id = {},
        .history = history,
        .n = n_,
        .priorVariance = config_.priorVariance,
        .noCache = config_.noCache,
    };
    auto response = awaitResponse(*backend_, std::move(request));
    if (!response) {
        return RankResult<math::StrengthEstimate>::err(response.error());
    }
    auto& refit = std::get<RefitResponse>(response.value());
    if (refit.mu.size() != n_ || refit.sigma.size() != n_) {
        return RankResult<math::StrengthEstimate>::err(
            RankError(ErrorCode::BackendResponseMismatch, "refit has the wrong item count"));
    }
    return RankResult<math::StrengthEstimate>::ok(
        math::StrengthEstimate{std::move(refit.mu), std::move(refit.sigma)});
}

SelectPairRequest RankingOrchestrator::makeSelectRequest(
    const math::StrengthEstimate& belief, const math::ComparisonHistory& history) const {
    return SelectPairRequest{
        .id = {},
        .mu = belief.mu,
        .sigma = belief.sigma,
        .history = history,
        .k = config_.k,
        .n = n_,
        .priorVariance = config_.priorVariance,
        .recencyDiscount = config_.recencyDiscount,
        .estimator = config_.estimator,
        .precision = config_.precision(),
        .seed = math::deriveSeed(config_.seed, static_cast<uint32_t>(history.size())),
        .noCache = config_.noCache,
    };
}

// ---------------------------------------------------------------------------
// selectPair()
// ---------------------------------------------------------------------------

RankResult<math::IndexPair> RankingOrchestrator::selectPair() {
    if (stopped()) {
        return RankResult<math::IndexPair>::err(
            RankError(ErrorCode::IllegalState, "ranking has already stopped"));
    }

    auto response = awaitResponse(*backend_, makeSelectRequest(belief_, history_));
    if (!response) {
        return RankResult<math::IndexPair>::err(response.error());
    }
    auto pair = std::get<SelectPairResponse>(response.value()).pair;
    if (!(pair.first < pair.second) || pair.second >= n_) {
        return RankResult<math::IndexPair>::err(
            RankError(ErrorCode::BackendResponseMismatch, "backend returned an invalid pair"));
    }

    if (config_.speculate && backend_->asynchronous()) {
        speculate(pair);
    }
    return RankResult<math::IndexPair>::ok(pair);
}

// ---------------------------------------------------------------------------
// Speculation
// ---------------------------------------------------------------------------

void RankingOrchestrator::speculate(math::IndexPair pair) {
    const uint64_t generation = ledger_->generation();
    std::weak_ptr<SpeculationLedger> weakLedger = ledger_;

    for (auto outcome : {math::WinLoss{pair.first, pair.second},
                         math::WinLoss{pair.second, pair.first}}) {
        auto hypothetical = history_;
        hypothetical.push_back(outcome);

        // The follow-up selection is built when the refit lands.
        auto nextRequest = makeSelectRequest(belief_, hypothetical);

        auto onRefit = [weakLedger, generation, outcome,
                        nextRequest = std::move(nextRequest)](
                           RankResult<BackendResponse> response) mutable {
            auto ledger = weakLedger.lock();
            if (!ledger) {
                return;
            }
            auto* refit = response ? std::get_if<RefitResponse>(&response.value()) : nullptr;
            if (refit == nullptr) {
                ledger->discard();
                return;
            }
            nextRequest.mu = refit->mu;
            nextRequest.sigma = refit->sigma;
            if (!ledger->storeBelief(generation, outcome,
                                     math::StrengthEstimate{std::move(refit->mu),
                                                            std::move(refit->sigma)})) {
                ARANK_LOG_DEBUG(LogCategory::Orchestrator,
                    "stale speculative refit for " + describe(outcome) + " dropped");
                return;
            }

            auto onSelect = [weakLedger, generation, outcome](
                                RankResult<BackendResponse> selected) {
                auto inner = weakLedger.lock();
                if (!inner) {
                    return;
                }
                const auto* pick =
                    selected ? std::get_if<SelectPairResponse>(&selected.value()) : nullptr;
                if (pick == nullptr) {
                    inner->discard();
                    return;
                }
                if (!inner->storeNextPair(generation, outcome, pick->pair)) {
                    ARANK_LOG_DEBUG(LogCategory::Orchestrator,
                        "stale speculative selection for " + describe(outcome) + " dropped");
                }
            };
            // Borrowed, never owned: a pool job must not end up holding the
            // last reference to the backend it runs on.
            auto* backend = ledger->acquireBackend(generation);
            if (backend == nullptr) {
                return;
            }
            ledger->noteIssued();
            auto posted = backend->post(std::move(nextRequest), std::move(onSelect),
                                        RequestPriority::Speculative);
            ledger->releaseBackend();
            if (!posted) {
                ledger->discard();
            }
        };

        RefitRequest request{
            .id = {},
            .history = std::move(hypothetical),
            .n = n_,
            .priorVariance = config_.priorVariance,
            .noCache = config_.noCache,
        };
        // Counted first: the backend may answer before post() returns.
        ledger_->noteIssued();
        if (!backend_->post(std::move(request), std::move(onRefit),
                            RequestPriority::Speculative)) {
            ledger_->discard();
        }
    }
}

// ---------------------------------------------------------------------------
// recordComparison()
// ---------------------------------------------------------------------------

RankResult<RecordOutcome> RankingOrchestrator::recordComparison(std::size_t winner,
                                                                std::size_t loser) {
    if (stopped()) {
        return RankResult<RecordOutcome>::err(
            RankError(ErrorCode::IllegalState, "ranking has already stopped"));
    }
    if (winner >= n_ || loser >= n_ || winner == loser) {
        return RankResult<RecordOutcome>::err(
            RankError(ErrorCode::InvalidItem,
                      "invalid comparison " + describe({winner, loser}),
                      math::WinLoss{winner, loser}));
    }

    auto staged = history_;
    staged.push_back({winner, loser});

    auto fit = refit(staged);
    if (!fit) {
        return RankResult<RecordOutcome>::err(fit.error());
    }

    // Commit.
    history_ = std::move(staged);
    belief_ = std::move(fit).value();
    ledger_->advance();

    if (auto binding = math::findBindingConstraint(belief_, config_.k, config_.z)) {
        ARANK_LOG_DEBUG(LogCategory::Stopping,
            "binding constraint: item " + std::to_string(binding->weakestIndex) +
            " lcb " + std::to_string(binding->weakestLcb) + " vs item " +
            std::to_string(binding->strongestIndex) + " ucb " +
            std::to_string(binding->strongestUcb));
    }

    if (math::checkConfidenceStop(belief_, config_.k, config_.z, config_.confidenceThreshold)) {
        stopReason_ = StopReason::Confidence;
        logStop(*stopReason_);
        return RankResult<RecordOutcome>::ok(RecordOutcome{true, stopReason_});
    }

    auto stability = math::checkStabilityStop(belief_.mu, config_.k, previousTopK_,
                                              stableCount_, config_.stabilityWindow);
    if (previousTopK_) {
        flipHistory_.push_back(stability.stableCount == 0);
    }
    previousTopK_ = std::move(stability.topK);
    stableCount_ = stability.stableCount;
    if (stability.stopped) {
        stopReason_ = StopReason::Stability;
        logStop(*stopReason_);
        return RankResult<RecordOutcome>::ok(RecordOutcome{true, stopReason_});
    }

    if (round() >= config_.maxComparisons) {
        stopReason_ = StopReason::MaxComparisons;
        logStop(*stopReason_);
        return RankResult<RecordOutcome>::ok(RecordOutcome{true, stopReason_});
    }

    return RankResult<RecordOutcome>::ok(RecordOutcome{false, std::nullopt});
}

// ---------------------------------------------------------------------------
// undoLastComparison()
// ---------------------------------------------------------------------------

RankResult<math::WinLoss> RankingOrchestrator::undoLastComparison() {
    if (history_.empty()) {
        return RankResult<math::WinLoss>::err(
            RankError(ErrorCode::IllegalState, "no comparison to undo"));
    }

    auto truncated = history_;
    const auto removed = truncated.back();
    truncated.pop_back();

    auto fit = refit(truncated);
    if (!fit) {
        return RankResult<math::WinLoss>::err(fit.error());
    }

    history_ = std::move(truncated);
    belief_ = std::move(fit).value();
    if (!flipHistory_.empty()) {
        flipHistory_.pop_back();
    }
    previousTopK_.reset();
    stableCount_ = 0;
    stopReason_.reset();
    ledger_->advance();

    LogContext ctx;
    ctx.sessionId = sessionId_;
    ctx.round = round();
    ctx.extra["removed"] = describe(removed);
    RankLogger::instance().logWithContext(LogLevel::Info, LogCategory::Orchestrator,
                                          "comparison undone", ctx);

    return RankResult<math::WinLoss>::ok(removed);
}

// ---------------------------------------------------------------------------
// Observers
// ---------------------------------------------------------------------------

std::vector<std::size_t> RankingOrchestrator::topKIndices() const {
    auto order = math::argsortDescending(belief_.mu);
    order.resize(std::min(config_.k, order.size()));
    return order;
}

std::optional<math::RemainingEstimate> RankingOrchestrator::estimateRemaining() const {
    const auto budget = static_cast<int64_t>(config_.maxComparisons) -
                        static_cast<int64_t>(round());
    return math::estimateStabilityStop(flipHistory_, stableCount_, config_.stabilityWindow,
                                       std::max<int64_t>(0, budget));
}

SpeculationStats RankingOrchestrator::speculationStats() const {
    return ledger_->stats();
}

std::optional<SpeculativeResult> RankingOrchestrator::speculativeResult(
    math::WinLoss outcome) const {
    return ledger_->lookup(outcome);
}

RankingOrchestrator RankingOrchestrator::clone() const {
    RankingOrchestrator copy(n_, config_, backend_);
    copy.history_ = history_;
    copy.belief_ = belief_;
    copy.previousTopK_ = previousTopK_;
    copy.stableCount_ = stableCount_;
    copy.flipHistory_ = flipHistory_;
    copy.stopReason_ = stopReason_;
    return copy;
}

void RankingOrchestrator::logStop(StopReason reason) const {
    LogContext ctx;
    ctx.sessionId = sessionId_;
    ctx.round = round();
    ctx.extra["reason"] = std::string(stopReasonName(reason));
    RankLogger::instance().logWithContext(LogLevel::Info, LogCategory::Orchestrator,
                                          "session stopped", ctx);
}

} // namespace arank::service
