#pragma once

/// @file ranking_session.hpp
/// @brief Typed facade mapping caller items onto a RankingOrchestrator.

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "arank/foundation/rank_result.hpp"
#include "arank/service/ranking_orchestrator.hpp"

namespace arank::service {

template <typename T>
struct ItemPair {
    T a;
    T b;
};

/// One committed comparison in the caller's item domain.
template <typename T>
struct ComparisonRecord {
    T winner;
    T loser;
};

/// Ranking session over arbitrary items.
///
/// Items are identified by position in the constructor's list; lookups use
/// operator== on T, so duplicates resolve to their first occurrence.
///
/// Example:
/// @code
///   auto backend = std::make_shared<InProcessBackend>();
///   backend->start();
///   auto session = RankingSession<std::string>::create(names, config, backend);
///   auto& s = session.value();
///   while (!s.stopped()) {
///       auto [a, b] = s.selectPair().value();
///       bool aWins = ask(a, b);
///       s.recordComparison(aWins ? a : b, aWins ? b : a);
///   }
/// @endcode
template <typename T>
class RankingSession {
public:
    static foundation::RankResult<RankingSession> create(
        std::vector<T> items, RankingConfig config, std::shared_ptr<ComputeBackend> backend) {
        auto orchestrator =
            RankingOrchestrator::create(items.size(), std::move(config), std::move(backend));
        if (!orchestrator) {
            return foundation::RankResult<RankingSession>::err(orchestrator.error());
        }
        return foundation::RankResult<RankingSession>::ok(
            RankingSession(std::move(items), std::move(orchestrator).value()));
    }

    foundation::RankResult<ItemPair<T>> selectPair() {
        auto pair = orchestrator_.selectPair();
        if (!pair) {
            return foundation::RankResult<ItemPair<T>>::err(pair.error());
        }
        return foundation::RankResult<ItemPair<T>>::ok(
            ItemPair<T>{items_[pair.value().first], items_[pair.value().second]});
    }

    /// @return IllegalState once stopped; otherwise InvalidItem, without
    ///         any state change, if either item is not part of the session.
    foundation::RankResult<RecordOutcome> recordComparison(const T& winner, const T& loser) {
        if (orchestrator_.stopped()) {
            return foundation::RankResult<RecordOutcome>::err(
                foundation::RankError(foundation::ErrorCode::IllegalState,
                                      "ranking has already stopped"));
        }
        auto w = indexOf(winner);
        auto l = indexOf(loser);
        if (!w || !l) {
            return foundation::RankResult<RecordOutcome>::err(
                foundation::RankError(foundation::ErrorCode::InvalidItem,
                                      "item not found in ranking"));
        }
        auto outcome = orchestrator_.recordComparison(*w, *l);
        if (outcome) {
            records_.push_back(ComparisonRecord<T>{winner, loser});
        }
        return outcome;
    }

    foundation::RankResult<ComparisonRecord<T>> undoLastComparison() {
        auto undone = orchestrator_.undoLastComparison();
        if (!undone) {
            return foundation::RankResult<ComparisonRecord<T>>::err(undone.error());
        }
        auto record = std::move(records_.back());
        records_.pop_back();
        return foundation::RankResult<ComparisonRecord<T>>::ok(std::move(record));
    }

    /// Current top-K items, strongest first.
    [[nodiscard]] std::vector<T> topK() const {
        std::vector<T> result;
        for (auto i : orchestrator_.topKIndices()) {
            result.push_back(items_[i]);
        }
        return result;
    }

    [[nodiscard]] const std::vector<ComparisonRecord<T>>& history() const noexcept {
        return records_;
    }

    [[nodiscard]] const std::vector<T>& items() const noexcept { return items_; }
    [[nodiscard]] std::size_t round() const noexcept { return orchestrator_.round(); }
    [[nodiscard]] bool stopped() const noexcept { return orchestrator_.stopped(); }
    [[nodiscard]] std::optional<StopReason> stopReason() const noexcept {
        return orchestrator_.stopReason();
    }
    [[nodiscard]] const std::vector<double>& mu() const noexcept { return orchestrator_.mu(); }
    [[nodiscard]] const std::vector<double>& sigma() const noexcept {
        return orchestrator_.sigma();
    }
    [[nodiscard]] std::optional<math::RemainingEstimate> estimateRemaining() const {
        return orchestrator_.estimateRemaining();
    }

    [[nodiscard]] const RankingOrchestrator& orchestrator() const noexcept {
        return orchestrator_;
    }

    [[nodiscard]] RankingSession clone() const {
        RankingSession copy(items_, orchestrator_.clone());
        copy.records_ = records_;
        return copy;
    }

private:
    RankingSession(std::vector<T> items, RankingOrchestrator orchestrator)
        : items_(std::move(items)), orchestrator_(std::move(orchestrator)) {}

    std::optional<std::size_t> indexOf(const T& item) const {
        auto it = std::find(items_.begin(), items_.end(), item);
        if (it == items_.end()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(it - items_.begin());
    }

    std::vector<T> items_;
    RankingOrchestrator orchestrator_;
    std::vector<ComparisonRecord<T>> records_;
};

} // namespace arank::service
