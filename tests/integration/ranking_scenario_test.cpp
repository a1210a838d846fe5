/// @file ranking_scenario_test.cpp
/// @brief End-to-end ranking sessions driven by a perfect oracle.

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <set>
#include <vector>

#include "arank/service/in_process_backend.hpp"
#include "arank/service/ranking_orchestrator.hpp"
#include "arank/service/worker_backend.hpp"

using namespace arank::service;
using arank::math::ComparisonHistory;

namespace {

constexpr std::size_t kItems = 6;

RankingConfig scenarioConfig() {
    RankingConfig config;
    config.k = 2;
    return config;
}

/// Item i has true strength i.
struct OracleRun {
    ComparisonHistory history;
    std::optional<StopReason> reason;
    std::set<std::size_t> topK;
    std::size_t flips = 0;
    std::size_t stableCount = 0;
};

OracleRun runOracle(RankingOrchestrator& session) {
    OracleRun run;
    while (!session.stopped()) {
        auto pair = session.selectPair();
        EXPECT_TRUE(pair.hasValue());
        if (!pair) {
            break;
        }
        auto [lo, hi] = pair.value();
        auto outcome = session.recordComparison(hi, lo);
        EXPECT_TRUE(outcome.hasValue());
        if (!outcome) {
            break;
        }

        if (auto estimate = session.estimateRemaining()) {
            EXPECT_LE(estimate->low, estimate->mid);
            EXPECT_LE(estimate->mid, estimate->high);
            EXPECT_LE(estimate->high, static_cast<double>(session.config().maxComparisons -
                                                         session.round()));
        }
    }
    run.history = session.history();
    run.reason = session.stopReason();
    auto top = session.topKIndices();
    run.topK = std::set<std::size_t>(top.begin(), top.end());
    run.flips = session.flipHistory().size();
    run.stableCount = session.stableCount();
    return run;
}

RankingOrchestrator makeSession(std::shared_ptr<ComputeBackend> backend,
                                RankingConfig config = scenarioConfig()) {
    auto created = RankingOrchestrator::create(kItems, config, std::move(backend));
    EXPECT_TRUE(created.hasValue());
    return std::move(created).value();
}

std::shared_ptr<InProcessBackend> startedInProcess() {
    auto backend = std::make_shared<InProcessBackend>();
    EXPECT_TRUE(backend->start().hasValue());
    return backend;
}

} // namespace

TEST(RankingScenarioTest, OracleConvergesOnStrongestPair) {
    auto session = makeSession(startedInProcess());
    auto run = runOracle(session);

    EXPECT_EQ(run.reason, StopReason::Stability);
    EXPECT_EQ(run.history.size(), 13u);
    EXPECT_EQ(run.topK, (std::set<std::size_t>{4, 5}));
    EXPECT_EQ(run.flips, 12u);
    EXPECT_EQ(run.stableCount, 10u);
    // The perfect oracle never lets a weaker item win.
    for (const auto& entry : run.history) {
        EXPECT_GT(entry.winner, entry.loser);
    }
}

TEST(RankingScenarioTest, ComparisonCapEndsSession) {
    auto config = scenarioConfig();
    config.maxComparisons = 5;
    auto session = makeSession(startedInProcess(), config);
    auto run = runOracle(session);

    EXPECT_EQ(run.reason, StopReason::MaxComparisons);
    EXPECT_EQ(run.history.size(), 5u);
    auto remaining = session.estimateRemaining();
    ASSERT_TRUE(remaining.has_value());
    EXPECT_EQ(*remaining, (arank::math::RemainingEstimate{0.0, 0.0, 0.0}));
}

TEST(RankingScenarioTest, MonteCarloEstimatorAgreesOnTopSet) {
    auto config = scenarioConfig();
    config.estimator = arank::math::EstimatorKind::MonteCarlo;
    config.monteCarloSamples = 200;
    auto session = makeSession(startedInProcess(), config);
    auto run = runOracle(session);

    ASSERT_TRUE(run.reason.has_value());
    EXPECT_NE(*run.reason, StopReason::MaxComparisons);
    EXPECT_EQ(run.topK, (std::set<std::size_t>{4, 5}));
}

TEST(RankingScenarioTest, BackendsProduceIdenticalSessions) {
    auto reference = makeSession(startedInProcess());
    auto expected = runOracle(reference);

    auto worker = std::make_shared<WorkerBackend>(3);
    ASSERT_TRUE(worker->start().hasValue());
    auto threaded = makeSession(worker);
    auto actual = runOracle(threaded);
    worker->shutdown();

    EXPECT_EQ(actual.history, expected.history);
    EXPECT_EQ(actual.reason, expected.reason);
    EXPECT_EQ(actual.topK, expected.topK);
}

TEST(RankingScenarioTest, SessionOwningWorkerBackendTearsDownCleanly) {
    for (int attempt = 0; attempt < 20; ++attempt) {
        auto worker = std::make_shared<WorkerBackend>(2);
        ASSERT_TRUE(worker->start().hasValue());
        std::weak_ptr<WorkerBackend> watch = worker;
        {
            auto session = makeSession(std::move(worker));
            ASSERT_TRUE(session.selectPair().hasValue());
            // Speculative refits may still be running on the pool here.
        }
        EXPECT_TRUE(watch.expired());
    }
}

TEST(RankingScenarioTest, SpeculationAndCachingDoNotChangeDecisions) {
    auto reference = makeSession(startedInProcess());
    auto expected = runOracle(reference);

    auto config = scenarioConfig();
    config.speculate = false;
    config.noCache = true;
    auto plain = makeSession(startedInProcess(), config);
    auto actual = runOracle(plain);

    EXPECT_EQ(actual.history, expected.history);
    EXPECT_EQ(reference.belief(), plain.belief());
}

TEST(RankingScenarioTest, UndoThenReplayReachesSameStop) {
    auto session = makeSession(startedInProcess());
    auto run = runOracle(session);
    ASSERT_TRUE(session.stopped());

    auto undone = session.undoLastComparison();
    ASSERT_TRUE(undone.hasValue());
    EXPECT_FALSE(session.stopped());
    EXPECT_EQ(session.round(), run.history.size() - 1);

    auto outcome = session.recordComparison(undone.value().winner, undone.value().loser);
    ASSERT_TRUE(outcome.hasValue());
    // Stability tracking restarts after an undo.
    EXPECT_FALSE(outcome.value().stopped);
    EXPECT_EQ(session.stableCount(), 0u);
    EXPECT_EQ(session.history(), run.history);
}
