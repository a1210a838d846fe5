/// @file ranking_session_test.cpp
/// @brief Unit tests for the typed RankingSession facade.

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "arank/foundation/error_code.hpp"
#include "arank/service/in_process_backend.hpp"
#include "arank/service/ranking_session.hpp"

using namespace arank::service;
using namespace arank::foundation;

class RankingSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<InProcessBackend>();
        ASSERT_TRUE(backend_->start().hasValue());
        config_.k = 2;
        config_.maxComparisons = 40;
    }

    RankingSession<std::string> make() {
        auto created = RankingSession<std::string>::create(names_, config_, backend_);
        EXPECT_TRUE(created.hasValue());
        return std::move(created).value();
    }

    std::vector<std::string> names_{"apple", "banana", "cherry", "damson", "elder"};
    std::map<std::string, int> strength_{
        {"apple", 0}, {"banana", 3}, {"cherry", 1}, {"damson", 4}, {"elder", 2}};
    RankingConfig config_;
    std::shared_ptr<InProcessBackend> backend_;
};

TEST_F(RankingSessionTest, PairUsesCallerItems) {
    auto session = make();
    auto pair = session.selectPair();
    ASSERT_TRUE(pair.hasValue());
    EXPECT_NE(pair.value().a, pair.value().b);
    EXPECT_NE(std::find(names_.begin(), names_.end(), pair.value().a), names_.end());
    EXPECT_NE(std::find(names_.begin(), names_.end(), pair.value().b), names_.end());
}

TEST_F(RankingSessionTest, UnknownItemRejectedWithoutChange) {
    auto session = make();
    auto result = session.recordComparison("apple", "fig");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidItem);
    EXPECT_EQ(session.round(), 0u);
    EXPECT_TRUE(session.history().empty());
}

TEST_F(RankingSessionTest, StoppedSessionReportsStateBeforeItems) {
    config_.maxComparisons = 1;
    auto session = make();
    auto first = session.recordComparison("banana", "apple");
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(session.stopped());

    auto result = session.recordComparison("apple", "fig");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::IllegalState);
    EXPECT_EQ(session.history().size(), 1u);
}

TEST_F(RankingSessionTest, SameItemRejected) {
    auto session = make();
    auto result = session.recordComparison("apple", "apple");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidItem);
}

TEST_F(RankingSessionTest, HistoryAndUndoSpeakItems) {
    auto session = make();
    ASSERT_TRUE(session.recordComparison("damson", "apple").hasValue());
    ASSERT_TRUE(session.recordComparison("banana", "cherry").hasValue());
    ASSERT_EQ(session.history().size(), 2u);
    EXPECT_EQ(session.history()[0].winner, "damson");

    auto undone = session.undoLastComparison();
    ASSERT_TRUE(undone.hasValue());
    EXPECT_EQ(undone.value().winner, "banana");
    EXPECT_EQ(undone.value().loser, "cherry");
    EXPECT_EQ(session.history().size(), 1u);
    EXPECT_EQ(session.round(), 1u);
}

TEST_F(RankingSessionTest, UndoOnEmptySessionFails) {
    auto session = make();
    auto undone = session.undoLastComparison();
    ASSERT_TRUE(undone.hasError());
    EXPECT_EQ(undone.error().code(), ErrorCode::IllegalState);
}

TEST_F(RankingSessionTest, OracleFindsStrongestItems) {
    auto session = make();
    while (!session.stopped()) {
        auto pair = session.selectPair();
        ASSERT_TRUE(pair.hasValue());
        const auto& [a, b] = pair.value();
        bool aWins = strength_[a] > strength_[b];
        ASSERT_TRUE(session.recordComparison(aWins ? a : b, aWins ? b : a).hasValue());
    }
    auto top = session.topK();
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], "damson");
    EXPECT_EQ(top[1], "banana");
    EXPECT_LE(session.round(), config_.maxComparisons);
}

TEST_F(RankingSessionTest, CloneDivergesIndependently) {
    auto session = make();
    ASSERT_TRUE(session.recordComparison("elder", "apple").hasValue());
    auto copy = session.clone();
    ASSERT_TRUE(copy.recordComparison("banana", "cherry").hasValue());

    EXPECT_EQ(session.history().size(), 1u);
    EXPECT_EQ(copy.history().size(), 2u);
    EXPECT_EQ(copy.items(), session.items());
}

TEST(RankingSessionCreateTest, PropagatesConfigErrors) {
    auto backend = std::make_shared<InProcessBackend>();
    RankingConfig config;
    config.recencyDiscount = 0.0;
    auto created = RankingSession<int>::create({1, 2, 3}, config, backend);
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::InvalidArgument);

    auto empty = RankingSession<int>::create({}, RankingConfig{}, backend);
    EXPECT_TRUE(empty.hasError());
}
