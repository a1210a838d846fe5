/// @file ranking_config_loader_test.cpp
/// @brief Unit tests for loading ranking and backend options.

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "arank/foundation/error_code.hpp"
#include "arank/service/in_process_backend.hpp"
#include "arank/service/ranking_config_loader.hpp"
#include "arank/service/worker_backend.hpp"

using namespace arank::service;
using namespace arank::foundation;

// ============================================================================
// Ranking options
// ============================================================================

TEST(RankingConfigLoaderTest, EmptyConfigKeepsDefaults) {
    ConfigManager config;
    auto loaded = loadRankingConfig(config);
    ASSERT_TRUE(loaded.hasValue());
    const auto& cfg = loaded.value();
    EXPECT_EQ(cfg.k, 5u);
    EXPECT_DOUBLE_EQ(cfg.z, 1.96);
    EXPECT_EQ(cfg.stabilityWindow, 10u);
    EXPECT_EQ(cfg.maxComparisons, 80u);
    EXPECT_EQ(cfg.estimator, arank::math::EstimatorKind::Quadrature);
    EXPECT_EQ(cfg.precision(), 7u);
    EXPECT_DOUBLE_EQ(cfg.recencyDiscount, 0.5);
    EXPECT_TRUE(cfg.speculate);
}

TEST(RankingConfigLoaderTest, ReadsEveryKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
ranking:
  k: 3
  z: 2.5
  stability_window: 6
  max_comparisons: 40
  prior_variance: 2.0
  confidence_threshold: 0.1
  estimator: monte_carlo
  quadrature_order: 9
  monte_carlo_samples: 250
  recency_discount: 0.8
  seed: 17
  no_cache: true
  speculate: false
)").hasValue());

    auto loaded = loadRankingConfig(config);
    ASSERT_TRUE(loaded.hasValue());
    const auto& cfg = loaded.value();
    EXPECT_EQ(cfg.k, 3u);
    EXPECT_DOUBLE_EQ(cfg.z, 2.5);
    EXPECT_EQ(cfg.stabilityWindow, 6u);
    EXPECT_EQ(cfg.maxComparisons, 40u);
    EXPECT_DOUBLE_EQ(cfg.priorVariance, 2.0);
    EXPECT_DOUBLE_EQ(cfg.confidenceThreshold, 0.1);
    EXPECT_EQ(cfg.estimator, arank::math::EstimatorKind::MonteCarlo);
    EXPECT_EQ(cfg.quadratureOrder, 9u);
    EXPECT_EQ(cfg.precision(), 250u);
    EXPECT_DOUBLE_EQ(cfg.recencyDiscount, 0.8);
    EXPECT_EQ(cfg.seed, 17u);
    EXPECT_TRUE(cfg.noCache);
    EXPECT_FALSE(cfg.speculate);
}

TEST(RankingConfigLoaderTest, UnknownEstimatorRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("ranking:\n  estimator: exact\n").hasValue());
    auto loaded = loadRankingConfig(config);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(RankingConfigLoaderTest, TypeMismatchRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("ranking:\n  k: many\n").hasValue());
    auto loaded = loadRankingConfig(config);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(RankingConfigLoaderTest, OutOfRangeValuesRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("ranking:\n  recency_discount: 1.5\n").hasValue());
    auto loaded = loadRankingConfig(config);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::InvalidArgument);

    ConfigManager order;
    ASSERT_TRUE(order.loadString("ranking:\n  quadrature_order: 100\n").hasValue());
    EXPECT_TRUE(loadRankingConfig(order).hasError());
}

// ============================================================================
// Backend options
// ============================================================================

TEST(BackendConfigLoaderTest, DefaultsAndOverrides) {
    ConfigManager empty;
    auto defaults = loadBackendConfig(empty);
    ASSERT_TRUE(defaults.hasValue());
    EXPECT_EQ(defaults.value().mode, BackendMode::Worker);
    EXPECT_EQ(defaults.value().workerThreads, 2u);

    ConfigManager config;
    ASSERT_TRUE(config.loadString(
        "backend:\n  mode: in_process\n  worker_threads: 6\n  cache_entries: 0\n").hasValue());
    auto loaded = loadBackendConfig(config);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value().mode, BackendMode::InProcess);
    EXPECT_EQ(loaded.value().workerThreads, 6u);
    EXPECT_EQ(loaded.value().cacheEntries, 0u);
}

TEST(BackendConfigLoaderTest, UnknownModeRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("backend:\n  mode: cluster\n").hasValue());
    auto loaded = loadBackendConfig(config);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(BackendConfigLoaderTest, ModeNamesRoundTrip) {
    EXPECT_EQ(parseBackendMode(backendModeName(BackendMode::Worker)), BackendMode::Worker);
    EXPECT_EQ(parseBackendMode("in-process"), BackendMode::InProcess);
    EXPECT_FALSE(parseBackendMode("remote").has_value());
}

TEST(BackendConfigLoaderTest, MakeBackendHonoursMode) {
    auto inProcess = makeBackend(BackendConfig{.mode = BackendMode::InProcess});
    auto* direct = dynamic_cast<InProcessBackend*>(inProcess.get());
    ASSERT_NE(direct, nullptr);
    EXPECT_TRUE(direct->engine().refitCache()->config().enabled);

    auto uncached = makeBackend(BackendConfig{.mode = BackendMode::InProcess, .cacheEntries = 0});
    auto* plain = dynamic_cast<InProcessBackend*>(uncached.get());
    ASSERT_NE(plain, nullptr);
    EXPECT_FALSE(plain->engine().refitCache()->config().enabled);

    auto worker = makeBackend(BackendConfig{});
    EXPECT_NE(dynamic_cast<WorkerBackend*>(worker.get()), nullptr);
    EXPECT_FALSE(worker->running());
}

// ============================================================================
// Config file discovery
// ============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "arank_config_loader_test";
        std::filesystem::create_directories(dir_);
        ::unsetenv("ARANK_CONFIG_PATH");
    }

    void TearDown() override {
        ::unsetenv("ARANK_CONFIG_PATH");
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path write(const std::string& name, const std::string& body) {
        auto path = dir_ / name;
        std::ofstream(path) << body;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigFileTest, LoadsDefaultPath) {
    auto path = write("default.yaml", "ranking:\n  k: 4\n");
    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, path).hasValue());
    EXPECT_EQ(loadRankingConfig(config).value().k, 4u);
}

TEST_F(ConfigFileTest, EnvironmentOverridesDefault) {
    auto fallback = write("default.yaml", "ranking:\n  k: 4\n");
    auto chosen = write("chosen.yaml", "ranking:\n  k: 8\n");
    ::setenv("ARANK_CONFIG_PATH", chosen.c_str(), 1);

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, fallback).hasValue());
    EXPECT_EQ(loadRankingConfig(config).value().k, 8u);
}

TEST_F(ConfigFileTest, MissingFileReported) {
    ConfigManager config;
    auto result = loadConfig(config, dir_ / "absent.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigArgTest, FindsConfigFlag) {
    char prog[] = "arank_simulate";
    char flag[] = "--config";
    char value[] = "custom.yaml";
    char* argv[] = {prog, flag, value};
    EXPECT_EQ(parseConfigArg(3, argv), std::filesystem::path("custom.yaml"));

    char* bare[] = {prog, flag};
    EXPECT_TRUE(parseConfigArg(2, bare).empty());
}
