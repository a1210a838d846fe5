/// @file ranking_config_loader.cpp
/// @brief YAML option loading for sessions and backends.

#include "arank/service/ranking_config_loader.hpp"

#include <cstdlib>
#include <string>

#include "arank/foundation/rank_logger.hpp"
#include "arank/service/in_process_backend.hpp"
#include "arank/service/worker_backend.hpp"

namespace arank::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RankError;
using foundation::RankResult;

namespace {

/// Overwrite @p target when @p key is present; false on a type mismatch.
template <typename T>
bool readInto(const ConfigManager& config, std::string_view key, T& target,
              RankError& error) {
    auto value = config.getOr<T>(key, target);
    if (!value) {
        error = value.error();
        return false;
    }
    target = value.value();
    return true;
}

} // namespace

std::optional<BackendMode> parseBackendMode(std::string_view name) {
    if (name == "in_process" || name == "in-process") {
        return BackendMode::InProcess;
    }
    if (name == "worker") {
        return BackendMode::Worker;
    }
    return std::nullopt;
}

// -- Ranking options ---------------------------------------------------------

RankResult<RankingConfig> loadRankingConfig(const ConfigManager& config) {
    RankingConfig cfg;
    RankError error;

    std::string estimator(math::estimatorKindName(cfg.estimator));

    bool ok = readInto(config, "ranking.k", cfg.k, error) &&
              readInto(config, "ranking.z", cfg.z, error) &&
              readInto(config, "ranking.stability_window", cfg.stabilityWindow, error) &&
              readInto(config, "ranking.max_comparisons", cfg.maxComparisons, error) &&
              readInto(config, "ranking.prior_variance", cfg.priorVariance, error) &&
              readInto(config, "ranking.confidence_threshold", cfg.confidenceThreshold, error) &&
              readInto(config, "ranking.estimator", estimator, error) &&
              readInto(config, "ranking.quadrature_order", cfg.quadratureOrder, error) &&
              readInto(config, "ranking.monte_carlo_samples", cfg.monteCarloSamples, error) &&
              readInto(config, "ranking.recency_discount", cfg.recencyDiscount, error) &&
              readInto(config, "ranking.seed", cfg.seed, error) &&
              readInto(config, "ranking.no_cache", cfg.noCache, error) &&
              readInto(config, "ranking.speculate", cfg.speculate, error);
    if (!ok) {
        return RankResult<RankingConfig>::err(std::move(error));
    }

    auto kind = math::parseEstimatorKind(estimator);
    if (!kind) {
        return RankResult<RankingConfig>::err(
            RankError(ErrorCode::ConfigInvalidValue, "unknown estimator: " + estimator));
    }
    cfg.estimator = *kind;

    auto valid = validateConfig(cfg);
    if (!valid) {
        return RankResult<RankingConfig>::err(valid.error());
    }
    return RankResult<RankingConfig>::ok(cfg);
}

// -- Backend options ---------------------------------------------------------

RankResult<BackendConfig> loadBackendConfig(const ConfigManager& config) {
    BackendConfig cfg;
    RankError error;

    std::string mode(backendModeName(cfg.mode));
    bool ok = readInto(config, "backend.mode", mode, error) &&
              readInto(config, "backend.worker_threads", cfg.workerThreads, error) &&
              readInto(config, "backend.cache_entries", cfg.cacheEntries, error);
    if (!ok) {
        return RankResult<BackendConfig>::err(std::move(error));
    }

    auto parsed = parseBackendMode(mode);
    if (!parsed) {
        return RankResult<BackendConfig>::err(
            RankError(ErrorCode::ConfigInvalidValue, "unknown backend mode: " + mode));
    }
    cfg.mode = *parsed;
    return RankResult<BackendConfig>::ok(cfg);
}

std::shared_ptr<ComputeBackend> makeBackend(const BackendConfig& config) {
    CacheConfig cache{
        .enabled = config.cacheEntries > 0,
        .maxEntries = config.cacheEntries,
    };
    auto engine = std::make_shared<BackendEngine>(cache);
    if (config.mode == BackendMode::InProcess) {
        return std::make_shared<InProcessBackend>(std::move(engine));
    }
    return std::make_shared<WorkerBackend>(config.workerThreads, std::move(engine));
}

// -- Config file -------------------------------------------------------------

RankResult<void> loadConfig(ConfigManager& config, const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("ARANK_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    ARANK_LOG_INFO(LogCategory::Core, "loading configuration from " + configPath.string());
    return config.load(configPath);
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace arank::service
