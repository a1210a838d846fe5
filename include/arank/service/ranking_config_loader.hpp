#pragma once

/// @file ranking_config_loader.hpp
/// @brief Builds ranking and backend options from a ConfigManager.
///
/// Every key is optional; absent keys keep the struct defaults.
///
/// @code
///   ranking:
///     k: 5
///     estimator: quadrature   # or monte_carlo
///   backend:
///     mode: worker            # or in_process
///     worker_threads: 2
/// @endcode

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include "arank/foundation/config_manager.hpp"
#include "arank/foundation/rank_result.hpp"
#include "arank/service/compute_backend.hpp"
#include "arank/service/ranking_types.hpp"

namespace arank::service {

enum class BackendMode : uint8_t {
    InProcess,
    Worker
};

constexpr std::string_view backendModeName(BackendMode mode) {
    switch (mode) {
        case BackendMode::InProcess: return "in_process";
        case BackendMode::Worker:    return "worker";
    }
    return "unknown";
}

std::optional<BackendMode> parseBackendMode(std::string_view name);

struct BackendConfig {
    BackendMode mode = BackendMode::Worker;
    std::size_t workerThreads = 2;
    std::size_t cacheEntries = 4096;  ///< Per cache; 0 disables caching.
};

/// Read the "ranking.*" keys and validate the result.
/// @return ConfigTypeMismatch, ConfigInvalidValue or InvalidArgument on bad input.
foundation::RankResult<RankingConfig> loadRankingConfig(const foundation::ConfigManager& config);

/// Read the "backend.*" keys.
foundation::RankResult<BackendConfig> loadBackendConfig(const foundation::ConfigManager& config);

/// Construct (but do not start) the backend described by @p config.
std::shared_ptr<ComputeBackend> makeBackend(const BackendConfig& config);

/// Load @p defaultPath, or the file named by ARANK_CONFIG_PATH when set.
foundation::RankResult<void> loadConfig(foundation::ConfigManager& config,
                                        const std::filesystem::path& defaultPath);

/// Value following "--config" on the command line, or empty.
std::filesystem::path parseConfigArg(int argc, char* argv[]);

} // namespace arank::service
