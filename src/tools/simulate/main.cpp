/// @file main.cpp
/// @brief Simulation entry point.
///
/// Runs one ranking session against a perfect oracle whose true strengths
/// are 0..N-1, printing each pair asked and the final result.

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "arank/foundation/config_manager.hpp"
#include "arank/service/ranking_config_loader.hpp"
#include "arank/service/ranking_session.hpp"

namespace {

constexpr std::size_t kDefaultItems = 10;

std::size_t parseItemsArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--items") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            char* end = nullptr;
            auto value = std::strtoul(argv[i + 1], &end, 10);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            if (end != nullptr && *end == '\0' && value > 0) {
                return value;
            }
            std::cerr << "Ignoring invalid --items value\n";
        }
    }
    return kDefaultItems;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace arank;

    foundation::ConfigManager config;
    auto configPath = service::parseConfigArg(argc, argv);
    if (!configPath.empty() || std::getenv("ARANK_CONFIG_PATH") != nullptr) {
        auto loadResult = service::loadConfig(config, configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto rankingCfg = service::loadRankingConfig(config);
    if (!rankingCfg) {
        std::cerr << "Invalid ranking config: " << rankingCfg.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto backendCfg = service::loadBackendConfig(config);
    if (!backendCfg) {
        std::cerr << "Invalid backend config: " << backendCfg.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto backend = service::makeBackend(backendCfg.value());
    auto startResult = backend->start();
    if (!startResult) {
        std::cerr << "Failed to start backend: " << startResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const std::size_t n = parseItemsArg(argc, argv);
    std::vector<std::string> items;
    for (std::size_t i = 0; i < n; ++i) {
        items.push_back("item" + std::to_string(i));
    }

    auto created = service::RankingSession<std::string>::create(items, rankingCfg.value(), backend);
    if (!created) {
        std::cerr << "Failed to create session: " << created.error().message() << "\n";
        backend->shutdown();
        return EXIT_FAILURE;
    }
    auto& session = created.value();

    std::cout << "Ranking " << n << " items (k=" << rankingCfg.value().k << ", backend="
              << service::backendModeName(backendCfg.value().mode) << ")\n";

    // Strength of "itemX" is X, so the higher index always wins.
    auto strength = [&](const std::string& item) {
        return std::stoul(item.substr(4));
    };

    while (!session.stopped()) {
        auto pair = session.selectPair();
        if (!pair) {
            std::cerr << "Pair selection failed: " << pair.error().message() << "\n";
            backend->shutdown();
            return EXIT_FAILURE;
        }
        const auto& [a, b] = pair.value();
        const bool aWins = strength(a) > strength(b);
        std::cout << "round " << session.round() + 1 << ": " << a << " vs " << b << " -> "
                  << (aWins ? a : b) << "\n";

        auto outcome = aWins ? session.recordComparison(a, b) : session.recordComparison(b, a);
        if (!outcome) {
            std::cerr << "Recording failed: " << outcome.error().message() << "\n";
            backend->shutdown();
            return EXIT_FAILURE;
        }
    }

    std::cout << "top-" << rankingCfg.value().k << ":";
    for (const auto& item : session.topK()) {
        std::cout << " " << item;
    }
    std::cout << "\nstopped by " << service::stopReasonName(*session.stopReason())
              << " after " << session.round() << " comparisons\n";

    auto stats = session.orchestrator().speculationStats();
    std::cout << "speculation: " << stats.issued << " issued, " << stats.completed
              << " completed, " << stats.discarded << " discarded\n";

    backend->shutdown();
    return EXIT_SUCCESS;
}
