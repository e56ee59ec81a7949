#include "config.h"
#include <fstream>
#include <cstring>
#include <stdexcept>
#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace Monex {

MonexConfig ConfigManager::getDefaults() {
    return MonexConfig(); // All defaults from struct initialization
}

MonexConfig ConfigManager::loadFromFile(const std::string& filepath) {
    MonexConfig config = getDefaults();

    std::ifstream file(filepath);
    if (!file.is_open()) {
        // File doesn't exist - return defaults
        return config;
    }

    try {
        json j;
        file >> j;

        // Logging settings
        if (j.contains("logging")) {
            auto logging = j["logging"];
            if (logging.contains("dir")) config.log_dir = logging["dir"].get<std::string>();
            if (logging.contains("level")) config.log_level = logging["level"].get<std::string>();
        }

        // Money settings
        if (j.contains("money")) {
            auto money = j["money"];
            if (money.contains("currency")) config.currency = money["currency"].get<std::string>();
            if (money.contains("rounding")) config.rounding = money["rounding"].get<std::string>();
        }

        // Custom currencies
        if (j.contains("currencies") && j["currencies"].is_array()) {
            for (const auto& entry : j["currencies"]) {
                Result<Currency> currency = Currency::make(
                    entry.at("code").get<std::string>(),
                    entry.at("decimals").get<int>(),
                    entry.value("symbol", ""),
                    entry.value("locale", ""));
                if (!currency) {
                    throw std::runtime_error("Invalid currency in config file: " + currency.error().message);
                }
                config.currencies.push_back(currency.value());
            }
        }

    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid JSON in config file: " + std::string(e.what()));
    }

    return config;
}

MonexConfig ConfigManager::loadFromArgs(int argc, char* argv[], const MonexConfig& defaults) {
    MonexConfig config = defaults;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--currency") == 0 && i + 1 < argc) {
            config.currency = argv[++i];
        } else if (strcmp(argv[i], "--rounding") == 0 && i + 1 < argc) {
            config.rounding = argv[++i];
        } else if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (strcmp(argv[i], "--log-dir") == 0 && i + 1 < argc) {
            config.log_dir = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0) {
            // Skip, already handled
            if (i + 1 < argc) ++i;
        }
        // Note: commands like --parse, --multiply, --allocate are handled separately in main.cpp
    }

    return config;
}

CurrencyRegistry ConfigManager::buildRegistry(const MonexConfig& config) {
    CurrencyRegistry registry = CurrencyRegistry::withDefaults();
    for (const Currency& currency : config.currencies) {
        registry.registerCurrency(currency);
    }
    return registry;
}

} // namespace Monex
