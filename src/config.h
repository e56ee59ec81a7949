#ifndef MONEX_CONFIG_H
#define MONEX_CONFIG_H

#include <string>
#include <vector>
#include "currency.h"

namespace Monex {

/**
 * @brief Configuration structure for the monex tool
 *
 * Values can be loaded from JSON config file and overridden by CLI arguments.
 */
struct MonexConfig {
    // Logging settings
    std::string log_dir = "";        // empty: console only
    std::string log_level = "warn";  // trace, debug, info, warn, error, critical, off

    // Money settings
    std::string currency = "USD";    // default currency code for amounts
    std::string rounding = "";       // default rounding mode name; empty means exact only

    // Extra currencies registered on top of the built-in table
    std::vector<Currency> currencies;
};

/**
 * @brief Configuration Manager for loading and merging configs
 *
 * Priority: CLI args > config file > defaults
 */
class ConfigManager {
public:
    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to JSON config file
     * @return MonexConfig with values from file (defaults for missing keys)
     * @throws std::runtime_error if file exists but is invalid JSON or declares an invalid currency
     */
    static MonexConfig loadFromFile(const std::string& filepath);

    /**
     * @brief Override config with CLI arguments
     * @param argc Argument count
     * @param argv Argument values
     * @param defaults Base config to override (from file or default)
     * @return MonexConfig with CLI overrides applied
     */
    static MonexConfig loadFromArgs(int argc, char* argv[], const MonexConfig& defaults);

    /**
     * @brief Get default configuration
     */
    static MonexConfig getDefaults();

    /**
     * @brief Built-in currencies plus the ones declared in config
     */
    static CurrencyRegistry buildRegistry(const MonexConfig& config);
};

} // namespace Monex

#endif // MONEX_CONFIG_H
