#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <cstring>

#include "config.h"
#include "logger.h"
#include "money.h"
#include "money_util.h"
#include "rounding.h"

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " [options] <command>\n"
              << "Commands:\n"
              << "  --parse <amount>               Show an amount in minor units\n"
              << "  --multiply <amount> <factor>   Multiply an amount by a decimal factor\n"
              << "  --divide <amount> <divisor>    Divide an amount by a decimal divisor\n"
              << "  --percent <amount> <pct>       Percentage of an amount (default HALF_EVEN)\n"
              << "  --allocate <amount> <w1,w2,..> Split an amount by weights\n"
              << "  --split <amount> <n>           Split an amount into n equal parts\n"
              << "  --round <num> <den>            Integer division under each rounding mode\n"
              << "Options:\n"
              << "  --config <file>     Load configuration from JSON file (default: monex.json)\n"
              << "  --currency <code>   Currency of the amounts (default: USD)\n"
              << "  --rounding <mode>   HALF_UP, HALF_DOWN, HALF_EVEN, FLOOR, CEIL, TRUNCATE\n"
              << "  --log-level <lvl>   trace, debug, info, warn, error, critical, off\n"
              << "  --log-dir <dir>     Also write logs to rotating files in <dir>\n"
              << "  --help              Show this help\n";
}

int reportError(const Monex::Error& error) {
    LOG_DEBUG(Monex::Logger::cli(), "Command failed with {}", Monex::errorCodeName(error.code));
    std::cerr << "❌ " << Monex::errorCodeName(error.code) << ": " << error.message << std::endl;
    return 1;
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        items.push_back(item);
    }
    return items;
}

int printParts(const Monex::Result<std::vector<Monex::Money>>& parts) {
    if (!parts) {
        return reportError(parts.error());
    }
    for (const Monex::Money& part : parts.value()) {
        std::cout << part << std::endl;
    }
    return 0;
}

int printMoney(const Monex::Result<Monex::Money>& money) {
    if (!money) {
        return reportError(money.error());
    }
    std::cout << money.value() << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        }
    }

    // Load configuration
    std::string configFile = "monex.json";
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configFile = argv[++i];
            break;
        }
    }

    Monex::MonexConfig config;
    try {
        config = Monex::ConfigManager::loadFromFile(configFile);
    } catch (const std::exception& e) {
        std::cerr << "❌ Error loading config: " << e.what() << std::endl;
        return 1;
    }

    // Override with CLI arguments
    config = Monex::ConfigManager::loadFromArgs(argc, argv, config);

    Monex::Logger::init(config.log_dir, config.log_level);
    auto log = Monex::Logger::cli();

    Monex::CurrencyRegistry registry = Monex::ConfigManager::buildRegistry(config);
    Monex::Result<Monex::Currency> currency = registry.find(config.currency);
    if (!currency) {
        return reportError(currency.error());
    }

    std::optional<Monex::RoundingMode> rounding;
    if (!config.rounding.empty()) {
        Monex::Result<Monex::RoundingMode> mode = Monex::parseRoundingMode(config.rounding);
        if (!mode) {
            return reportError(mode.error());
        }
        rounding = mode.value();
    }

    LOG_INFO(log, "Currency {} ({} decimals), rounding {}", currency.value().code, currency.value().decimals,
             rounding ? Monex::roundingModeName(*rounding) : "exact");

    // Parse commands (not in config file)
    try {
        for (int i = 1; i < argc; ++i) {
            const std::string command = argv[i];

            if (command == "--round" && i + 2 < argc) {
                Monex::BigInt numerator;
                Monex::BigInt denominator;
                try {
                    numerator = Monex::BigInt::fromString(argv[i + 1]);
                    denominator = Monex::BigInt::fromString(argv[i + 2]);
                } catch (const std::invalid_argument& e) {
                    return reportError(Monex::Error::format(e.what()));
                }

                std::vector<Monex::RoundingMode> modes;
                if (rounding) {
                    modes.push_back(*rounding);
                } else {
                    modes = {Monex::RoundingMode::HalfUp, Monex::RoundingMode::HalfDown, Monex::RoundingMode::HalfEven,
                             Monex::RoundingMode::Floor, Monex::RoundingMode::Ceil, Monex::RoundingMode::Truncate};
                }
                for (Monex::RoundingMode mode : modes) {
                    Monex::Result<Monex::BigInt> quotient = Monex::roundedDivide(numerator, denominator, mode);
                    if (!quotient) {
                        return reportError(quotient.error());
                    }
                    std::cout << Monex::roundingModeName(mode) << ": " << quotient.value() << std::endl;
                }
                return 0;
            }

            if (command != "--parse" && command != "--multiply" && command != "--divide" &&
                command != "--percent" && command != "--allocate" && command != "--split") {
                continue;
            }

            const int needed = (command == "--parse") ? 1 : 2;
            if (i + needed >= argc) {
                std::cerr << "❌ Missing arguments for " << command << std::endl;
                printUsage(argv[0]);
                return 1;
            }

            Monex::Result<Monex::Money> amount = Monex::Money::fromMajor(argv[i + 1], currency.value());
            if (!amount) {
                return reportError(amount.error());
            }
            const Monex::Money& money = amount.value();

            if (command == "--parse") {
                std::cout << money << " = " << money.minor() << " minor units" << std::endl;
                return 0;
            }

            const std::string operand = argv[i + 2];
            if (command == "--multiply") {
                return printMoney(money.multiply(operand, rounding));
            }
            if (command == "--divide") {
                return printMoney(money.divide(operand, rounding));
            }
            if (command == "--percent") {
                return printMoney(money.percentage(operand, rounding.value_or(Monex::RoundingMode::HalfEven)));
            }
            if (command == "--allocate") {
                return printParts(money.allocate(splitList(operand)));
            }

            // --split
            Monex::Result<Monex::BigInt> parts = Monex::parseScaledAmount(operand, 0);
            if (!parts || parts.value().isNegative()) {
                return reportError(parts ? Monex::Error::invalidArgument("Part count must be non-negative: " + operand)
                                         : parts.error());
            }
            return printParts(money.split(static_cast<size_t>(parts.value().toUnsigned())));
        }
    } catch (const std::exception& e) {
        LOG_ERROR(log, "Unexpected failure: {}", e.what());
        std::cerr << "❌ Error: " << e.what() << std::endl;
        return 1;
    }

    printUsage(argv[0]);
    return 1;
}
