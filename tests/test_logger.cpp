#include <gtest/gtest.h>
#include "logger.h"
#include "rounding.h"
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

using namespace Monex;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::shutdown();
    }

    void TearDown() override {
        Logger::shutdown();
    }
};

// Test: Level names map to spdlog levels
TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(Logger::parseLogLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parseLogLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(Logger::parseLogLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLogLevel("err"), spdlog::level::err);
    EXPECT_EQ(Logger::parseLogLevel("off"), spdlog::level::off);
    EXPECT_EQ(Logger::parseLogLevel("nonsense"), spdlog::level::info);
}

// Test: Loggers are created lazily with the default level
TEST_F(LoggerTest, LazyInit) {
    auto core = Logger::core();
    ASSERT_NE(core, nullptr);
    EXPECT_EQ(core->name(), "core");
    EXPECT_EQ(core->level(), spdlog::level::info);
    EXPECT_EQ(Logger::cli()->name(), "cli");
}

// Test: Explicit init sets the level and writes rotating files
TEST_F(LoggerTest, InitWithDirectory) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "monex_logger_test";
    std::filesystem::remove_all(dir);

    Logger::init(dir.string(), "debug");
    EXPECT_EQ(Logger::core()->level(), spdlog::level::debug);

    // Core operations log their decisions at debug level
    EXPECT_TRUE(roundedDivide(BigInt(5), BigInt(0), RoundingMode::HalfUp).error().code == ErrorCode::DivisionByZero);
    Logger::shutdown();

    EXPECT_TRUE(std::filesystem::exists(dir / "core.log"));
    EXPECT_TRUE(std::filesystem::exists(dir / "cli.log"));
    std::filesystem::remove_all(dir);
}

// Test: A second init is ignored until shutdown
TEST_F(LoggerTest, InitOnce) {
    Logger::init("", "error");
    Logger::init("", "trace");
    EXPECT_EQ(Logger::cli()->level(), spdlog::level::err);
}

// Test: Disabled levels do not evaluate their arguments
TEST_F(LoggerTest, DisabledLevelSkipsArguments) {
    int evaluated = 0;
    auto render = [&evaluated]() {
        ++evaluated;
        return BigInt::pow10(40).toString();
    };

    Logger::init("", "info");
    LOG_DEBUG(Logger::core(), "value {}", render());
    EXPECT_EQ(evaluated, 0);

    Logger::shutdown();
    Logger::init("", "debug");
    LOG_DEBUG(Logger::core(), "value {}", render());
    EXPECT_EQ(evaluated, 1);
}

// Test: Monex loggers stay out of spdlog's registry
TEST_F(LoggerTest, LeavesHostLoggersAlone) {
    auto hostLogger = std::make_shared<spdlog::logger>("core");
    spdlog::register_logger(hostLogger);

    Logger::init("", "info");
    EXPECT_EQ(spdlog::get("core"), hostLogger);
    EXPECT_EQ(spdlog::get("cli"), nullptr);
    EXPECT_NE(Logger::core(), hostLogger);

    Logger::shutdown();
    EXPECT_EQ(spdlog::get("core"), hostLogger);
    spdlog::drop("core");
}

// Test: Loggers can be fetched while another thread restarts them
TEST_F(LoggerTest, ConcurrentAccessAndShutdown) {
    std::atomic<bool> stop{false};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&stop]() {
            while (!stop) {
                auto core = Logger::core();
                ASSERT_NE(core, nullptr);
                LOG_DEBUG(core, "allocate {}", 1);
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        Logger::shutdown();
        Logger::init("", "warn");
    }
    stop = true;
    for (std::thread& reader : readers) {
        reader.join();
    }
    EXPECT_NE(Logger::cli(), nullptr);
}
