#include <catch2/catch_test_macros.hpp>
#include "peerquic/debug/logger.hpp"
#include <vector>
using namespace peerquic::debug;

TEST_CASE("Logger - level threshold", "[debug][logger]") {
    const LogLevel previous = Logger::GetLevel();

    SECTION("Levels up to the threshold are enabled") {
        Logger::SetLevel(LogLevel::Info);
        REQUIRE(Logger::IsEnabled(LogLevel::Error));
        REQUIRE(Logger::IsEnabled(LogLevel::Info));
        REQUIRE_FALSE(Logger::IsEnabled(LogLevel::Debug));
        REQUIRE_FALSE(Logger::IsEnabled(LogLevel::Off));
    }
    SECTION("Off silences everything") {
        Logger::SetLevel(LogLevel::Off);
        REQUIRE_FALSE(Logger::IsEnabled(LogLevel::Error));
        PEERQUIC_LOG_ERROR("test", "never formatted {}", 1);
    }

    Logger::SetLevel(previous);
}

TEST_CASE("Logger - level names", "[debug][logger]") {
    REQUIRE(Logger::ParseLevel("trace") == LogLevel::Trace);
    REQUIRE(Logger::ParseLevel("warning") == LogLevel::Warn);
    REQUIRE(Logger::ParseLevel("none") == LogLevel::Off);
    REQUIRE(Logger::ParseLevel("verbose") == LogLevel::Warn);
}

TEST_CASE("Logger - ToHex truncates long input", "[debug][logger]") {
    const std::vector<uint8_t> short_data{0x00, 0xAB, 0x0F};
    REQUIRE(Logger::ToHex(short_data) == "00ab0f");

    const std::vector<uint8_t> long_data(20, 0xFF);
    REQUIRE(Logger::ToHex(long_data, 2) == "ffff...");
    REQUIRE(Logger::ToHex({}).empty());
}
