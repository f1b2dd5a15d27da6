#include "peerquic/debug/logger.hpp"

#include <cstdio>
#include <cstdlib>

namespace peerquic::debug {

namespace {

constexpr uint8_t kUnsetLevel = 0xFF;

const char* LevelToString(const LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
        default: return "OFF";
    }
}

}

void Logger::SetLevel(const LogLevel level) noexcept {
    level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

LogLevel Logger::GetLevel() noexcept {
    uint8_t current = level_.load(std::memory_order_relaxed);
    if (current == kUnsetLevel) {
        const auto from_env = LevelFromEnvironment();
        uint8_t expected = kUnsetLevel;
        level_.compare_exchange_strong(expected, static_cast<uint8_t>(from_env),
                                       std::memory_order_relaxed);
        current = level_.load(std::memory_order_relaxed);
    }
    return static_cast<LogLevel>(current);
}

void Logger::Write(const LogLevel level, const std::string_view component,
                   const std::string_view message) noexcept {
    fprintf(stderr, "[peerquic] %-5s %.*s: %.*s\n",
            LevelToString(level),
            static_cast<int>(component.size()), component.data(),
            static_cast<int>(message.size()), message.data());
    fflush(stderr);
}

LogLevel Logger::ParseLevel(const std::string_view name) noexcept {
    if (name == "error") return LogLevel::Error;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "info") return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    if (name == "trace") return LogLevel::Trace;
    if (name == "off" || name == "none") return LogLevel::Off;
    return LogLevel::Warn;
}

std::string Logger::ToHex(const std::span<const uint8_t> data, const size_t max_bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    std::string result;
    result.reserve(shown * 2 + 3);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (shown < data.size()) {
        result += "...";
    }
    return result;
}

LogLevel Logger::LevelFromEnvironment() noexcept {
    const char* value = std::getenv("PEERQUIC_LOG_LEVEL");
    if (value == nullptr) {
        return LogLevel::Warn;
    }
    return ParseLevel(value);
}

}
