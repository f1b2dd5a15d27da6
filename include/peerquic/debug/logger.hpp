#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide diagnostic logging for the transport.
 *
 * Messages go to stderr, one line each, prefixed with the level and the
 * component that emitted them. The threshold is read once from the
 * PEERQUIC_LOG_LEVEL environment variable (off, error, warn, info, debug,
 * trace) and can be changed at runtime with Logger::SetLevel.
 *
 * Key material must never be passed to these macros.
 */

#include <fmt/core.h>

#include <atomic>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace peerquic::debug {

enum class LogLevel : uint8_t {
    Off = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4,
    Trace = 5
};

class Logger {
public:
    static void SetLevel(LogLevel level) noexcept;

    [[nodiscard]] static LogLevel GetLevel() noexcept;

    [[nodiscard]] static bool IsEnabled(LogLevel level) noexcept {
        return level != LogLevel::Off &&
               static_cast<uint8_t>(level) <= static_cast<uint8_t>(GetLevel());
    }

    static void Write(LogLevel level, std::string_view component, std::string_view message) noexcept;

    [[nodiscard]] static LogLevel ParseLevel(std::string_view name) noexcept;

    [[nodiscard]] static std::string ToHex(std::span<const uint8_t> data, size_t max_bytes = 16);

private:
    static LogLevel LevelFromEnvironment() noexcept;

    static inline std::atomic<uint8_t> level_{0xFF};

    Logger() = delete;
};

}

// ============================================================================
// Logging macros
// ============================================================================

#define PEERQUIC_LOG(level, component, ...) \
    do { \
        if (::peerquic::debug::Logger::IsEnabled(level)) { \
            ::peerquic::debug::Logger::Write(level, component, ::fmt::format(__VA_ARGS__)); \
        } \
    } while(0)

#define PEERQUIC_LOG_ERROR(component, ...) PEERQUIC_LOG(::peerquic::debug::LogLevel::Error, component, __VA_ARGS__)
#define PEERQUIC_LOG_WARN(component, ...) PEERQUIC_LOG(::peerquic::debug::LogLevel::Warn, component, __VA_ARGS__)
#define PEERQUIC_LOG_INFO(component, ...) PEERQUIC_LOG(::peerquic::debug::LogLevel::Info, component, __VA_ARGS__)
#define PEERQUIC_LOG_DEBUG(component, ...) PEERQUIC_LOG(::peerquic::debug::LogLevel::Debug, component, __VA_ARGS__)
#define PEERQUIC_LOG_TRACE(component, ...) PEERQUIC_LOG(::peerquic::debug::LogLevel::Trace, component, __VA_ARGS__)
