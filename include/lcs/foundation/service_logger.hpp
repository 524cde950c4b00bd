#pragma once

/// @file service_logger.hpp
/// @brief ServiceLogger wrapping kcenon logger interfaces for category-based,
///        structured logging in the lobby service.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lcs/foundation/service_result.hpp"
#include "lcs/foundation/types.hpp"

namespace lcs::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, each with its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core         = 0, ///< Process lifecycle, entry point
    Coordinator  = 1, ///< Request validation and routing
    Lobby        = 2, ///< Lobby state machine and membership
    Registry     = 3, ///< Factory and lobby registries
    Session      = 4, ///< Per-connection lobby contexts
    Protocol     = 5, ///< Wire decoding and dispatch
    Provisioning = 6, ///< Room/spawner hand-off
    Config       = 7  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Coordinator", "Lobby", "Registry",
        "Session", "Protocol", "Provisioning", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("debug", "INFO", ...). Returns nullopt if unknown.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.peerId = PeerId(42);
///   ctx.lobbyId = 3;
///   ctx.extra["factory"] = "deathmatch";
///   logger.logWithContext(LogLevel::Info, LogCategory::Coordinator,
///                         "Lobby created", ctx);
/// @endcode
struct LogContext {
    std::optional<PeerId> peerId;
    std::optional<uint32_t> lobbyId;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger forwarding to the kcenon GlobalLoggerRegistry.
///
/// Each category resolves a named logger ("lcs.<Category>") and falls back
/// to the registry's default logger. PIMPL keeps kcenon headers out of the
/// public API.
///
/// Default log levels: Lobby and Session log at Debug, everything else at Info.
class ServiceLogger {
public:
    ServiceLogger();
    ~ServiceLogger();

    ServiceLogger(const ServiceLogger&) = delete;
    ServiceLogger& operator=(const ServiceLogger&) = delete;
    ServiceLogger(ServiceLogger&&) noexcept;
    ServiceLogger& operator=(ServiceLogger&&) noexcept;

    /// Log a message. No-op if the level is below the category's minimum.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one minimum level to every category.
    void setAllCategoryLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    ServiceResult<void> flush();

    /// Process-wide logger used by the LCS_LOG macros.
    static ServiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lcs::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// LCS_MIN_LOG_LEVEL can be defined before including this header to drop
/// calls below the threshold at compile time (0=Trace ... 6=Off).

#ifndef LCS_MIN_LOG_LEVEL
    #define LCS_MIN_LOG_LEVEL 0
#endif

#define LCS_LOG(level, cat, msg)                                                    \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= LCS_MIN_LOG_LEVEL &&                         \
            ::lcs::foundation::ServiceLogger::instance().isEnabled((level), (cat))) \
        {                                                                           \
            ::lcs::foundation::ServiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define LCS_LOG_CTX(level, cat, msg, ctx)                                           \
    do {                                                                            \
        if (static_cast<int>(level) >= LCS_MIN_LOG_LEVEL &&                         \
            ::lcs::foundation::ServiceLogger::instance().isEnabled((level), (cat))) \
        {                                                                           \
            ::lcs::foundation::ServiceLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                      \
        }                                                                           \
    } while (0)

#define LCS_LOG_DEBUG(cat, msg) \
    LCS_LOG(::lcs::foundation::LogLevel::Debug, (cat), (msg))

#define LCS_LOG_INFO(cat, msg) \
    LCS_LOG(::lcs::foundation::LogLevel::Info, (cat), (msg))

#define LCS_LOG_WARN(cat, msg) \
    LCS_LOG(::lcs::foundation::LogLevel::Warning, (cat), (msg))

#define LCS_LOG_ERROR(cat, msg) \
    LCS_LOG(::lcs::foundation::LogLevel::Error, (cat), (msg))
