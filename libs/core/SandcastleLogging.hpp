#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// SANDCASTLE LOGGING CATEGORIES
// =============================================================================

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: init, lifecycle, config
Q_DECLARE_LOGGING_CATEGORY(logSidecar)  // Sidecar: spawn, port discovery, health, server output
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics

// =============================================================================
// ATOMIC THROTTLING SYSTEM
// =============================================================================

namespace sandcastle::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp     = 1;   // Every lifecycle event
    inline constexpr int kSidecar = 1;   // Every sidecar event
    inline constexpr int kDebug   = 10;  // Every 10th debug message
}

// Logs the first call and then every Nth call of the call site.
#define SLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static const int _interval = []() {                                          \
            const char* env = std::getenv("SANDCASTLE_LOG_" #cat "_INTERVAL");      \
            const int n = env ? std::atoi(env) : (defaultInterval);                 \
            return n > 0 ? n : 1;                                                    \
        }();                                                                         \
        if ((_counter.fetch_add(1) % static_cast<uint32_t>(_interval)) == 0) {      \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

#define sLog_App(...)      SLOG_THROTTLED(App, sandcastle::log_throttle::kApp, __VA_ARGS__)
#define sLog_Sidecar(...)  SLOG_THROTTLED(Sidecar, sandcastle::log_throttle::kSidecar, __VA_ARGS__)
#define sLog_Debug(...)    SLOG_THROTTLED(Debug, sandcastle::log_throttle::kDebug, __VA_ARGS__)

#define sLog_DebugN(n, ...) SLOG_THROTTLED(Debug, n, __VA_ARGS__)

// Always-on macros (no throttling for critical messages)
#define sLog_Info(...)     qCInfo(logSidecar).noquote() << __VA_ARGS__
#define sLog_Warning(...)  qCWarning(logSidecar).noquote() << __VA_ARGS__
#define sLog_Error(...)    qCCritical(logApp).noquote() << __VA_ARGS__

// Runtime control:
//   export SANDCASTLE_LOG_Debug_INTERVAL=1         # every debug message
//   export QT_LOGGING_RULES="sandcastle.debug=false"
