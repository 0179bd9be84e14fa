#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// KLINECORE LOGGING CATEGORIES
// =============================================================================
// Four categories, each with an atomic per-call-site throttle for hot paths.

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: lifecycle, options, styles
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: ingestion, live ticks, pagination
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: visible window, time scale, mark geometry
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING
// =============================================================================

namespace klinecore::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // Every app event
    inline constexpr int kData   = 20;   // Every 20th data operation
    inline constexpr int kRender = 100;  // Every 100th render operation
    inline constexpr int kDebug  = 10;   // Every 10th debug message
}

// First call always logs, then every Nth.
#define KLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static const uint32_t _interval = []() {                                     \
            const char* env = std::getenv("KLINECORE_LOG_" #cat "_INTERVAL");        \
            const int value = env ? std::atoi(env) : (defaultInterval);              \
            return static_cast<uint32_t>(value > 0 ? value : 1);                     \
        }();                                                                         \
        if ((_counter.fetch_add(1, std::memory_order_relaxed) % _interval) == 0) {   \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

// Throttled per category
#define kLog_App(...)     KLOG_THROTTLED(App, klinecore::log_throttle::kApp, __VA_ARGS__)
#define kLog_Data(...)    KLOG_THROTTLED(Data, klinecore::log_throttle::kData, __VA_ARGS__)
#define kLog_Render(...)  KLOG_THROTTLED(Render, klinecore::log_throttle::kRender, __VA_ARGS__)
#define kLog_Debug(...)   KLOG_THROTTLED(Debug, klinecore::log_throttle::kDebug, __VA_ARGS__)

// Always on
#define kLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__

/*
USAGE:
kLog_App("Chart created, locale" << locale);
kLog_Data("Live bar appended at" << timestamp);
kLog_Warning("Unknown timezone" << id << "ignored");

RUNTIME CONTROL:
export KLINECORE_LOG_Data_INTERVAL=1        # every data line
export QT_LOGGING_RULES="klinecore.*.debug=true"
*/
