#include "KlineLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "klinecore.app")         // Application: lifecycle, options, styles
Q_LOGGING_CATEGORY(logData, "klinecore.data")       // Data: ingestion, live ticks, pagination
Q_LOGGING_CATEGORY(logRender, "klinecore.render")   // Render: visible window, time scale, geometry
Q_LOGGING_CATEGORY(logDebug, "klinecore.debug", QtWarningMsg)  // Debug: off unless enabled by rules
