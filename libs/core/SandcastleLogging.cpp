#include "SandcastleLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "sandcastle.app")          // Application: init, lifecycle, config
Q_LOGGING_CATEGORY(logSidecar, "sandcastle.sidecar")  // Sidecar: spawn, port, health, server output
Q_LOGGING_CATEGORY(logDebug, "sandcastle.debug")      // Debug: detailed diagnostics
