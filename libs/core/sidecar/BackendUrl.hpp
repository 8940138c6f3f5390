#pragma once
#include <optional>
#include <QString>
#include <QUrl>
#include "SidecarTypes.hpp"

// Port the bundled server listens on when it cannot report one.
inline constexpr Port kDefaultSidecarPort = 31822;

QUrl backendUrlForPort(Port port, const QString& host = QStringLiteral("localhost"));

// Sidecar port first, then the configured URL, then the default sidecar port.
QUrl resolveBackendUrl(std::optional<Port> sidecarPort, const QString& configuredUrl);
