#include "SidecarError.hpp"

QString toString(SidecarErrorKind kind) {
    switch (kind) {
        case SidecarErrorKind::ResourceMissing:      return QStringLiteral("ResourceMissing");
        case SidecarErrorKind::SpawnFailed:          return QStringLiteral("SpawnFailed");
        case SidecarErrorKind::PortDiscoveryTimeout: return QStringLiteral("PortDiscoveryTimeout");
        case SidecarErrorKind::PortDiscoveryFailed:  return QStringLiteral("PortDiscoveryFailed");
        case SidecarErrorKind::HealthCheckFailed:    return QStringLiteral("HealthCheckFailed");
        case SidecarErrorKind::StopFailed:           return QStringLiteral("StopFailed");
        case SidecarErrorKind::PortUnknown:          return QStringLiteral("PortUnknown");
    }
    return QStringLiteral("Unknown");
}

SidecarError::SidecarError(SidecarErrorKind kind, QString message)
    : m_kind(kind)
    , m_message(std::move(message))
    , m_what(QStringLiteral("%1: %2").arg(toString(kind), m_message).toUtf8())
{
}
