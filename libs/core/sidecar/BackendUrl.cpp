#include "BackendUrl.hpp"
#include "SandcastleLogging.hpp"

QUrl backendUrlForPort(Port port, const QString& host) {
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(host);
    url.setPort(port);
    return url;
}

QUrl resolveBackendUrl(std::optional<Port> sidecarPort, const QString& configuredUrl) {
    if (sidecarPort)
        return backendUrlForPort(*sidecarPort);

    if (!configuredUrl.trimmed().isEmpty()) {
        const QUrl configured(configuredUrl.trimmed(), QUrl::StrictMode);
        if (configured.isValid() && !configured.host().isEmpty())
            return configured;
        sLog_Warning("Ignoring invalid backend url" << configuredUrl);
    }

    sLog_Warning("Sidecar port unavailable, falling back to default port" << kDefaultSidecarPort);
    return backendUrlForPort(kDefaultSidecarPort);
}
