#include "SidecarConfig.hpp"
#include "SandcastleLogging.hpp"
#include <QFileInfo>
#include <QSettings>

namespace {

int positiveInt(const QSettings& settings, const QString& key, int fallback) {
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok || value <= 0) {
        sLog_Warning(QStringLiteral("Ignoring invalid %1=%2, using %3")
                         .arg(key, settings.value(key).toString()).arg(fallback));
        return fallback;
    }
    return value;
}

} // namespace

SidecarConfig SidecarConfig::load(const QString& iniPath) {
    if (!QFileInfo::exists(iniPath))
        sLog_App("No config at" << iniPath << "- using sidecar defaults");
    QSettings settings(iniPath, QSettings::IniFormat);
    return load(settings);
}

SidecarConfig SidecarConfig::load(QSettings& settings) {
    SidecarConfig config;

    settings.beginGroup(QStringLiteral("sidecar"));
    config.runtimeProgram = settings.value(QStringLiteral("runtime"), config.runtimeProgram).toString();
    if (settings.contains(QStringLiteral("runtime_args"))) {
        // "runtime_args=" means no arguments, not one empty argument.
        QStringList arguments;
        for (const QString& argument : settings.value(QStringLiteral("runtime_args")).toStringList()) {
            const QString trimmed = argument.trimmed();
            if (!trimmed.isEmpty())
                arguments << trimmed;
        }
        config.runtimeArguments = arguments;
    }
    config.resourceDir = settings.value(QStringLiteral("resource_dir"), config.resourceDir).toString();
    config.serverBundle = settings.value(QStringLiteral("bundle"), config.serverBundle).toString();
    config.announcementKey = settings.value(QStringLiteral("announcement_key"), config.announcementKey).toString();
    config.spawnTimeoutMs = positiveInt(settings, QStringLiteral("spawn_timeout_ms"), config.spawnTimeoutMs);
    config.portDiscoveryTimeoutMs = positiveInt(settings, QStringLiteral("port_timeout_ms"), config.portDiscoveryTimeoutMs);
    config.leaveRunningOnPartialFailure =
        settings.value(QStringLiteral("leave_running_on_failure"), config.leaveRunningOnPartialFailure).toBool();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("health"));
    config.health.host = settings.value(QStringLiteral("host"), config.health.host).toString();
    config.health.path = settings.value(QStringLiteral("path"), config.health.path).toString();
    if (!config.health.path.startsWith(u'/'))
        config.health.path.prepend(u'/');
    config.health.maxAttempts = positiveInt(settings, QStringLiteral("max_attempts"), config.health.maxAttempts);
    config.health.retryIntervalMs = positiveInt(settings, QStringLiteral("retry_interval_ms"), config.health.retryIntervalMs);
    config.health.requestTimeoutMs = positiveInt(settings, QStringLiteral("request_timeout_ms"), config.health.requestTimeoutMs);
    settings.endGroup();

    config.backendUrl = settings.value(QStringLiteral("backend/url"), config.backendUrl).toString();

    if (config.announcementKey.isEmpty()) {
        sLog_Warning("Empty announcement_key, using" << kDefaultAnnouncementKey);
        config.announcementKey = QString::fromLatin1(kDefaultAnnouncementKey);
    }
    return config;
}
