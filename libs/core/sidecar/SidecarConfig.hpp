#pragma once
#include <QString>
#include <QStringList>
#include "HealthPoller.hpp"
#include "PortAnnouncement.hpp"

class QSettings;

// Runtime settings for the supervisor, read from an INI file.
struct SidecarConfig {
    QString runtimeProgram = QStringLiteral("bun");
    QStringList runtimeArguments = {QStringLiteral("run")};
    QString resourceDir;                                   // empty: search next to the executable
    QString serverBundle = QStringLiteral("binaries/server.js");
    QString announcementKey = QString::fromLatin1(kDefaultAnnouncementKey);
    int spawnTimeoutMs = 3000;
    int portDiscoveryTimeoutMs = 10000;
    // Keep a spawned child alive when discovery or the health check fails,
    // so a slow but healthy server is not killed. stop() cleans it up.
    bool leaveRunningOnPartialFailure = true;
    HealthPolicy health;
    QString backendUrl;                                    // used when no sidecar port is known

    static SidecarConfig load(const QString& iniPath);
    static SidecarConfig load(QSettings& settings);
};
