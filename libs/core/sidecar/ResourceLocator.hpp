#pragma once
#include <optional>
#include <QString>
#include <QStringList>

/**
 * Finds the server bundle and the runtime that executes it.
 * The bundle is searched, in order, under the configured resource directory,
 * <appDir>/resources, <appDir>/../Resources, <appDir> and the working directory.
 */
class ResourceLocator {
public:
    ResourceLocator(QString resourceDir, QString bundlePath);

    QStringList candidates() const;
    std::optional<QString> locateBundle() const;
    QString describeMissing() const;

    // Bundled runtime next to the executable wins over PATH.
    static QString resolveRuntime(const QString& program);

private:
    QString m_resourceDir;
    QString m_bundlePath;
};
