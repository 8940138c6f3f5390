#include "ResourceLocator.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

ResourceLocator::ResourceLocator(QString resourceDir, QString bundlePath)
    : m_resourceDir(std::move(resourceDir))
    , m_bundlePath(std::move(bundlePath))
{
}

QStringList ResourceLocator::candidates() const {
    if (QDir::isAbsolutePath(m_bundlePath))
        return {QDir::cleanPath(m_bundlePath)};

    QStringList roots;
    if (!m_resourceDir.isEmpty())
        roots << m_resourceDir;

    const QString appDir = QCoreApplication::applicationDirPath();
    if (!appDir.isEmpty()) {
        QDir dir(appDir);
        roots << dir.absoluteFilePath(QStringLiteral("resources"));
        roots << dir.absoluteFilePath(QStringLiteral("../Resources"));  // macOS bundle layout
        roots << appDir;
    }
    roots << QDir::currentPath();

    QStringList paths;
    for (const QString& root : roots) {
        const QString path = QDir::cleanPath(QDir(root).absoluteFilePath(m_bundlePath));
        if (!paths.contains(path))
            paths << path;
    }
    return paths;
}

std::optional<QString> ResourceLocator::locateBundle() const {
    for (const QString& path : candidates()) {
        if (QFileInfo(path).isFile())
            return path;
    }
    return std::nullopt;
}

QString ResourceLocator::describeMissing() const {
    const QStringList paths = candidates();
    return QStringLiteral("Server bundle not found at: %1")
        .arg(paths.isEmpty() ? m_bundlePath : paths.join(QStringLiteral(", ")));
}

QString ResourceLocator::resolveRuntime(const QString& program) {
    if (program.isEmpty() || QDir::isAbsolutePath(program))
        return program;

    const QString appDir = QCoreApplication::applicationDirPath();
    if (!appDir.isEmpty()) {
        const QFileInfo bundled(QDir(appDir).absoluteFilePath(program));
        if (bundled.isFile() && bundled.isExecutable())
            return bundled.absoluteFilePath();
    }

    const QString onPath = QStandardPaths::findExecutable(program);
    return onPath.isEmpty() ? program : onPath;
}
