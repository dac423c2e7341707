/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "InstallLayout.h"

#include <QDir>
#include <QFileInfo>

namespace Threadkeeper
{

InstallLayout::InstallLayout(const QString &rootDir)
    : m_rootDir(QDir::cleanPath(QFileInfo(rootDir.isEmpty() ? QDir::currentPath() : rootDir).absoluteFilePath()))
{
}

QString InstallLayout::installDir() const
{
    return m_rootDir + QStringLiteral("/.threadkeeper");
}

QString InstallLayout::sentinelPath() const
{
    return installDir() + QLatin1Char('/') + sentinelFileName();
}

QString InstallLayout::configPath() const
{
    return installDir() + QStringLiteral("/config/threadkeeperrc");
}

QString InstallLayout::stateDir() const
{
    return installDir() + QStringLiteral("/state");
}

QString InstallLayout::issuesDir() const
{
    return stateDir() + QStringLiteral("/issues");
}

QString InstallLayout::sessionsDir() const
{
    return m_rootDir + QLatin1Char('/') + sessionsDirRelative();
}

QString InstallLayout::sessionsDirRelative()
{
    return QStringLiteral(".threadkeeper/state/sessions");
}

QString InstallLayout::mappingPath(const QString &threadId) const
{
    // Thread ids come from the event payload; keep them from escaping the directory
    QString safeId = threadId;
    safeId.replace(QLatin1Char('/'), QLatin1Char('_'));
    safeId.replace(QLatin1Char('\\'), QLatin1Char('_'));
    if (safeId.startsWith(QLatin1Char('.'))) {
        safeId.prepend(QLatin1Char('_'));
    }
    return issuesDir() + QLatin1Char('/') + safeId + QStringLiteral(".json");
}

QString InstallLayout::toRelative(const QString &path) const
{
    if (path.isEmpty() || QDir::isRelativePath(path)) {
        return path;
    }
    return QDir(m_rootDir).relativeFilePath(path);
}

QString InstallLayout::toAbsolute(const QString &path) const
{
    if (path.isEmpty() || QDir::isAbsolutePath(path)) {
        return path;
    }
    return QDir::cleanPath(QDir(m_rootDir).absoluteFilePath(path));
}

QString InstallLayout::sentinelFileName()
{
    return QStringLiteral("THREADKEEPER-ENABLED.md");
}

} // namespace Threadkeeper
