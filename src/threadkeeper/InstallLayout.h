/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INSTALLLAYOUT_H
#define INSTALLLAYOUT_H

#include "threadkeeper_export.h"

#include <QString>

namespace Threadkeeper
{

/**
 * InstallLayout knows where Threadkeeper keeps its files inside a checkout.
 *
 * Layout below the repository root:
 *   .threadkeeper/THREADKEEPER-ENABLED.md        - enable sentinel
 *   .threadkeeper/config/threadkeeperrc          - configuration
 *   .threadkeeper/state/issues/<thread>.json     - mapping records
 *   .threadkeeper/state/sessions/<name>.jsonl    - conversation logs
 */
class THREADKEEPER_EXPORT InstallLayout
{
public:
    explicit InstallLayout(const QString &rootDir = QString());

    QString rootDir() const { return m_rootDir; }

    QString installDir() const;
    QString sentinelPath() const;
    QString configPath() const;
    QString stateDir() const;
    QString issuesDir() const;
    QString sessionsDir() const;

    /**
     * Sessions directory relative to the root (the engine wants it that way)
     */
    static QString sessionsDirRelative();

    /**
     * Path of the mapping record for a thread
     */
    QString mappingPath(const QString &threadId) const;

    /**
     * Convert between absolute paths and paths relative to the root.
     * Relative paths are what gets persisted.
     */
    QString toRelative(const QString &path) const;
    QString toAbsolute(const QString &path) const;

    static QString sentinelFileName();

private:
    QString m_rootDir;
};

} // namespace Threadkeeper

#endif // INSTALLLAYOUT_H
