/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONRESOLVER_H
#define SESSIONRESOLVER_H

#include "threadkeeper_export.h"

#include "InstallLayout.h"

#include <QDateTime>
#include <QString>

namespace Threadkeeper
{

/**
 * Which conversation log a run uses and whether it continues one
 */
struct THREADKEEPER_EXPORT SessionResolution {
    QString logPath;    // absolute
    bool isNew = true;
};

/**
 * SessionResolver maps a thread to its conversation log.
 *
 * A thread whose mapping record points at an existing log resumes that log.
 * Anything else (no record, unreadable record, log gone) starts a new log;
 * a lost log is treated as "never had one", not as an error.
 */
class THREADKEEPER_EXPORT SessionResolver
{
public:
    explicit SessionResolver(const InstallLayout &layout);

    const InstallLayout &layout() const { return m_layout; }

    SessionResolution resolve(const QString &threadId) const;

    /**
     * Allocate a log path that does not exist yet:
     * sessions/<yyyyMMddTHHmmsszzz>-<8 hex>.jsonl
     */
    QString allocateLogPath() const;

    /**
     * Newest conversation log modified at or after since, empty if none
     */
    QString newestLog(const QDateTime &since = QDateTime()) const;

    /**
     * Random 8 character hex suffix
     */
    static QString generateSuffix();

private:
    InstallLayout m_layout;
};

} // namespace Threadkeeper

#endif // SESSIONRESOLVER_H
