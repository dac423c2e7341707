/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionResolver.h"

#include "MappingRecord.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QRandomGenerator>

namespace Threadkeeper
{

SessionResolver::SessionResolver(const InstallLayout &layout)
    : m_layout(layout)
{
}

SessionResolution SessionResolver::resolve(const QString &threadId) const
{
    SessionResolution resolution;

    const QString mappingFile = m_layout.mappingPath(threadId);
    if (QFileInfo::exists(mappingFile)) {
        bool ok = false;
        const MappingRecord record = MappingRecord::load(mappingFile, &ok);
        const QString logPath = m_layout.toAbsolute(record.logPath);

        if (ok && QFileInfo(logPath).isFile()) {
            qDebug() << "SessionResolver: Found existing session for thread" << threadId << ":" << logPath;
            resolution.logPath = logPath;
            resolution.isNew = false;
            return resolution;
        }

        if (ok) {
            qDebug() << "SessionResolver: Mapped session file missing, starting fresh:" << logPath;
        } else {
            qWarning() << "SessionResolver: Unreadable mapping record, starting fresh:" << mappingFile;
        }
    } else {
        qDebug() << "SessionResolver: No session mapping for thread" << threadId << ", starting fresh";
    }

    resolution.logPath = allocateLogPath();
    resolution.isNew = true;
    return resolution;
}

QString SessionResolver::allocateLogPath() const
{
    const QString dir = m_layout.sessionsDir();
    QDir().mkpath(dir);

    const QString stamp = QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyyMMdd'T'HHmmsszzz"));
    QString path;
    do {
        path = QStringLiteral("%1/%2-%3.jsonl").arg(dir, stamp, generateSuffix());
    } while (QFileInfo::exists(path));

    return path;
}

QString SessionResolver::newestLog(const QDateTime &since) const
{
    QString newestFile;
    QDateTime newestTime;

    QDirIterator it(m_layout.sessionsDir(), {QStringLiteral("*.jsonl")}, QDir::Files);
    while (it.hasNext()) {
        it.next();
        const QDateTime mtime = it.fileInfo().lastModified();
        if (since.isValid() && mtime < since) {
            continue;
        }
        if (!newestTime.isValid() || mtime > newestTime) {
            newestTime = mtime;
            newestFile = it.filePath();
        }
    }

    return newestFile;
}

QString SessionResolver::generateSuffix()
{
    return QStringLiteral("%1").arg(QRandomGenerator::global()->generate(), 8, 16, QLatin1Char('0'));
}

} // namespace Threadkeeper
