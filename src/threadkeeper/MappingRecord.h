/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef MAPPINGRECORD_H
#define MAPPINGRECORD_H

#include "threadkeeper_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

namespace Threadkeeper
{

/**
 * MappingRecord points a thread at its conversation log.
 *
 * One record per thread, stored as .threadkeeper/state/issues/<thread>.json.
 * The record is always replaced as a whole, never edited in place.
 * logPath is relative to the repository root.
 */
class THREADKEEPER_EXPORT MappingRecord
{
public:
    MappingRecord() = default;

    QString threadId;
    QString logPath;
    QDateTime updatedAt;

    bool isValid() const
    {
        return !threadId.isEmpty() && !logPath.isEmpty();
    }

    QJsonObject toJson() const;
    static MappingRecord fromJson(const QJsonObject &obj);

    /**
     * Serialized file content (indented JSON with trailing newline)
     */
    QByteArray toFileContent() const;

    /**
     * Load a record from disk.
     *
     * @param ok Set to false when the file is missing, unreadable or invalid
     */
    static MappingRecord load(const QString &filePath, bool *ok = nullptr);

    /**
     * Atomically replace the record on disk
     */
    bool save(const QString &filePath, QString *errorString = nullptr) const;

    bool operator==(const MappingRecord &other) const
    {
        return threadId == other.threadId && logPath == other.logPath && updatedAt == other.updatedAt;
    }
};

} // namespace Threadkeeper

#endif // MAPPINGRECORD_H
