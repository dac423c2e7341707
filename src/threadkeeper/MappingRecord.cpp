/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "MappingRecord.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

namespace Threadkeeper
{

QJsonObject MappingRecord::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("threadId")] = threadId;
    obj[QStringLiteral("logPath")] = logPath;
    obj[QStringLiteral("updatedAt")] = updatedAt.toUTC().toString(Qt::ISODateWithMs);
    return obj;
}

MappingRecord MappingRecord::fromJson(const QJsonObject &obj)
{
    MappingRecord record;

    // Thread ids are numbers on the wire but strings everywhere else
    const QJsonValue id = obj.value(QStringLiteral("threadId"));
    record.threadId = id.isDouble() ? QString::number(id.toInteger()) : id.toString();
    record.logPath = obj.value(QStringLiteral("logPath")).toString();
    record.updatedAt = QDateTime::fromString(obj.value(QStringLiteral("updatedAt")).toString(), Qt::ISODateWithMs);
    return record;
}

QByteArray MappingRecord::toFileContent() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
}

MappingRecord MappingRecord::load(const QString &filePath, bool *ok)
{
    if (ok) {
        *ok = false;
    }

    QFile file(filePath);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        return MappingRecord();
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return MappingRecord();
    }

    MappingRecord record = fromJson(doc.object());
    if (ok) {
        *ok = record.isValid();
    }
    return record;
}

bool MappingRecord::save(const QString &filePath, QString *errorString) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorString) {
            *errorString = file.errorString();
        }
        return false;
    }

    file.write(toFileContent());
    if (!file.commit()) {
        if (errorString) {
            *errorString = file.errorString();
        }
        return false;
    }
    return true;
}

} // namespace Threadkeeper
