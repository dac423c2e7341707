/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "GhPlatformClient.h"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>
#include <QStandardPaths>

namespace Threadkeeper
{

GhPlatformClient::GhPlatformClient(const QString &repository, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
{
}

GhPlatformClient::~GhPlatformClient() = default;

bool GhPlatformClient::isAvailable()
{
    return !QStandardPaths::findExecutable(QStringLiteral("gh")).isEmpty();
}

QString GhPlatformClient::reactionsEndpoint(const QString &repository, const EventRef &target)
{
    if (target.isComment()) {
        return QStringLiteral("repos/%1/issues/comments/%2/reactions").arg(repository).arg(target.commentId);
    }
    return QStringLiteral("repos/%1/issues/%2/reactions").arg(repository, target.threadId);
}

ThreadContent GhPlatformClient::fetchThread(const QString &threadId, bool *ok)
{
    bool cmdOk = false;
    const QString output = executeCommand({QStringLiteral("issue"),
                                           QStringLiteral("view"),
                                           threadId,
                                           QStringLiteral("--repo"),
                                           m_repository,
                                           QStringLiteral("--json"),
                                           QStringLiteral("title,body")},
                                          &cmdOk);

    ThreadContent content;
    const QJsonDocument doc = QJsonDocument::fromJson(output.toUtf8());
    if (cmdOk && doc.isObject()) {
        content.title = doc.object().value(QStringLiteral("title")).toString();
        content.body = doc.object().value(QStringLiteral("body")).toString();
    } else {
        cmdOk = false;
    }

    if (ok) {
        *ok = cmdOk;
    }
    return content;
}

QString GhPlatformClient::actorPermission(const QString &actor, bool *ok)
{
    bool cmdOk = false;
    const QString output =
        executeCommand({QStringLiteral("api"), QStringLiteral("repos/%1/collaborators/%2/permission").arg(m_repository, actor)}, &cmdOk);

    QString permission;
    const QJsonDocument doc = QJsonDocument::fromJson(output.toUtf8());
    if (cmdOk && doc.isObject()) {
        // role_name distinguishes maintain/triage; permission only knows admin/write/read/none
        permission = doc.object().value(QStringLiteral("role_name")).toString();
        if (permission.isEmpty()) {
            permission = doc.object().value(QStringLiteral("permission")).toString();
        }
    }
    if (permission.isEmpty()) {
        cmdOk = false;
        permission = QStringLiteral("none");
    }

    if (ok) {
        *ok = cmdOk;
    }
    return permission;
}

QString GhPlatformClient::addReaction(const EventRef &target, const QString &content)
{
    bool ok = false;
    const QString id = executeCommand({QStringLiteral("api"),
                                       reactionsEndpoint(m_repository, target),
                                       QStringLiteral("-f"),
                                       QStringLiteral("content=%1").arg(content),
                                       QStringLiteral("--jq"),
                                       QStringLiteral(".id")},
                                      &ok);
    return ok ? id : QString();
}

bool GhPlatformClient::removeReaction(const EventRef &target, const QString &reactionId)
{
    if (reactionId.isEmpty()) {
        return false;
    }

    bool ok = false;
    executeCommand({QStringLiteral("api"),
                    reactionsEndpoint(m_repository, target) + QLatin1Char('/') + reactionId,
                    QStringLiteral("-X"),
                    QStringLiteral("DELETE")},
                   &ok);
    return ok;
}

bool GhPlatformClient::postComment(const QString &threadId, const QString &body)
{
    // Body goes through stdin: a 60k character reply can exceed the kernel's per-argument limit
    bool ok = false;
    executeCommand({QStringLiteral("issue"),
                    QStringLiteral("comment"),
                    threadId,
                    QStringLiteral("--repo"),
                    m_repository,
                    QStringLiteral("--body-file"),
                    QStringLiteral("-")},
                   &ok,
                   body.toUtf8());
    return ok;
}

QString GhPlatformClient::executeCommand(const QStringList &args, bool *ok, const QByteArray &input)
{
    QProcess process;
    process.start(QStringLiteral("gh"), args);

    if (!process.waitForStarted(COMMAND_TIMEOUT_MS)) {
        if (ok) *ok = false;
        const QString message = QStringLiteral("gh %1: %2").arg(args.value(0), process.errorString());
        qWarning() << "GhPlatformClient:" << message;
        Q_EMIT errorOccurred(message);
        return QString();
    }

    if (!input.isEmpty()) {
        process.write(input);
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(COMMAND_TIMEOUT_MS)) {
        process.kill();
        process.waitForFinished();
        if (ok) *ok = false;
        const QString message = QStringLiteral("gh %1 timed out").arg(args.value(0));
        qWarning() << "GhPlatformClient:" << message;
        Q_EMIT errorOccurred(message);
        return QString();
    }

    const bool succeeded = process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
    if (ok) {
        *ok = succeeded;
    }

    if (!succeeded) {
        const QString errorOutput = QString::fromUtf8(process.readAllStandardError()).trimmed();
        const QString message = QStringLiteral("gh %1 failed with exit code %2: %3").arg(args.value(0)).arg(process.exitCode()).arg(errorOutput);
        qWarning() << "GhPlatformClient:" << message;
        Q_EMIT errorOccurred(message);
    }

    return QString::fromUtf8(process.readAllStandardOutput()).trimmed();
}

} // namespace Threadkeeper

#include "moc_GhPlatformClient.cpp"
