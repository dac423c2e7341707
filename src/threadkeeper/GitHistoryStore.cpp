/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "GitHistoryStore.h"

#include <QDebug>
#include <QProcess>
#include <QStandardPaths>

namespace Threadkeeper
{

GitHistoryStore::GitHistoryStore(const QString &rootDir, QObject *parent)
    : QObject(parent)
    , m_rootDir(rootDir)
{
}

GitHistoryStore::~GitHistoryStore() = default;

bool GitHistoryStore::isAvailable()
{
    return !QStandardPaths::findExecutable(QStringLiteral("git")).isEmpty();
}

void GitHistoryStore::setAuthor(const QString &name, const QString &email)
{
    m_authorName = name;
    m_authorEmail = email;
}

bool GitHistoryStore::isRejectedPushOutput(const QString &output)
{
    return output.contains(QStringLiteral("[rejected]")) || output.contains(QStringLiteral("non-fast-forward"))
        || output.contains(QStringLiteral("fetch first")) || output.contains(QStringLiteral("[remote rejected]"))
        || output.contains(QStringLiteral("cannot lock ref"));
}

QStringList GitHistoryStore::identityArgs() const
{
    QStringList args;
    if (!m_authorName.isEmpty()) {
        args << QStringLiteral("-c") << QStringLiteral("user.name=%1").arg(m_authorName);
    }
    if (!m_authorEmail.isEmpty()) {
        args << QStringLiteral("-c") << QStringLiteral("user.email=%1").arg(m_authorEmail);
    }
    return args;
}

bool GitHistoryStore::stage(const QStringList &paths)
{
    if (paths.isEmpty()) {
        return true;
    }

    bool ok = false;
    executeCommand(QStringList{QStringLiteral("add"), QStringLiteral("--")} + paths, &ok);
    return ok;
}

bool GitHistoryStore::stageAll()
{
    bool ok = false;
    executeCommand({QStringLiteral("add"), QStringLiteral("-A")}, &ok);
    return ok;
}

bool GitHistoryStore::hasStagedChanges(bool *ok)
{
    bool succeeded = false;
    const QString output = executeCommand({QStringLiteral("diff"), QStringLiteral("--cached"), QStringLiteral("--name-only")}, &succeeded);
    if (ok) {
        *ok = succeeded;
    }
    return succeeded && !output.isEmpty();
}

bool GitHistoryStore::commit(const QString &message)
{
    bool ok = false;
    executeCommand(identityArgs() + QStringList{QStringLiteral("commit"), QStringLiteral("--quiet"), QStringLiteral("-m"), message}, &ok);
    if (ok) {
        qDebug() << "GitHistoryStore: Committed:" << message;
    }
    return ok;
}

HistoryStore::PushStatus GitHistoryStore::push()
{
    bool ok = false;
    QString output;
    executeCommand({QStringLiteral("push"), m_remote, QStringLiteral("HEAD:%1").arg(m_branch)}, &ok, &output);

    if (ok) {
        qInfo() << "GitHistoryStore: Pushed to" << m_remote << m_branch;
        return PushStatus::Pushed;
    }

    if (isRejectedPushOutput(output)) {
        qWarning() << "GitHistoryStore: Push rejected, remote" << m_branch << "has moved";
        return PushStatus::Rejected;
    }
    return PushStatus::Failed;
}

bool GitHistoryStore::rebaseOntoTip()
{
    // During a rebase "theirs" is the commit being replayed, i.e. ours.
    // Edits left out of the commit are stashed around the rebase.
    bool ok = false;
    executeCommand(identityArgs()
                       + QStringList{QStringLiteral("pull"),
                                     QStringLiteral("--rebase"),
                                     QStringLiteral("--autostash"),
                                     QStringLiteral("-X"),
                                     QStringLiteral("theirs"),
                                     QStringLiteral("--quiet"),
                                     m_remote,
                                     m_branch},
                   &ok);
    if (ok) {
        return true;
    }

    const QString pullError = m_lastError;
    bool abortOk = false;
    executeCommand({QStringLiteral("rebase"), QStringLiteral("--abort")}, &abortOk);
    if (!abortOk) {
        qDebug() << "GitHistoryStore: No rebase in progress to abort";
    }
    m_lastError = pullError;
    return false;
}

QString GitHistoryStore::executeCommand(const QStringList &args, bool *ok, QString *combinedOutput)
{
    m_lastError.clear();

    QProcess process;
    process.setWorkingDirectory(m_rootDir);
    process.start(QStringLiteral("git"), args);

    if (!process.waitForStarted(COMMAND_TIMEOUT_MS)) {
        if (ok) *ok = false;
        m_lastError = QStringLiteral("git: %1").arg(process.errorString());
        qWarning() << "GitHistoryStore:" << m_lastError;
        Q_EMIT errorOccurred(m_lastError);
        return QString();
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(COMMAND_TIMEOUT_MS)) {
        process.kill();
        process.waitForFinished();
        if (ok) *ok = false;
        m_lastError = QStringLiteral("git %1 timed out").arg(args.join(QLatin1Char(' ')));
        qWarning() << "GitHistoryStore:" << m_lastError;
        Q_EMIT errorOccurred(m_lastError);
        return QString();
    }

    const QString output = QString::fromUtf8(process.readAllStandardOutput()).trimmed();
    const QString errorOutput = QString::fromUtf8(process.readAllStandardError()).trimmed();
    if (combinedOutput) {
        *combinedOutput = output + QLatin1Char('\n') + errorOutput;
    }

    const bool succeeded = process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
    if (ok) {
        *ok = succeeded;
    }

    if (!succeeded) {
        m_lastError = QStringLiteral("git %1 failed with exit code %2: %3").arg(args.join(QLatin1Char(' '))).arg(process.exitCode()).arg(errorOutput);
        qWarning() << "GitHistoryStore:" << m_lastError;
        Q_EMIT errorOccurred(m_lastError);
    }

    return output;
}

} // namespace Threadkeeper

#include "moc_GitHistoryStore.cpp"
