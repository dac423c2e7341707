/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "StateCommitter.h"

#include "HistoryStore.h"

#include <KLocalizedString>

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QThread>

namespace Threadkeeper
{

StateCommitter::StateCommitter(const InstallLayout &layout, HistoryStore *store, const CommitPolicy &policy, QObject *parent)
    : QObject(parent)
    , m_layout(layout)
    , m_store(store)
    , m_policy(policy)
{
}

StateCommitter::~StateCommitter() = default;

int StateCommitter::backoffFor(int attempt, int baseMs, int capMs)
{
    if (baseMs <= 0 || attempt < 1) {
        return 0;
    }

    qint64 delay = baseMs;
    for (int i = 1; i < attempt && delay < capMs; ++i) {
        delay *= 2;
    }
    return static_cast<int>(qMin<qint64>(delay, capMs));
}

QString StateCommitter::commitMessage(const QString &threadId)
{
    return QStringLiteral("threadkeeper: conversation state for issue #%1").arg(threadId);
}

QString StateCommitter::clearMessage(const QString &threadId)
{
    return QStringLiteral("threadkeeper: reset conversation for issue #%1").arg(threadId);
}

bool StateCommitter::writeAndStage(const QString &threadId, const QString &logPath, const MappingRecord &record, QString *errorString)
{
    // A record must never point at a log the commit does not carry
    if (logPath.isEmpty() || !QFileInfo::exists(logPath)) {
        if (errorString) *errorString = i18n("Conversation log %1 does not exist", logPath.isEmpty() ? QStringLiteral("<none>") : logPath);
        return false;
    }

    const QString mappingFile = m_layout.mappingPath(threadId);
    if (!record.save(mappingFile, errorString)) {
        return false;
    }

    if (!m_store->stage({logPath, mappingFile})) {
        if (errorString) *errorString = m_store->lastError();
        return false;
    }
    if (m_policy.commitAllChanges && !m_store->stageAll()) {
        if (errorString) *errorString = m_store->lastError();
        return false;
    }
    return true;
}

bool StateCommitter::removeAndStage(const QString &threadId, QString *errorString)
{
    const QString mappingFile = m_layout.mappingPath(threadId);
    if (!QFileInfo::exists(mappingFile)) {
        return true;
    }

    if (!QFile::remove(mappingFile)) {
        if (errorString) *errorString = i18n("Cannot remove %1", mappingFile);
        return false;
    }
    if (!m_store->stage({mappingFile})) {
        if (errorString) *errorString = m_store->lastError();
        return false;
    }
    return true;
}

CommitResult StateCommitter::commit(const QString &threadId, const QString &logPath, const MappingRecord &mappingUpdate)
{
    return runAttempts(threadId, commitMessage(threadId), [&](QString *errorString) {
        return writeAndStage(threadId, logPath, mappingUpdate, errorString);
    });
}

CommitResult StateCommitter::clear(const QString &threadId)
{
    return runAttempts(threadId, clearMessage(threadId), [&](QString *errorString) {
        return removeAndStage(threadId, errorString);
    });
}

CommitResult StateCommitter::runAttempts(const QString &threadId, const QString &message, const Prepare &prepare)
{
    CommitResult result;

    if (!m_store) {
        result.errorString = QStringLiteral("No history store");
        return result;
    }

    const int maxAttempts = qMax(1, m_policy.maxAttempts);
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        result.attempts = attempt;

        QString error;
        if (!prepare(&error)) {
            result.errorString = error;
            qCritical() << "StateCommitter: Cannot prepare commit:" << error;
            return result;
        }

        bool inspected = false;
        const bool staged = m_store->hasStagedChanges(&inspected);
        if (!inspected) {
            result.errorString = m_store->lastError();
            qCritical() << "StateCommitter: Cannot inspect staged changes:" << result.errorString;
            return result;
        }
        if (staged && !m_store->commit(message)) {
            result.errorString = m_store->lastError();
            qCritical() << "StateCommitter: Commit failed:" << result.errorString;
            return result;
        }

        const HistoryStore::PushStatus status = m_store->push();
        if (status == HistoryStore::PushStatus::Pushed) {
            result.committed = true;
            result.errorString.clear();
            qInfo() << "StateCommitter: State for thread" << threadId << "pushed after" << attempt << "attempt(s)";
            return result;
        }

        result.errorString = status == HistoryStore::PushStatus::Rejected ? QStringLiteral("Push rejected: remote tip moved")
                                                                          : QStringLiteral("Push failed: %1").arg(m_store->lastError());
        qWarning() << "StateCommitter: Attempt" << attempt << "of" << maxAttempts << "-" << result.errorString;
        Q_EMIT attemptFailed(attempt, result.errorString);

        if (attempt == maxAttempts) {
            break;
        }

        if (!m_store->rebaseOntoTip()) {
            qWarning() << "StateCommitter: Rebase onto remote tip failed:" << m_store->lastError();
        }

        const int delay = backoffFor(attempt, m_policy.backoffMs, m_policy.backoffCapMs);
        if (delay > 0) {
            QThread::msleep(static_cast<unsigned long>(delay));
        }
    }

    qCritical() << "StateCommitter: Giving up after" << result.attempts << "attempts:" << result.errorString;
    return result;
}

} // namespace Threadkeeper

#include "moc_StateCommitter.cpp"
