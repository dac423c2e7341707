/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STATECOMMITTER_H
#define STATECOMMITTER_H

#include "threadkeeper_export.h"

#include "InstallLayout.h"
#include "MappingRecord.h"

#include <QObject>
#include <QString>

#include <functional>

namespace Threadkeeper
{

class HistoryStore;

struct THREADKEEPER_EXPORT CommitPolicy {
    int maxAttempts = 3;
    int backoffMs = 500;        // doubled per retry
    int backoffCapMs = 4000;
    bool commitAllChanges = true;
};

struct THREADKEEPER_EXPORT CommitResult {
    bool committed = false;
    int attempts = 0;
    QString errorString;
};

/**
 * StateCommitter makes a run's conversation state durable.
 *
 * Each attempt rewrites the mapping record, stages it together with the
 * conversation log, commits and pushes. When the push loses against a
 * concurrent run the local commit is rebased onto the new tip and the
 * attempt repeats; the record is rewritten every time so this run's
 * version ends up on top.
 *
 * A record is only written next to a log that exists; the two always land
 * in the same commit.
 */
class THREADKEEPER_EXPORT StateCommitter : public QObject
{
    Q_OBJECT

public:
    StateCommitter(const InstallLayout &layout, HistoryStore *store, const CommitPolicy &policy = CommitPolicy(), QObject *parent = nullptr);
    ~StateCommitter() override;

    const CommitPolicy &policy() const { return m_policy; }

    /**
     * @param logPath Absolute path of the conversation log
     * @param mappingUpdate Record to persist for the thread
     */
    CommitResult commit(const QString &threadId, const QString &logPath, const MappingRecord &mappingUpdate);

    /**
     * Remove the thread's mapping record so its next run starts a new
     * conversation. The log itself stays in the history.
     */
    CommitResult clear(const QString &threadId);

    /**
     * Delay before retry number @p attempt (1-based)
     */
    static int backoffFor(int attempt, int baseMs, int capMs);

    static QString commitMessage(const QString &threadId);
    static QString clearMessage(const QString &threadId);

Q_SIGNALS:
    void attemptFailed(int attempt, const QString &reason);

private:
    using Prepare = std::function<bool(QString *errorString)>;

    CommitResult runAttempts(const QString &threadId, const QString &message, const Prepare &prepare);
    bool writeAndStage(const QString &threadId, const QString &logPath, const MappingRecord &record, QString *errorString);
    bool removeAndStage(const QString &threadId, QString *errorString);

    InstallLayout m_layout;
    HistoryStore *m_store;
    CommitPolicy m_policy;
};

} // namespace Threadkeeper

#endif // STATECOMMITTER_H
