/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef GITHISTORYSTORE_H
#define GITHISTORYSTORE_H

#include "threadkeeper_export.h"

#include "HistoryStore.h"

#include <QObject>
#include <QStringList>

namespace Threadkeeper
{

/**
 * GitHistoryStore commits and pushes through the git CLI.
 *
 * All commands run in the repository root. The author identity is passed
 * per command with -c so the job's global git config stays untouched.
 */
class THREADKEEPER_EXPORT GitHistoryStore : public QObject, public HistoryStore
{
    Q_OBJECT

public:
    explicit GitHistoryStore(const QString &rootDir, QObject *parent = nullptr);
    ~GitHistoryStore() override;

    /**
     * Check if git is available on the system
     */
    static bool isAvailable();

    QString rootDir() const { return m_rootDir; }

    void setRemote(const QString &remote) { m_remote = remote; }
    QString remote() const { return m_remote; }

    void setBranch(const QString &branch) { m_branch = branch; }
    QString branch() const { return m_branch; }

    void setAuthor(const QString &name, const QString &email);

    bool stage(const QStringList &paths) override;
    bool stageAll() override;
    bool hasStagedChanges(bool *ok = nullptr) override;
    bool commit(const QString &message) override;
    PushStatus push() override;
    bool rebaseOntoTip() override;
    QString lastError() const override { return m_lastError; }

    /**
     * Whether git push output means the remote tip moved
     */
    static bool isRejectedPushOutput(const QString &output);

Q_SIGNALS:
    void errorOccurred(const QString &message);

private:
    /**
     * Execute a git command and return its trimmed stdout.
     *
     * @param combinedOutput Receives stdout and stderr together
     */
    QString executeCommand(const QStringList &args, bool *ok = nullptr, QString *combinedOutput = nullptr);

    QStringList identityArgs() const;

    QString m_rootDir;
    QString m_remote = QStringLiteral("origin");
    QString m_branch = QStringLiteral("main");
    QString m_authorName;
    QString m_authorEmail;
    QString m_lastError;

    static constexpr int COMMAND_TIMEOUT_MS = 120000;
};

} // namespace Threadkeeper

#endif // GITHISTORYSTORE_H
