/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef GHPLATFORMCLIENT_H
#define GHPLATFORMCLIENT_H

#include "threadkeeper_export.h"

#include "PlatformClient.h"

#include <QObject>
#include <QStringList>

namespace Threadkeeper
{

/**
 * GhPlatformClient talks to GitHub through the gh CLI.
 *
 * gh picks up its token from GH_TOKEN/GITHUB_TOKEN, which the CI job
 * provides. Each call runs one gh process and waits for it.
 */
class THREADKEEPER_EXPORT GhPlatformClient : public QObject, public PlatformClient
{
    Q_OBJECT

public:
    explicit GhPlatformClient(const QString &repository, QObject *parent = nullptr);
    ~GhPlatformClient() override;

    /**
     * Check if gh is available on the system
     */
    static bool isAvailable();

    QString repository() const { return m_repository; }

    ThreadContent fetchThread(const QString &threadId, bool *ok = nullptr) override;
    QString actorPermission(const QString &actor, bool *ok = nullptr) override;
    QString addReaction(const EventRef &target, const QString &content) override;
    bool removeReaction(const EventRef &target, const QString &reactionId) override;
    bool postComment(const QString &threadId, const QString &body) override;

    /**
     * REST endpoint for the reactions of a thread or comment
     */
    static QString reactionsEndpoint(const QString &repository, const EventRef &target);

Q_SIGNALS:
    /**
     * Emitted when a gh invocation fails
     */
    void errorOccurred(const QString &message);

private:
    /**
     * Execute a gh command and return its trimmed output
     */
    QString executeCommand(const QStringList &args, bool *ok = nullptr, const QByteArray &input = QByteArray());

    QString m_repository;
    static constexpr int COMMAND_TIMEOUT_MS = 30000;
};

} // namespace Threadkeeper

#endif // GHPLATFORMCLIENT_H
