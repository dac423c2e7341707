/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKECOLLABORATORS_H
#define FAKECOLLABORATORS_H

#include <QFile>
#include <QFileInfo>
#include <QList>
#include <QString>
#include <QStringList>

#include "../threadkeeper/AgentDriver.h"
#include "../threadkeeper/HistoryStore.h"
#include "../threadkeeper/PlatformClient.h"

namespace Threadkeeper
{

/**
 * Records every platform call in order ("fetch", "permission", "add", "remove", "post")
 */
class FakePlatformClient : public PlatformClient
{
public:
    ThreadContent fetchThread(const QString &threadId, bool *ok = nullptr) override
    {
        calls << QStringLiteral("fetch");
        fetchedThreads << threadId;
        if (ok) *ok = fetchSucceeds;
        return fetchSucceeds ? thread : ThreadContent();
    }

    QString actorPermission(const QString &actor, bool *ok = nullptr) override
    {
        calls << QStringLiteral("permission");
        permissionQueries << actor;
        if (ok) *ok = true;
        return permission;
    }

    QString addReaction(const EventRef &target, const QString &content) override
    {
        calls << QStringLiteral("add");
        reactionTargets << target.commentId;
        reactionContents << content;
        return addSucceeds ? QStringLiteral("4242") : QString();
    }

    bool removeReaction(const EventRef &target, const QString &reactionId) override
    {
        Q_UNUSED(target)
        calls << QStringLiteral("remove");
        removedReactions << reactionId;
        return removeSucceeds;
    }

    bool postComment(const QString &threadId, const QString &body) override
    {
        calls << QStringLiteral("post");
        postedThreads << threadId;
        postedBodies << body;
        return postSucceeds;
    }

    int count(const QString &call) const { return calls.count(call); }

    // Behaviour
    ThreadContent thread;
    QString permission = QStringLiteral("write");
    bool fetchSucceeds = true;
    bool addSucceeds = true;
    bool removeSucceeds = true;
    bool postSucceeds = true;

    // Observations
    QStringList calls;
    QStringList fetchedThreads;
    QStringList permissionQueries;
    QList<qint64> reactionTargets;
    QStringList reactionContents;
    QStringList removedReactions;
    QStringList postedThreads;
    QStringList postedBodies;
};

/**
 * History store whose push answers come from a script
 */
class FakeHistoryStore : public HistoryStore
{
public:
    bool stage(const QStringList &paths) override
    {
        ++stageCalls;
        stagedPaths << paths;
        staged = staged || !paths.isEmpty();
        return stageSucceeds;
    }

    bool stageAll() override
    {
        ++stageAllCalls;
        return true;
    }

    bool hasStagedChanges(bool *ok = nullptr) override
    {
        if (ok) *ok = inspectSucceeds;
        return inspectSucceeds && staged;
    }

    bool commit(const QString &message) override
    {
        commitMessages << message;
        staged = false;
        return commitSucceeds;
    }

    PushStatus push() override
    {
        ++pushCalls;
        if (pushScript.isEmpty()) {
            return PushStatus::Pushed;
        }
        return pushScript.takeFirst();
    }

    bool rebaseOntoTip() override
    {
        ++rebaseCalls;
        return true;
    }

    QString lastError() const override { return error; }

    QList<PushStatus> pushScript;
    bool stageSucceeds = true;
    bool commitSucceeds = true;
    bool inspectSucceeds = true;
    QString error = QStringLiteral("scripted failure");

    bool staged = false;
    int stageCalls = 0;
    int stageAllCalls = 0;
    int pushCalls = 0;
    int rebaseCalls = 0;
    QStringList stagedPaths;
    QStringList commitMessages;
};

/**
 * Agent driver that answers without starting a process
 */
class FakeAgentDriver : public AgentDriver
{
public:
    AgentResult run(const AgentRequest &request) override
    {
        requests << request;

        AgentResult result;
        result.logPath = request.logPath;
        if (!succeed) {
            result.errorString = QStringLiteral("engine exited with code 1");
            return result;
        }

        if (writeLog) {
            QFile log(request.logPath);
            if (log.open(QIODevice::Append)) {
                log.write("{\"type\":\"session\"}\n");
                result.logWritten = true;
            }
        } else if (!engineChosenLog.isEmpty()) {
            // Log under a name of the engine's own choosing
            QFile log(QFileInfo(request.logPath).absolutePath() + QLatin1Char('/') + engineChosenLog);
            if (log.open(QIODevice::WriteOnly)) {
                log.write("{\"type\":\"session\"}\n");
            }
        }
        result.success = true;
        result.replyText = reply;
        return result;
    }

    bool succeed = true;
    bool writeLog = true;
    QString engineChosenLog;    // used when writeLog is false
    QString reply = QStringLiteral("Hello from the engine");
    QList<AgentRequest> requests;
};

} // namespace Threadkeeper

#endif // FAKECOLLABORATORS_H
