/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RUNORCHESTRATOR_H
#define RUNORCHESTRATOR_H

#include "threadkeeper_export.h"

#include "AccessPolicy.h"
#include "ActivitySignal.h"
#include "InstallLayout.h"
#include "TriggerEvent.h"

#include <QList>
#include <QObject>
#include <QStringList>

namespace Threadkeeper
{

class AgentDriver;
class PlatformClient;
class StateCommitter;

/**
 * RunOrchestrator drives one run from trigger event to pushed state.
 *
 * Order: access check, gate, activity marker, session resolution, engine,
 * reply, commit. Access, gate and engine failures stop the run before
 * anything is published or committed. A reply that cannot be posted is
 * recorded and the state is committed anyway.
 *
 * Comments starting with /help, /status or /reset are answered without the
 * engine; /reset is limited to trusted actors. Semi-trusted actors run the
 * engine with read-only tools.
 */
class THREADKEEPER_EXPORT RunOrchestrator : public QObject
{
    Q_OBJECT

public:
    enum RunState {
        Idle,
        Gated,
        Resolving,
        AgentRunning,
        Publishing,
        Committing,
        Done,
        Failed
    };
    Q_ENUM(RunState)

    enum class FailureKind {
        None,
        AccessDenied,
        GateDenied,
        AgentFailure,
        PublishFailure,
        CommitFailure
    };
    Q_ENUM(FailureKind)

    struct Outcome {
        RunState finalState = Idle;
        QList<FailureKind> failures;
        QStringList errors;
        TrustLevel trust = TrustLevel::Trusted;
        QString command;        // "agent" for an engine run
        QString replyText;      // as posted (truncated)
        QString logPath;        // absolute
        bool published = false;
        bool committed = false;

        bool hasFailure(FailureKind kind) const { return failures.contains(kind); }
    };

    RunOrchestrator(const InstallLayout &layout,
                    PlatformClient *platform,
                    AgentDriver *agent,
                    StateCommitter *committer,
                    QObject *parent = nullptr);
    ~RunOrchestrator() override;

    /**
     * Require the actor to pass this policy before the gate.
     * Without a policy no access check is made.
     */
    void setAccessPolicy(const AccessPolicy &policy);

    void setMaxCommentLength(int length) { m_maxCommentLength = length; }
    int maxCommentLength() const { return m_maxCommentLength; }

    RunState state() const { return m_state; }

    Outcome run(const TriggerEvent &event);

    /**
     * Process exit code for an outcome. Commit failure outranks publish
     * failure since the reply may exist without its record.
     */
    static int exitCodeFor(const Outcome &outcome);

    static QString stateName(RunState state);

Q_SIGNALS:
    void stateChanged(Threadkeeper::RunOrchestrator::RunState state);
    void failed(Threadkeeper::RunOrchestrator::FailureKind kind, const QString &message);

private:
    void setState(RunState state);
    void fail(Outcome &outcome, FailureKind kind, const QString &message);
    Outcome finish(Outcome &outcome);
    Outcome runCommand(const TriggerEvent &event, const ParsedCommand &command, Outcome &outcome);
    bool publish(const QString &threadId, const QString &text, Outcome &outcome);

    InstallLayout m_layout;
    PlatformClient *m_platform;
    AgentDriver *m_agent;
    StateCommitter *m_committer;
    ActivitySignal m_activity;

    AccessPolicy m_accessPolicy;
    bool m_checkAccess = false;
    int m_maxCommentLength = 60000;
    RunState m_state = Idle;
};

} // namespace Threadkeeper

#endif // RUNORCHESTRATOR_H
