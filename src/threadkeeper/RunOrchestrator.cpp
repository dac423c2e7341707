/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "RunOrchestrator.h"

#include "AgentDriver.h"
#include "AgentEvent.h"
#include "CommandParser.h"
#include "Gate.h"
#include "MappingRecord.h"
#include "PlatformClient.h"
#include "SessionResolver.h"
#include "StateCommitter.h"

#include <KLocalizedString>

#include <QDateTime>
#include <QDebug>
#include <QFileInfo>
#include <QMetaEnum>

namespace Threadkeeper
{

RunOrchestrator::RunOrchestrator(const InstallLayout &layout,
                                 PlatformClient *platform,
                                 AgentDriver *agent,
                                 StateCommitter *committer,
                                 QObject *parent)
    : QObject(parent)
    , m_layout(layout)
    , m_platform(platform)
    , m_agent(agent)
    , m_committer(committer)
    , m_activity(platform)
{
}

RunOrchestrator::~RunOrchestrator() = default;

void RunOrchestrator::setAccessPolicy(const AccessPolicy &policy)
{
    m_accessPolicy = policy;
    m_checkAccess = true;
}

QString RunOrchestrator::stateName(RunState state)
{
    return QString::fromLatin1(QMetaEnum::fromType<RunState>().valueToKey(state));
}

void RunOrchestrator::setState(RunState state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    qDebug() << "RunOrchestrator: State ->" << stateName(state);
    Q_EMIT stateChanged(state);
}

void RunOrchestrator::fail(Outcome &outcome, FailureKind kind, const QString &message)
{
    outcome.failures.append(kind);
    outcome.errors.append(message);
    qCritical() << "RunOrchestrator:" << message;
    Q_EMIT failed(kind, message);
}

RunOrchestrator::Outcome RunOrchestrator::finish(Outcome &outcome)
{
    setState(outcome.failures.isEmpty() ? Done : Failed);
    outcome.finalState = m_state;
    return outcome;
}

int RunOrchestrator::exitCodeFor(const Outcome &outcome)
{
    if (outcome.hasFailure(FailureKind::AccessDenied)) {
        return 2;
    }
    if (outcome.hasFailure(FailureKind::GateDenied)) {
        return 3;
    }
    if (outcome.hasFailure(FailureKind::AgentFailure)) {
        return 4;
    }
    if (outcome.hasFailure(FailureKind::CommitFailure)) {
        return 6;
    }
    if (outcome.hasFailure(FailureKind::PublishFailure)) {
        return 5;
    }
    return outcome.finalState == Done ? 0 : 1;
}

bool RunOrchestrator::publish(const QString &threadId, const QString &text, Outcome &outcome)
{
    outcome.replyText = AgentStreamParser::truncateReply(text, m_maxCommentLength);
    if (outcome.replyText.size() < text.size()) {
        qInfo() << "RunOrchestrator: Reply truncated from" << text.size() << "to" << outcome.replyText.size() << "characters";
    }
    outcome.published = m_platform->postComment(threadId, outcome.replyText);
    if (!outcome.published) {
        fail(outcome, FailureKind::PublishFailure, i18n("Could not post the reply to thread %1", threadId));
    }
    return outcome.published;
}

RunOrchestrator::Outcome RunOrchestrator::runCommand(const TriggerEvent &event, const ParsedCommand &command, Outcome &outcome)
{
    qInfo() << "RunOrchestrator: Command" << command.command << "on thread" << event.threadId;

    if (CommandParser::isMutation(command.command) && outcome.trust != TrustLevel::Trusted) {
        fail(outcome, FailureKind::AccessDenied, i18n("%1 may not use /%2", event.actor, command.command));
        return finish(outcome);
    }

    if (command.command == QStringLiteral("reset")) {
        setState(Committing);
        const CommitResult cleared = m_committer->clear(event.threadId);
        outcome.committed = cleared.committed;
        if (!cleared.committed) {
            fail(outcome, FailureKind::CommitFailure, i18n("Could not reset the conversation after %1 attempts: %2", cleared.attempts, cleared.errorString));
            return finish(outcome);
        }
        setState(Publishing);
        publish(event.threadId, i18n("Conversation reset. The next message starts a new conversation."), outcome);
        return finish(outcome);
    }

    QString reply;
    if (command.command == QStringLiteral("status")) {
        setState(Resolving);
        bool ok = false;
        const MappingRecord record = MappingRecord::load(m_layout.mappingPath(event.threadId), &ok);
        if (ok && QFileInfo::exists(m_layout.toAbsolute(record.logPath))) {
            reply = i18n("This issue continues the conversation in `%1`, last updated %2.",
                         record.logPath,
                         record.updatedAt.toString(Qt::ISODate));
        } else {
            reply = i18n("This issue has no conversation yet. The next message starts one.");
        }
    } else {
        reply = CommandParser::helpText();
    }

    setState(Publishing);
    publish(event.threadId, reply, outcome);
    return finish(outcome);
}

RunOrchestrator::Outcome RunOrchestrator::run(const TriggerEvent &event)
{
    Outcome outcome;
    m_state = Idle;

    if (!event.isValid()) {
        outcome.errors.append(i18n("The trigger event does not name a thread"));
        qCritical() << "RunOrchestrator:" << outcome.errors.constLast();
        setState(Failed);
        outcome.finalState = Failed;
        return outcome;
    }

    qInfo() << "RunOrchestrator: Run for thread" << event.threadId << "triggered by" << event.actor;

    if (m_checkAccess) {
        bool ok = false;
        const QString permission = m_platform->actorPermission(event.actor, &ok);
        if (!ok) {
            qWarning() << "RunOrchestrator: Could not read permission of" << event.actor << ", treating it as" << permission;
        }
        const AccessDecision decision = m_accessPolicy.check(event.actor, permission);
        outcome.trust = decision.trust;
        if (!decision.permitted) {
            fail(outcome, FailureKind::AccessDenied, decision.reason);
            // The notice is only posted where Threadkeeper is enabled
            if (decision.respond && Gate(m_layout.sentinelPath()).checkEnabled().allowed) {
                outcome.replyText = i18n("Sorry @%1, only collaborators with %2 permission or higher can talk to the agent here.",
                                         event.actor,
                                         m_accessPolicy.minimumPermission());
                outcome.published = m_platform->postComment(event.threadId, outcome.replyText);
                if (!outcome.published) {
                    qWarning() << "RunOrchestrator: Could not post the access notice to thread" << event.threadId;
                }
            }
            return finish(outcome);
        }
        qDebug() << "RunOrchestrator:" << decision.reason;
    }

    const GateResult gate = Gate(m_layout.sentinelPath()).checkEnabled();
    if (!gate.allowed) {
        fail(outcome, FailureKind::GateDenied, gate.reason);
        return finish(outcome);
    }
    setState(Gated);

    // Marker removal happens on every return below
    ActivityGuard guard(m_activity, event.ref());

    ParsedCommand command = event.command();
    if (command.command == QStringLiteral("agent") && command.agentInput.isEmpty()) {
        // A bare "/agent" gets the command list
        command.command = QStringLiteral("help");
    }
    outcome.command = command.command;
    if (command.isLocal()) {
        return runCommand(event, command, outcome);
    }

    setState(Resolving);
    SessionResolver resolver(m_layout);
    const SessionResolution session = resolver.resolve(event.threadId);

    TriggerEvent input = event;
    if (input.kind == TriggerEvent::Kind::ThreadOpened) {
        bool ok = false;
        const ThreadContent content = m_platform->fetchThread(input.threadId, &ok);
        if (ok) {
            input.title = content.title;
            input.body = content.body;
        } else {
            qWarning() << "RunOrchestrator: Could not fetch thread" << input.threadId << ", using the event payload";
        }
    }

    setState(AgentRunning);
    const QDateTime runStart = QDateTime::currentDateTime().addSecs(-1);

    AgentRequest request;
    request.input = input.kind == TriggerEvent::Kind::Comment ? command.agentInput : input.inputText();
    request.logPath = session.logPath;
    request.isNew = session.isNew;
    request.readOnly = outcome.trust == TrustLevel::SemiTrusted;

    const AgentResult agentResult = m_agent->run(request);
    if (!agentResult.success) {
        fail(outcome, FailureKind::AgentFailure, agentResult.errorString);
        return finish(outcome);
    }

    outcome.logPath = session.logPath;
    if (!agentResult.logWritten) {
        const QString newest = resolver.newestLog(runStart);
        if (!newest.isEmpty()) {
            qDebug() << "RunOrchestrator: Engine chose its own log file:" << newest;
            outcome.logPath = newest;
        } else {
            qWarning() << "RunOrchestrator: Engine left no conversation log";
        }
    }

    setState(Publishing);
    publish(event.threadId, agentResult.replyText, outcome);

    // The committer refuses to record a log that does not exist
    setState(Committing);
    MappingRecord record;
    record.threadId = event.threadId;
    record.logPath = m_layout.toRelative(outcome.logPath);
    record.updatedAt = QDateTime::currentDateTimeUtc();

    const CommitResult commit = m_committer->commit(event.threadId, outcome.logPath, record);
    outcome.committed = commit.committed;
    if (!commit.committed) {
        fail(outcome, FailureKind::CommitFailure, i18n("Could not record the conversation state after %1 attempts: %2", commit.attempts, commit.errorString));
    }

    return finish(outcome);
}

} // namespace Threadkeeper

#include "moc_RunOrchestrator.cpp"
