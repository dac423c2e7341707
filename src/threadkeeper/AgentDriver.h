/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTDRIVER_H
#define AGENTDRIVER_H

#include "threadkeeper_export.h"

#include "AgentEvent.h"

#include <QObject>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

namespace Threadkeeper
{

/**
 * How to launch the reasoning engine. Provider, model, thinking depth and
 * tools are handed through untouched.
 */
struct THREADKEEPER_EXPORT AgentOptions {
    QString executable = QStringLiteral("pi");
    QString provider;
    QString model;
    QString thinkingDepth;
    QStringList toolAllowlist;
    QStringList readOnlyTools = {QStringLiteral("read"), QStringLiteral("grep"), QStringLiteral("find"), QStringLiteral("ls")};
    QString workingDirectory;
    QString sessionsDir;            // as passed to --session-dir
    QString rawEventLogPath;        // empty = no copy
    int timeoutMs = 300000;
    int exitGraceMs = 10000;
    bool echoStream = false;        // copy the stream to our stdout
    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
};

/**
 * One engine invocation
 */
struct THREADKEEPER_EXPORT AgentRequest {
    QString input;
    QString logPath;
    bool isNew = true;
    bool readOnly = false;  // semi-trusted actor: read-only tools only
};

/**
 * Outcome of an engine invocation.
 *
 * success is false for every failure (exit code, crash, timeout, stream
 * without events, no final reply); errorString says which.
 */
struct THREADKEEPER_EXPORT AgentResult {
    bool success = false;
    QString replyText;
    QString rawEventLog;
    QString logPath;
    bool logWritten = false;
    QList<AgentEvent> events;
    int exitCode = -1;
    bool timedOut = false;
    QString errorString;
};

/**
 * AgentDriver runs the reasoning engine and recovers its final reply.
 *
 * The engine is started in JSON mode and its stdout is read while it runs;
 * each line is copied to the raw event log and translated into AgentEvents
 * on arrival. The reply is the text of the last completed assistant message.
 *
 * Failures are never retried here: the engine may already have changed
 * files in the checkout.
 */
class THREADKEEPER_EXPORT AgentDriver : public QObject
{
    Q_OBJECT

public:
    explicit AgentDriver(const AgentOptions &options = AgentOptions(), QObject *parent = nullptr);
    ~AgentDriver() override;

    const AgentOptions &options() const { return m_options; }
    void setOptions(const AgentOptions &options);

    virtual AgentResult run(const AgentRequest &request);

    /**
     * Engine command line for a request
     */
    static QStringList buildArguments(const AgentOptions &options, const AgentRequest &request);

    /**
     * Tools passed to the engine. A read-only request keeps the allowlisted
     * read-only tools, or all read-only tools when none of them is listed.
     */
    static QStringList effectiveTools(const AgentOptions &options, const AgentRequest &request);

    /**
     * Environment variable holding the API key for a provider, empty when
     * the provider needs none we know of
     */
    static QString requiredApiKeyVariable(const QString &provider);

Q_SIGNALS:
    /**
     * Emitted for every translated stream event (kind as int)
     */
    void eventReceived(int kind, const QString &text);

    void errorOccurred(const QString &message);

private:
    AgentResult fail(AgentResult result, const QString &message);

    AgentOptions m_options;
};

} // namespace Threadkeeper

#endif // AGENTDRIVER_H
