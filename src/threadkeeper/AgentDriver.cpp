/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AgentDriver.h"

#include <QDeadlineTimer>
#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QProcess>

namespace Threadkeeper
{

AgentDriver::AgentDriver(const AgentOptions &options, QObject *parent)
    : QObject(parent)
    , m_options(options)
{
}

AgentDriver::~AgentDriver() = default;

void AgentDriver::setOptions(const AgentOptions &options)
{
    m_options = options;
}

QString AgentDriver::requiredApiKeyVariable(const QString &provider)
{
    if (provider == QStringLiteral("anthropic")) {
        return QStringLiteral("ANTHROPIC_API_KEY");
    }
    if (provider == QStringLiteral("openai")) {
        return QStringLiteral("OPENAI_API_KEY");
    }
    return QString();
}

QStringList AgentDriver::effectiveTools(const AgentOptions &options, const AgentRequest &request)
{
    if (!request.readOnly) {
        return options.toolAllowlist;
    }

    QStringList tools;
    for (const QString &tool : options.toolAllowlist) {
        if (options.readOnlyTools.contains(tool)) {
            tools << tool;
        }
    }
    // An empty --tools would mean the engine's full default set
    return tools.isEmpty() ? options.readOnlyTools : tools;
}

QStringList AgentDriver::buildArguments(const AgentOptions &options, const AgentRequest &request)
{
    QStringList args;
    args << QStringLiteral("--mode") << QStringLiteral("json");

    if (!options.provider.isEmpty()) {
        args << QStringLiteral("--provider") << options.provider;
    }
    if (!options.model.isEmpty()) {
        args << QStringLiteral("--model") << options.model;
    }
    if (!options.thinkingDepth.isEmpty()) {
        args << QStringLiteral("--thinking") << options.thinkingDepth;
    }
    const QStringList tools = effectiveTools(options, request);
    if (!tools.isEmpty()) {
        args << QStringLiteral("--tools") << tools.join(QLatin1Char(','));
    }
    if (!options.sessionsDir.isEmpty()) {
        args << QStringLiteral("--session-dir") << options.sessionsDir;
    }

    // Resume mode hands over the existing log; new mode names the log to create
    if (!request.logPath.isEmpty()) {
        args << QStringLiteral("--session") << request.logPath;
    }

    args << QStringLiteral("-p") << request.input;
    return args;
}

AgentResult AgentDriver::fail(AgentResult result, const QString &message)
{
    result.success = false;
    result.replyText.clear();
    result.errorString = message;
    qCritical() << "AgentDriver:" << message;
    Q_EMIT errorOccurred(message);
    return result;
}

AgentResult AgentDriver::run(const AgentRequest &request)
{
    AgentResult result;
    result.logPath = request.logPath;
    result.rawEventLog = m_options.rawEventLogPath;

    const QString keyVariable = requiredApiKeyVariable(m_options.provider);
    if (!keyVariable.isEmpty() && m_options.environment.value(keyVariable).isEmpty()) {
        return fail(result, QStringLiteral("%1 is not available to this run (provider %2)").arg(keyVariable, m_options.provider));
    }

    QFile rawLog;
    if (!m_options.rawEventLogPath.isEmpty()) {
        QDir().mkpath(QFileInfo(m_options.rawEventLogPath).absolutePath());
        rawLog.setFileName(m_options.rawEventLogPath);
        if (!rawLog.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            qWarning() << "AgentDriver: Cannot write raw event log" << m_options.rawEventLogPath << rawLog.errorString();
        }
    }

    QFile echo;
    if (m_options.echoStream) {
        echo.open(stdout, QIODevice::WriteOnly);
    }

    QProcess process;
    process.setProcessEnvironment(m_options.environment);
    if (!m_options.workingDirectory.isEmpty()) {
        process.setWorkingDirectory(m_options.workingDirectory);
    }
    // stderr goes straight to the job log
    process.setProcessChannelMode(QProcess::ForwardedErrorChannel);

    bool streamClosed = false;
    QElapsedTimer sinceStreamClosed;
    connect(&process, &QProcess::readChannelFinished, this, [&streamClosed, &sinceStreamClosed]() {
        streamClosed = true;
        sinceStreamClosed.start();
    });

    const QStringList args = buildArguments(m_options, request);
    qInfo() << "AgentDriver: Starting" << m_options.executable << (request.isNew ? "in new mode" : "in resume mode") << "log:" << request.logPath;

    process.start(m_options.executable, args);
    if (!process.waitForStarted(30000)) {
        return fail(result, QStringLiteral("Failed to start %1: %2").arg(m_options.executable, process.errorString()));
    }
    process.closeWriteChannel();

    AgentStreamParser parser;
    auto consume = [&]() {
        const QByteArray chunk = process.readAllStandardOutput();
        if (chunk.isEmpty()) {
            return;
        }
        if (rawLog.isOpen()) {
            rawLog.write(chunk);
            rawLog.flush();
        }
        if (echo.isOpen()) {
            echo.write(chunk);
            echo.flush();
        }
        const QList<AgentEvent> events = parser.feed(chunk);
        for (const AgentEvent &event : events) {
            Q_EMIT eventReceived(static_cast<int>(event.kind), event.text);
        }
        result.events.append(events);
    };

    QDeadlineTimer deadline(m_options.timeoutMs);
    bool killedAfterOutput = false;

    while (process.state() != QProcess::NotRunning) {
        if (process.waitForFinished(250)) {
            break;
        }
        consume();

        if (deadline.hasExpired()) {
            result.timedOut = true;
            qCritical() << "AgentDriver: Engine timed out after" << m_options.timeoutMs / 1000 << "s, killing it";
            process.kill();
            process.waitForFinished(5000);
            break;
        }

        if (streamClosed && process.state() != QProcess::NotRunning && sinceStreamClosed.elapsed() > m_options.exitGraceMs) {
            qWarning() << "AgentDriver: Engine did not exit after its output was captured, terminating it";
            killedAfterOutput = true;
            process.terminate();
            if (!process.waitForFinished(2000)) {
                process.kill();
                process.waitForFinished(2000);
            }
            break;
        }
    }

    consume();
    const QList<AgentEvent> tail = parser.finish();
    result.events.append(tail);
    rawLog.close();

    result.exitCode = process.exitCode();
    result.logWritten = !request.logPath.isEmpty() && QFileInfo::exists(request.logPath);

    if (result.timedOut) {
        return fail(result, QStringLiteral("Engine timed out after %1 ms").arg(m_options.timeoutMs));
    }
    if (!killedAfterOutput) {
        if (process.exitStatus() == QProcess::CrashExit) {
            return fail(result, QStringLiteral("Engine crashed: %1").arg(process.errorString()));
        }
        if (process.exitCode() != 0) {
            return fail(result, QStringLiteral("Engine exited with code %1").arg(process.exitCode()));
        }
    }
    if (parser.parsedLines() == 0) {
        return fail(result, QStringLiteral("Engine produced no parseable events (%1 malformed lines)").arg(parser.malformedLines()));
    }

    bool ok = false;
    result.replyText = AgentStreamParser::extractReply(result.events, &ok);
    if (!ok) {
        return fail(result, QStringLiteral("Engine finished without a final reply (%1 events)").arg(result.events.size()));
    }

    result.success = true;
    qInfo() << "AgentDriver: Engine finished," << result.events.size() << "events, reply of" << result.replyText.size() << "characters";
    return result;
}

} // namespace Threadkeeper

#include "moc_AgentDriver.cpp"
