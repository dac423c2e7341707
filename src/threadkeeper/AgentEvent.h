/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTEVENT_H
#define AGENTEVENT_H

#include "threadkeeper_export.h"

#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>

namespace Threadkeeper
{

/**
 * AgentEvent is one event of the engine's stream in Threadkeeper's own terms.
 *
 * Engine lines are translated into this form as soon as they arrive; nothing
 * past the stream parser looks at the engine's wire format.
 */
struct THREADKEEPER_EXPORT AgentEvent {
    enum class Role {
        Unknown,
        Human,      // user input
        Agent,      // assistant output
        Tool,       // tool invocation or result
    };

    enum class Kind {
        Other,
        TextDelta,          // partial assistant text
        MessageComplete,    // a whole message (any role)
        ToolInvocation,
        ToolResult,
        TurnEnd,
        AgentEnd,
    };

    Role role = Role::Unknown;
    Kind kind = Kind::Other;
    QDateTime timestamp;
    QString text;           // text payload, joined text blocks for messages
    QJsonObject payload;    // the engine's original event

    bool isFinalReplyCandidate() const
    {
        return kind == Kind::MessageComplete && role == Role::Agent && !text.trimmed().isEmpty();
    }
};

/**
 * AgentStreamParser turns the engine's newline-delimited JSON into AgentEvents.
 *
 * Feed arbitrary chunks with feed(); complete lines are translated and
 * returned. Lines that are not JSON objects are counted and skipped.
 */
class THREADKEEPER_EXPORT AgentStreamParser
{
public:
    AgentStreamParser() = default;

    /**
     * Consume a chunk of output. Returns the events completed by it.
     */
    QList<AgentEvent> feed(const QByteArray &chunk);

    /**
     * Flush a trailing line without newline
     */
    QList<AgentEvent> finish();

    int malformedLines() const { return m_malformedLines; }
    int parsedLines() const { return m_parsedLines; }

    /**
     * Translate one line. ok is false for blank or non-JSON lines.
     */
    static AgentEvent parseLine(const QByteArray &line, bool *ok = nullptr);

    /**
     * Translate an engine event object
     */
    static AgentEvent translate(const QJsonObject &obj);

    /**
     * Parse a whole captured stream
     */
    static QList<AgentEvent> parseAll(const QByteArray &data, int *malformed = nullptr);

    /**
     * Text of the last completed assistant message with non-empty text.
     *
     * Scans from the end. ok is false when there is none; no reply is ever
     * made up in that case.
     */
    static QString extractReply(const QList<AgentEvent> &events, bool *ok = nullptr);

    /**
     * Cut text to at most maxLength UTF-16 units without splitting a
     * surrogate pair
     */
    static QString truncateReply(const QString &text, int maxLength);

private:
    QList<AgentEvent> takeLine(const QByteArray &line);

    QByteArray m_buffer;
    int m_malformedLines = 0;
    int m_parsedLines = 0;
};

} // namespace Threadkeeper

#endif // AGENTEVENT_H
