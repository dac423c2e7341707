/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AgentEvent.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QStringList>

namespace Threadkeeper
{

namespace
{

AgentEvent::Role parseRole(const QString &role)
{
    if (role == QStringLiteral("assistant")) {
        return AgentEvent::Role::Agent;
    }
    if (role == QStringLiteral("user")) {
        return AgentEvent::Role::Human;
    }
    if (role == QStringLiteral("toolResult") || role == QStringLiteral("tool")) {
        return AgentEvent::Role::Tool;
    }
    return AgentEvent::Role::Unknown;
}

// Message content is either a plain string or a list of typed blocks
QString messageText(const QJsonObject &message)
{
    const QJsonValue content = message.value(QStringLiteral("content"));
    if (content.isString()) {
        return content.toString();
    }

    QStringList parts;
    const QJsonArray blocks = content.toArray();
    for (const QJsonValue &block : blocks) {
        const QJsonObject obj = block.toObject();
        if (obj.value(QStringLiteral("type")).toString() == QStringLiteral("text")) {
            const QString text = obj.value(QStringLiteral("text")).toString();
            if (!text.isEmpty()) {
                parts.append(text);
            }
        }
    }
    return parts.join(QLatin1Char('\n'));
}

QDateTime eventTimestamp(const QJsonObject &obj, const QJsonObject &message)
{
    // Engine timestamps are epoch milliseconds or ISO strings
    for (const QJsonValue &value : {message.value(QStringLiteral("timestamp")), obj.value(QStringLiteral("timestamp"))}) {
        if (value.isDouble()) {
            return QDateTime::fromMSecsSinceEpoch(value.toInteger()).toUTC();
        }
        if (value.isString()) {
            const QDateTime parsed = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
            if (parsed.isValid()) {
                return parsed;
            }
        }
    }
    return QDateTime::currentDateTimeUtc();
}

} // namespace

AgentEvent AgentStreamParser::translate(const QJsonObject &obj)
{
    AgentEvent event;
    event.payload = obj;

    const QString type = obj.value(QStringLiteral("type")).toString();
    const QJsonObject message = obj.value(QStringLiteral("message")).toObject();
    event.timestamp = eventTimestamp(obj, message);

    if (type == QStringLiteral("message_end")) {
        event.kind = AgentEvent::Kind::MessageComplete;
        event.role = parseRole(message.value(QStringLiteral("role")).toString());
        event.text = messageText(message);
    } else if (type == QStringLiteral("message_update")) {
        event.kind = AgentEvent::Kind::TextDelta;
        event.role = parseRole(message.value(QStringLiteral("role")).toString());
        const QJsonObject delta = obj.value(QStringLiteral("assistantMessageEvent")).toObject();
        if (delta.value(QStringLiteral("type")).toString() == QStringLiteral("text_delta")) {
            event.text = delta.value(QStringLiteral("delta")).toString();
        }
    } else if (type == QStringLiteral("tool_execution_start")) {
        event.kind = AgentEvent::Kind::ToolInvocation;
        event.role = AgentEvent::Role::Tool;
        event.text = obj.value(QStringLiteral("toolName")).toString();
    } else if (type == QStringLiteral("tool_execution_end")) {
        event.kind = AgentEvent::Kind::ToolResult;
        event.role = AgentEvent::Role::Tool;
        event.text = obj.value(QStringLiteral("toolName")).toString();
    } else if (type == QStringLiteral("turn_end")) {
        event.kind = AgentEvent::Kind::TurnEnd;
        event.role = AgentEvent::Role::Agent;
    } else if (type == QStringLiteral("agent_end")) {
        event.kind = AgentEvent::Kind::AgentEnd;
        event.role = AgentEvent::Role::Agent;
    }

    return event;
}

AgentEvent AgentStreamParser::parseLine(const QByteArray &line, bool *ok)
{
    const QByteArray trimmed = line.trimmed();
    if (trimmed.isEmpty()) {
        if (ok) *ok = false;
        return AgentEvent();
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        if (ok) *ok = false;
        return AgentEvent();
    }

    if (ok) *ok = true;
    return translate(doc.object());
}

QList<AgentEvent> AgentStreamParser::takeLine(const QByteArray &line)
{
    if (line.trimmed().isEmpty()) {
        return {};
    }

    bool ok = false;
    AgentEvent event = parseLine(line, &ok);
    if (!ok) {
        ++m_malformedLines;
        qWarning() << "AgentStreamParser: Skipping non-JSON line:" << line.left(200);
        return {};
    }

    ++m_parsedLines;
    return {event};
}

QList<AgentEvent> AgentStreamParser::feed(const QByteArray &chunk)
{
    m_buffer.append(chunk);

    QList<AgentEvent> events;
    qsizetype newline = m_buffer.indexOf('\n');
    while (newline >= 0) {
        const QByteArray line = m_buffer.left(newline);
        m_buffer.remove(0, newline + 1);
        events.append(takeLine(line));
        newline = m_buffer.indexOf('\n');
    }
    return events;
}

QList<AgentEvent> AgentStreamParser::finish()
{
    const QByteArray rest = m_buffer;
    m_buffer.clear();
    return takeLine(rest);
}

QList<AgentEvent> AgentStreamParser::parseAll(const QByteArray &data, int *malformed)
{
    AgentStreamParser parser;
    QList<AgentEvent> events = parser.feed(data);
    events.append(parser.finish());
    if (malformed) {
        *malformed = parser.malformedLines();
    }
    return events;
}

QString AgentStreamParser::extractReply(const QList<AgentEvent> &events, bool *ok)
{
    for (auto it = events.crbegin(); it != events.crend(); ++it) {
        if (it->isFinalReplyCandidate()) {
            if (ok) *ok = true;
            return it->text.trimmed();
        }
    }

    if (ok) *ok = false;
    return QString();
}

QString AgentStreamParser::truncateReply(const QString &text, int maxLength)
{
    if (maxLength < 0 || text.size() <= maxLength) {
        return text;
    }

    qsizetype cut = maxLength;
    if (cut > 0 && text.at(cut - 1).isHighSurrogate()) {
        --cut;
    }
    return text.left(cut);
}

} // namespace Threadkeeper
