/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TriggerEvent.h"

#include <QFile>
#include <QJsonDocument>

namespace Threadkeeper
{

EventRef TriggerEvent::ref() const
{
    EventRef r;
    r.threadId = threadId;
    r.commentId = kind == Kind::Comment ? commentId : 0;
    return r;
}

QString TriggerEvent::inputText() const
{
    if (kind == Kind::Comment) {
        return commentBody;
    }
    return QStringLiteral("%1\n\n%2").arg(title, body);
}

ParsedCommand TriggerEvent::command() const
{
    if (kind == Kind::Comment) {
        return CommandParser::parse(commentBody);
    }

    ParsedCommand parsed;
    parsed.command = QStringLiteral("agent");
    parsed.rawText = inputText();
    parsed.agentInput = parsed.rawText;
    return parsed;
}

TriggerEvent::Kind TriggerEvent::parseKind(const QString &eventName)
{
    if (eventName == QStringLiteral("issues")) {
        return Kind::ThreadOpened;
    }
    if (eventName == QStringLiteral("issue_comment")) {
        return Kind::Comment;
    }
    return Kind::Unknown;
}

TriggerEvent TriggerEvent::fromPayload(const QJsonObject &payload, const QString &eventName, const QString &repository)
{
    TriggerEvent event;
    event.kind = parseKind(eventName);

    const QJsonObject repo = payload.value(QStringLiteral("repository")).toObject();
    event.repository = repository.isEmpty() ? repo.value(QStringLiteral("full_name")).toString() : repository;
    event.defaultBranch = repo.value(QStringLiteral("default_branch")).toString();

    const QJsonObject issue = payload.value(QStringLiteral("issue")).toObject();
    const QJsonValue number = issue.value(QStringLiteral("number"));
    if (number.isDouble()) {
        event.threadId = QString::number(number.toInteger());
    } else if (number.isString()) {
        event.threadId = number.toString();
    }
    event.title = issue.value(QStringLiteral("title")).toString();
    event.body = issue.value(QStringLiteral("body")).toString();

    if (event.kind == Kind::Comment) {
        const QJsonObject comment = payload.value(QStringLiteral("comment")).toObject();
        event.commentId = comment.value(QStringLiteral("id")).toInteger();
        event.commentBody = comment.value(QStringLiteral("body")).toString();
        event.actor = comment.value(QStringLiteral("user")).toObject().value(QStringLiteral("login")).toString();
    }
    if (event.actor.isEmpty()) {
        event.actor = payload.value(QStringLiteral("sender")).toObject().value(QStringLiteral("login")).toString();
    }

    return event;
}

TriggerEvent TriggerEvent::fromFile(const QString &payloadPath, const QString &eventName, const QString &repository, QString *errorString)
{
    QFile file(payloadPath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorString) {
            *errorString = QStringLiteral("Cannot read event payload %1: %2").arg(payloadPath, file.errorString());
        }
        return TriggerEvent();
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorString) {
            *errorString = QStringLiteral("Invalid event payload %1: %2").arg(payloadPath, error.errorString());
        }
        return TriggerEvent();
    }

    TriggerEvent event = fromPayload(doc.object(), eventName, repository);
    if (!event.isValid() && errorString) {
        *errorString = QStringLiteral("Event payload %1 is not an issue event (%2)").arg(payloadPath, eventName);
    }
    return event;
}

bool TriggerEvent::isContinuousIntegration(const QProcessEnvironment &env)
{
    return env.value(QStringLiteral("CI")) == QStringLiteral("true") || env.value(QStringLiteral("GITHUB_ACTIONS")) == QStringLiteral("true");
}

} // namespace Threadkeeper
