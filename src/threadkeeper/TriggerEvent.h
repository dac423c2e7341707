/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRIGGEREVENT_H
#define TRIGGEREVENT_H

#include "threadkeeper_export.h"

#include "CommandParser.h"

#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>

namespace Threadkeeper
{

/**
 * What the activity marker is attached to
 */
struct THREADKEEPER_EXPORT EventRef {
    QString threadId;
    qint64 commentId = 0; // 0 = the thread itself

    bool isComment() const { return commentId > 0; }
};

/**
 * TriggerEvent is the issue event that started this run.
 *
 * Built from the webhook payload the CI system hands over (the file named
 * by GITHUB_EVENT_PATH) plus the event name ("issues" or "issue_comment").
 */
class THREADKEEPER_EXPORT TriggerEvent
{
public:
    enum class Kind {
        Unknown,
        ThreadOpened,   // "issues" - a new thread
        Comment,        // "issue_comment" - a reply on an existing thread
    };

    TriggerEvent() = default;

    Kind kind = Kind::Unknown;
    QString repository;     // owner/repo
    QString defaultBranch;
    QString threadId;       // issue number as string
    QString title;
    QString body;
    qint64 commentId = 0;
    QString commentBody;
    QString actor;          // login of whoever triggered the event

    bool isValid() const
    {
        return kind != Kind::Unknown && !threadId.isEmpty();
    }

    EventRef ref() const;

    /**
     * Opening or continuing message for the engine.
     *
     * Comments are passed verbatim; a new thread is "title\n\nbody".
     */
    QString inputText() const;

    /**
     * Slash command carried by a comment. A new thread is always the
     * "agent" command with inputText() as input.
     */
    ParsedCommand command() const;

    /**
     * Parse a webhook payload.
     *
     * @param payload Parsed JSON payload
     * @param eventName "issues" or "issue_comment"
     * @param repository owner/repo; falls back to repository.full_name
     */
    static TriggerEvent fromPayload(const QJsonObject &payload, const QString &eventName, const QString &repository = QString());

    /**
     * Read and parse the payload file.
     *
     * @param errorString Set to a description when reading or parsing fails
     */
    static TriggerEvent fromFile(const QString &payloadPath,
                                 const QString &eventName,
                                 const QString &repository = QString(),
                                 QString *errorString = nullptr);

    static Kind parseKind(const QString &eventName);

    /**
     * Whether the environment looks like a CI job (CI=true or GITHUB_ACTIONS=true)
     */
    static bool isContinuousIntegration(const QProcessEnvironment &env = QProcessEnvironment::systemEnvironment());
};

} // namespace Threadkeeper

#endif // TRIGGEREVENT_H
