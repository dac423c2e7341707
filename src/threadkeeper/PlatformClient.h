/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PLATFORMCLIENT_H
#define PLATFORMCLIENT_H

#include "threadkeeper_export.h"

#include "TriggerEvent.h"

#include <QString>

namespace Threadkeeper
{

/**
 * Title and body of a thread as the platform currently has them
 */
struct THREADKEEPER_EXPORT ThreadContent {
    QString title;
    QString body;
};

/**
 * PlatformClient is everything Threadkeeper asks of the issue tracker.
 *
 * Every call reports success through its return value or the ok flag and
 * never throws. Authorization is the platform's business.
 */
class THREADKEEPER_EXPORT PlatformClient
{
public:
    virtual ~PlatformClient() = default;

    /**
     * Fetch the current title and body of a thread
     */
    virtual ThreadContent fetchThread(const QString &threadId, bool *ok = nullptr) = 0;

    /**
     * Repository permission level of a user ("admin", "write", ...)
     */
    virtual QString actorPermission(const QString &actor, bool *ok = nullptr) = 0;

    /**
     * Attach a reaction to a thread or comment.
     *
     * @return The reaction id, empty on failure
     */
    virtual QString addReaction(const EventRef &target, const QString &content) = 0;

    virtual bool removeReaction(const EventRef &target, const QString &reactionId) = 0;

    virtual bool postComment(const QString &threadId, const QString &body) = 0;
};

} // namespace Threadkeeper

#endif // PLATFORMCLIENT_H
