/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ActivitySignal.h"

#include "PlatformClient.h"

#include <QDebug>

namespace Threadkeeper
{

ActivitySignal::ActivitySignal(PlatformClient *client)
    : m_client(client)
{
}

QString ActivitySignal::markerContent()
{
    return QStringLiteral("eyes");
}

ActivityHandle ActivitySignal::begin(const EventRef &eventRef)
{
    ActivityHandle handle;
    handle.target = eventRef;
    handle.open = true;

    if (!m_client) {
        return handle;
    }

    handle.reactionId = m_client->addReaction(eventRef, markerContent());
    if (handle.reactionId.isEmpty()) {
        qWarning() << "ActivitySignal: Failed to add activity marker to thread" << eventRef.threadId << "comment" << eventRef.commentId;
    } else {
        qDebug() << "ActivitySignal: Added marker" << handle.reactionId << "to thread" << eventRef.threadId;
    }
    return handle;
}

void ActivitySignal::end(ActivityHandle &handle)
{
    if (!handle.open) {
        return;
    }
    handle.open = false;

    if (!m_client || !handle.hasMarker()) {
        return;
    }

    if (m_client->removeReaction(handle.target, handle.reactionId)) {
        qDebug() << "ActivitySignal: Removed marker" << handle.reactionId << "from thread" << handle.target.threadId;
    } else {
        qWarning() << "ActivitySignal: Failed to remove activity marker" << handle.reactionId << "from thread" << handle.target.threadId;
    }
}

ActivityGuard::ActivityGuard(ActivitySignal &signal, const EventRef &eventRef)
    : m_signal(signal)
    , m_handle(signal.begin(eventRef))
{
}

ActivityGuard::~ActivityGuard()
{
    m_signal.end(m_handle);
}

} // namespace Threadkeeper
