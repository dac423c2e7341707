/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ACTIVITYSIGNAL_H
#define ACTIVITYSIGNAL_H

#include "threadkeeper_export.h"

#include "TriggerEvent.h"

#include <QString>

namespace Threadkeeper
{

class PlatformClient;

/**
 * Marker placed by ActivitySignal::begin().
 *
 * reactionId is empty when the marker could not be attached; end() is
 * then a no-op apart from closing the handle.
 */
struct THREADKEEPER_EXPORT ActivityHandle {
    EventRef target;
    QString reactionId;
    bool open = false;

    bool hasMarker() const { return !reactionId.isEmpty(); }
};

/**
 * ActivitySignal shows observers that a run is working on an event.
 *
 * The marker is an "eyes" reaction on the triggering comment, or on the
 * thread for new threads. It is advisory: failing to add or remove it is
 * logged and otherwise ignored.
 */
class THREADKEEPER_EXPORT ActivitySignal
{
public:
    explicit ActivitySignal(PlatformClient *client);

    ActivityHandle begin(const EventRef &eventRef);

    /**
     * Remove the marker. Closing an already closed handle does nothing.
     */
    void end(ActivityHandle &handle);

    static QString markerContent();

private:
    PlatformClient *m_client = nullptr;
};

/**
 * ActivityGuard owns one begin()/end() pair.
 *
 * begin() runs in the constructor, end() in the destructor, so the marker
 * is removed on every way out of the enclosing scope.
 */
class THREADKEEPER_EXPORT ActivityGuard
{
public:
    ActivityGuard(ActivitySignal &signal, const EventRef &eventRef);
    ~ActivityGuard();

    ActivityGuard(const ActivityGuard &) = delete;
    ActivityGuard &operator=(const ActivityGuard &) = delete;

    const ActivityHandle &handle() const { return m_handle; }

private:
    ActivitySignal &m_signal;
    ActivityHandle m_handle;
};

} // namespace Threadkeeper

#endif // ACTIVITYSIGNAL_H
