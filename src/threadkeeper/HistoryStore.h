/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HISTORYSTORE_H
#define HISTORYSTORE_H

#include "threadkeeper_export.h"

#include <QString>
#include <QStringList>

namespace Threadkeeper
{

/**
 * HistoryStore is the versioned store that conversation state is committed
 * to. It is shared by every run and offers no locking; concurrent pushes are
 * detected by the remote rejecting them.
 */
class THREADKEEPER_EXPORT HistoryStore
{
public:
    enum class PushStatus {
        Pushed,
        Rejected,   // remote tip moved since our base
        Failed,     // anything else (network, auth, ...)
    };

    virtual ~HistoryStore() = default;

    /**
     * Stage the given paths (absolute or relative to the store root)
     */
    virtual bool stage(const QStringList &paths) = 0;

    /**
     * Stage every change in the working tree
     */
    virtual bool stageAll() = 0;

    /**
     * @param ok Set to false when the index could not be inspected
     */
    virtual bool hasStagedChanges(bool *ok = nullptr) = 0;

    virtual bool commit(const QString &message) = 0;

    virtual PushStatus push() = 0;

    /**
     * Fetch the remote tip and replay local commits onto it.
     * Local changes win where both sides touched the same lines.
     * Uncommitted edits in the working tree survive the rebase.
     */
    virtual bool rebaseOntoTip() = 0;

    /**
     * Last error message, empty when the last call succeeded
     */
    virtual QString lastError() const = 0;
};

} // namespace Threadkeeper

#endif // HISTORYSTORE_H
