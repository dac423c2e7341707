/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef GATE_H
#define GATE_H

#include "threadkeeper_export.h"

#include <QString>

namespace Threadkeeper
{

struct THREADKEEPER_EXPORT GateResult {
    bool allowed = false;
    QString reason;
};

/**
 * Gate is the fail-closed enable switch.
 *
 * Automation is enabled only while the sentinel file exists. The file is
 * created and removed by a human; Threadkeeper never touches it. Every call
 * looks at the file again.
 */
class THREADKEEPER_EXPORT Gate
{
public:
    explicit Gate(const QString &sentinelPath);

    QString sentinelPath() const { return m_sentinelPath; }

    GateResult checkEnabled() const;

private:
    QString m_sentinelPath;
};

} // namespace Threadkeeper

#endif // GATE_H
