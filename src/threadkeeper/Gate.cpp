/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Gate.h"

#include <KLocalizedString>
#include <QFileInfo>

namespace Threadkeeper
{

Gate::Gate(const QString &sentinelPath)
    : m_sentinelPath(sentinelPath)
{
}

GateResult Gate::checkEnabled() const
{
    GateResult result;

    if (!m_sentinelPath.isEmpty() && QFileInfo::exists(m_sentinelPath)) {
        result.allowed = true;
        result.reason = i18n("Threadkeeper enabled, %1 found.", m_sentinelPath);
        return result;
    }

    result.allowed = false;
    result.reason = i18n("Threadkeeper disabled, sentinel file %1 is missing.\n"
                         "To enable Threadkeeper, restore that file and push it to the repository.",
                         m_sentinelPath.isEmpty() ? QStringLiteral("<unset>") : m_sentinelPath);
    return result;
}

} // namespace Threadkeeper
