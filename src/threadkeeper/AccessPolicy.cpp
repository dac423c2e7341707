/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AccessPolicy.h"

#include <KLocalizedString>

namespace Threadkeeper
{

AccessPolicy::AccessPolicy(const QString &minimumPermission, const QStringList &trustedUsers)
    : m_minimumPermission(minimumPermission)
    , m_trustedUsers(trustedUsers)
{
}

void AccessPolicy::setSemiTrustedRoles(const QStringList &roles)
{
    m_semiTrustedRoles.clear();
    for (const QString &role : roles) {
        m_semiTrustedRoles << role.trimmed().toLower();
    }
}

QStringList AccessPolicy::behaviorNames()
{
    return {QStringLiteral("block"), QStringLiteral("read-only-response")};
}

UntrustedBehavior AccessPolicy::behaviorFromString(const QString &name, bool *ok)
{
    const QString normalized = name.trimmed().toLower();
    if (ok) {
        *ok = behaviorNames().contains(normalized);
    }
    return normalized == QStringLiteral("read-only-response") ? UntrustedBehavior::ReadOnlyResponse : UntrustedBehavior::Block;
}

QStringList AccessPolicy::permissionLevels()
{
    return {
        QStringLiteral("none"),
        QStringLiteral("read"),
        QStringLiteral("triage"),
        QStringLiteral("write"),
        QStringLiteral("maintain"),
        QStringLiteral("admin"),
    };
}

int AccessPolicy::permissionRank(const QString &permission)
{
    return permissionLevels().indexOf(permission.trimmed().toLower());
}

AccessDecision AccessPolicy::check(const QString &actor, const QString &actorPermission) const
{
    AccessDecision decision;
    const QString who = actor.isEmpty() ? QStringLiteral("<unknown>") : actor;
    const QString level = actorPermission.trimmed().isEmpty() ? QStringLiteral("none") : actorPermission.trimmed().toLower();

    if (!actor.isEmpty() && m_trustedUsers.contains(actor, Qt::CaseInsensitive)) {
        decision.permitted = true;
        decision.trust = TrustLevel::Trusted;
        decision.reason = i18n("%1 is a trusted user", actor);
        return decision;
    }

    if (m_semiTrustedRoles.contains(level)) {
        decision.permitted = true;
        decision.trust = TrustLevel::SemiTrusted;
        decision.reason = i18n("%1 has %2 permission and gets read-only tools", who, level);
        return decision;
    }

    const int required = permissionRank(m_minimumPermission);
    if (required < 0) {
        // Misconfigured tier: fail closed
        decision.reason = i18n("Unknown minimum permission \"%1\"", m_minimumPermission);
        return decision;
    }

    if (permissionRank(level) >= required) {
        decision.permitted = true;
        decision.trust = TrustLevel::Trusted;
        decision.reason = i18n("%1 has %2 permission", who, level);
        return decision;
    }

    decision.respond = m_untrustedBehavior == UntrustedBehavior::ReadOnlyResponse;
    decision.reason = i18n("%1 has %2 permission, %3 or higher is required", who, level, m_minimumPermission);
    return decision;
}

} // namespace Threadkeeper
