/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ACCESSPOLICY_H
#define ACCESSPOLICY_H

#include "threadkeeper_export.h"

#include <QString>
#include <QStringList>

namespace Threadkeeper
{

enum class TrustLevel {
    Trusted,        // every configured tool
    SemiTrusted,    // read-only tools, no state-changing commands
    Untrusted,      // no engine run
};

/**
 * What an untrusted actor gets
 */
enum class UntrustedBehavior {
    Block,              // nothing is posted
    ReadOnlyResponse,   // a short notice explains the restriction
};

/**
 * Outcome of an access check
 */
struct THREADKEEPER_EXPORT AccessDecision {
    bool permitted = false;
    TrustLevel trust = TrustLevel::Untrusted;
    bool respond = false;   // post a notice although the run is denied
    QString reason;
};

/**
 * AccessPolicy decides whether the actor behind an event may drive a run.
 *
 * Repository permission levels are ordered
 *   none < read < triage < write < maintain < admin
 *
 * Resolution order: logins listed as trusted are trusted; a permission
 * listed among the semi-trusted roles is semi-trusted; a level at or above
 * the configured minimum is trusted; anything else is untrusted.
 */
class THREADKEEPER_EXPORT AccessPolicy
{
public:
    AccessPolicy() = default;
    AccessPolicy(const QString &minimumPermission, const QStringList &trustedUsers = {});

    QString minimumPermission() const { return m_minimumPermission; }
    QStringList trustedUsers() const { return m_trustedUsers; }

    void setSemiTrustedRoles(const QStringList &roles);
    QStringList semiTrustedRoles() const { return m_semiTrustedRoles; }

    void setUntrustedBehavior(UntrustedBehavior behavior) { m_untrustedBehavior = behavior; }
    UntrustedBehavior untrustedBehavior() const { return m_untrustedBehavior; }

    AccessDecision check(const QString &actor, const QString &actorPermission) const;

    /**
     * Rank of a permission level, -1 for unknown levels.
     * Comparison is case-insensitive.
     */
    static int permissionRank(const QString &permission);

    /**
     * All permission levels, lowest first
     */
    static QStringList permissionLevels();

    /**
     * "block" or "read-only-response"
     */
    static UntrustedBehavior behaviorFromString(const QString &name, bool *ok = nullptr);
    static QStringList behaviorNames();

private:
    QString m_minimumPermission = QStringLiteral("write");
    QStringList m_trustedUsers;
    QStringList m_semiTrustedRoles;
    UntrustedBehavior m_untrustedBehavior = UntrustedBehavior::Block;
};

} // namespace Threadkeeper

#endif // ACCESSPOLICY_H
