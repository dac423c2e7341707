/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "AccessPolicyTest.h"

// Qt
#include <QTest>

// Threadkeeper
#include "../threadkeeper/AccessPolicy.h"

using namespace Threadkeeper;

void AccessPolicyTest::testPermissionRankOrdering()
{
    QVERIFY(AccessPolicy::permissionRank(QStringLiteral("none")) < AccessPolicy::permissionRank(QStringLiteral("read")));
    QVERIFY(AccessPolicy::permissionRank(QStringLiteral("read")) < AccessPolicy::permissionRank(QStringLiteral("triage")));
    QVERIFY(AccessPolicy::permissionRank(QStringLiteral("triage")) < AccessPolicy::permissionRank(QStringLiteral("write")));
    QVERIFY(AccessPolicy::permissionRank(QStringLiteral("write")) < AccessPolicy::permissionRank(QStringLiteral("maintain")));
    QVERIFY(AccessPolicy::permissionRank(QStringLiteral("maintain")) < AccessPolicy::permissionRank(QStringLiteral("admin")));

    // Case and whitespace do not matter
    QCOMPARE(AccessPolicy::permissionRank(QStringLiteral(" Admin ")), AccessPolicy::permissionRank(QStringLiteral("admin")));
}

void AccessPolicyTest::testUnknownPermissionRank()
{
    QCOMPARE(AccessPolicy::permissionRank(QStringLiteral("owner")), -1);
    QCOMPARE(AccessPolicy::permissionRank(QString()), -1);
}

void AccessPolicyTest::testDefaultRequiresWrite()
{
    AccessPolicy policy;
    QCOMPARE(policy.minimumPermission(), QStringLiteral("write"));
    QVERIFY(policy.check(QStringLiteral("alice"), QStringLiteral("write")).permitted);
    QVERIFY(!policy.check(QStringLiteral("bob"), QStringLiteral("read")).permitted);
}

void AccessPolicyTest::testHigherTierPermitted()
{
    AccessPolicy policy(QStringLiteral("triage"));
    QVERIFY(policy.check(QStringLiteral("alice"), QStringLiteral("triage")).permitted);
    QVERIFY(policy.check(QStringLiteral("alice"), QStringLiteral("maintain")).permitted);
    QVERIFY(policy.check(QStringLiteral("alice"), QStringLiteral("admin")).permitted);
}

void AccessPolicyTest::testLowerTierDenied()
{
    AccessPolicy policy(QStringLiteral("maintain"));
    QVERIFY(!policy.check(QStringLiteral("alice"), QStringLiteral("write")).permitted);
    QVERIFY(!policy.check(QStringLiteral("alice"), QStringLiteral("none")).permitted);
    QVERIFY(!policy.check(QStringLiteral("alice"), QString()).permitted);
    QVERIFY(!policy.check(QStringLiteral("alice"), QStringLiteral("bogus")).permitted);
}

void AccessPolicyTest::testTrustedUserAlwaysPermitted()
{
    AccessPolicy policy(QStringLiteral("admin"), {QStringLiteral("release-bot")});
    QVERIFY(policy.check(QStringLiteral("release-bot"), QStringLiteral("none")).permitted);
    QVERIFY(!policy.check(QStringLiteral("someone-else"), QStringLiteral("write")).permitted);
}

void AccessPolicyTest::testTrustedUserCaseInsensitive()
{
    AccessPolicy policy(QStringLiteral("admin"), {QStringLiteral("Alice")});
    QVERIFY(policy.check(QStringLiteral("alice"), QStringLiteral("read")).permitted);
}

void AccessPolicyTest::testUnknownMinimumFailsClosed()
{
    AccessPolicy policy(QStringLiteral("superuser"));
    AccessDecision decision = policy.check(QStringLiteral("alice"), QStringLiteral("admin"));
    QVERIFY(!decision.permitted);
    QVERIFY(decision.reason.contains(QStringLiteral("superuser")));
}

void AccessPolicyTest::testDenialReasonNamesActor()
{
    AccessPolicy policy(QStringLiteral("write"));
    AccessDecision decision = policy.check(QStringLiteral("mallory"), QStringLiteral("read"));
    QVERIFY(!decision.permitted);
    QVERIFY(decision.reason.contains(QStringLiteral("mallory")));
    QVERIFY(decision.reason.contains(QStringLiteral("write")));
}

void AccessPolicyTest::testSemiTrustedRole()
{
    AccessPolicy policy(QStringLiteral("maintain"));
    policy.setSemiTrustedRoles({QStringLiteral("Write"), QStringLiteral("triage")});

    AccessDecision decision = policy.check(QStringLiteral("alice"), QStringLiteral("write"));
    QVERIFY(decision.permitted);
    QVERIFY(decision.trust == TrustLevel::SemiTrusted);

    decision = policy.check(QStringLiteral("bob"), QStringLiteral("admin"));
    QVERIFY(decision.permitted);
    QVERIFY(decision.trust == TrustLevel::Trusted);

    decision = policy.check(QStringLiteral("carol"), QStringLiteral("read"));
    QVERIFY(!decision.permitted);
    QVERIFY(decision.trust == TrustLevel::Untrusted);
}

void AccessPolicyTest::testTrustedUserOutranksSemiTrustedRole()
{
    AccessPolicy policy(QStringLiteral("admin"), {QStringLiteral("alice")});
    policy.setSemiTrustedRoles({QStringLiteral("write")});

    QVERIFY(policy.check(QStringLiteral("alice"), QStringLiteral("write")).trust == TrustLevel::Trusted);
    QVERIFY(policy.check(QStringLiteral("bob"), QStringLiteral("write")).trust == TrustLevel::SemiTrusted);
}

void AccessPolicyTest::testUntrustedBehavior()
{
    AccessPolicy policy(QStringLiteral("write"));
    QVERIFY(!policy.check(QStringLiteral("mallory"), QStringLiteral("read")).respond);

    policy.setUntrustedBehavior(UntrustedBehavior::ReadOnlyResponse);
    AccessDecision decision = policy.check(QStringLiteral("mallory"), QStringLiteral("read"));
    QVERIFY(!decision.permitted);
    QVERIFY(decision.respond);

    // Permitted actors never get the notice
    QVERIFY(!policy.check(QStringLiteral("alice"), QStringLiteral("write")).respond);
}

void AccessPolicyTest::testBehaviorFromString()
{
    bool ok = false;
    QVERIFY(AccessPolicy::behaviorFromString(QStringLiteral("read-only-response"), &ok) == UntrustedBehavior::ReadOnlyResponse);
    QVERIFY(ok);
    QVERIFY(AccessPolicy::behaviorFromString(QStringLiteral(" Block "), &ok) == UntrustedBehavior::Block);
    QVERIFY(ok);
    QVERIFY(AccessPolicy::behaviorFromString(QStringLiteral("ignore"), &ok) == UntrustedBehavior::Block);
    QVERIFY(!ok);
}

QTEST_GUILESS_MAIN(AccessPolicyTest)

#include "moc_AccessPolicyTest.cpp"
