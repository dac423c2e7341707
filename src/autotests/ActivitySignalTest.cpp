/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ActivitySignalTest.h"

// Qt
#include <QTest>

// Threadkeeper
#include "../threadkeeper/ActivitySignal.h"
#include "FakeCollaborators.h"

using namespace Threadkeeper;

namespace
{

EventRef commentRef()
{
    EventRef ref;
    ref.threadId = QStringLiteral("7");
    ref.commentId = 991;
    return ref;
}

} // namespace

void ActivitySignalTest::testBeginAddsMarkerToComment()
{
    FakePlatformClient platform;
    ActivitySignal activity(&platform);

    ActivityHandle handle = activity.begin(commentRef());
    QVERIFY(handle.open);
    QVERIFY(handle.hasMarker());
    QCOMPARE(platform.count(QStringLiteral("add")), 1);
    QCOMPARE(platform.reactionTargets.first(), qint64(991));
    QCOMPARE(platform.reactionContents.first(), QStringLiteral("eyes"));

    activity.end(handle);
}

void ActivitySignalTest::testBeginTargetsThreadForIssueEvents()
{
    FakePlatformClient platform;
    ActivitySignal activity(&platform);

    EventRef ref;
    ref.threadId = QStringLiteral("7");
    ActivityHandle handle = activity.begin(ref);

    QCOMPARE(platform.reactionTargets.first(), qint64(0));
    QCOMPARE(handle.target.threadId, QStringLiteral("7"));
    activity.end(handle);
}

void ActivitySignalTest::testEndRemovesMarker()
{
    FakePlatformClient platform;
    ActivitySignal activity(&platform);

    ActivityHandle handle = activity.begin(commentRef());
    activity.end(handle);

    QVERIFY(!handle.open);
    QCOMPARE(platform.removedReactions, QStringList({QStringLiteral("4242")}));
}

void ActivitySignalTest::testEndTwiceRemovesOnce()
{
    FakePlatformClient platform;
    ActivitySignal activity(&platform);

    ActivityHandle handle = activity.begin(commentRef());
    activity.end(handle);
    activity.end(handle);

    QCOMPARE(platform.count(QStringLiteral("remove")), 1);
}

void ActivitySignalTest::testAddFailureDoesNotAbort()
{
    FakePlatformClient platform;
    platform.addSucceeds = false;
    ActivitySignal activity(&platform);

    ActivityHandle handle = activity.begin(commentRef());
    QVERIFY(handle.open);
    QVERIFY(!handle.hasMarker());

    // Nothing to remove
    activity.end(handle);
    QCOMPARE(platform.count(QStringLiteral("remove")), 0);
    QVERIFY(!handle.open);
}

void ActivitySignalTest::testRemoveFailureIsTolerated()
{
    FakePlatformClient platform;
    platform.removeSucceeds = false;
    ActivitySignal activity(&platform);

    ActivityHandle handle = activity.begin(commentRef());
    activity.end(handle);

    QCOMPARE(platform.count(QStringLiteral("remove")), 1);
    QVERIFY(!handle.open);
}

void ActivitySignalTest::testGuardEndsOnScopeExit()
{
    FakePlatformClient platform;
    ActivitySignal activity(&platform);

    {
        ActivityGuard guard(activity, commentRef());
        QVERIFY(guard.handle().open);
        QCOMPARE(platform.count(QStringLiteral("add")), 1);
        QCOMPARE(platform.count(QStringLiteral("remove")), 0);
    }

    QCOMPARE(platform.count(QStringLiteral("remove")), 1);
    QCOMPARE(platform.calls, QStringList({QStringLiteral("add"), QStringLiteral("remove")}));
}

QTEST_GUILESS_MAIN(ActivitySignalTest)

#include "moc_ActivitySignalTest.cpp"
