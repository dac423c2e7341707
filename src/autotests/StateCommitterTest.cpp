/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "StateCommitterTest.h"

// Qt
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

// Threadkeeper
#include "../threadkeeper/GitHistoryStore.h"
#include "../threadkeeper/InstallLayout.h"
#include "../threadkeeper/MappingRecord.h"
#include "../threadkeeper/StateCommitter.h"
#include "FakeCollaborators.h"

using namespace Threadkeeper;

namespace
{

using PushStatus = HistoryStore::PushStatus;

CommitPolicy fastPolicy(int attempts = 3)
{
    CommitPolicy policy;
    policy.maxAttempts = attempts;
    policy.backoffMs = 0;
    return policy;
}

MappingRecord recordFor(const InstallLayout &layout, const QString &threadId, const QString &logPath)
{
    MappingRecord record;
    record.threadId = threadId;
    record.logPath = layout.toRelative(logPath);
    record.updatedAt = QDateTime::currentDateTimeUtc();
    return record;
}

QString writeLog(const InstallLayout &layout, const QString &name)
{
    const QString path = layout.sessionsDir() + QLatin1Char('/') + name;
    QDir().mkpath(layout.sessionsDir());
    QFile file(path);
    if (file.open(QIODevice::WriteOnly)) {
        file.write("{\"type\":\"session\"}\n");
    }
    return path;
}

// Store that lets a concurrent run's record land during every rebase
class ConcurrentWriterStore : public FakeHistoryStore
{
public:
    bool rebaseOntoTip() override
    {
        MappingRecord other;
        other.threadId = QStringLiteral("7");
        other.logPath = QStringLiteral(".threadkeeper/state/sessions/other-run.jsonl");
        other.updatedAt = QDateTime::currentDateTimeUtc();
        if (!other.save(mappingPath)) {
            return false;
        }
        return FakeHistoryStore::rebaseOntoTip();
    }

    QString mappingPath;
};

bool runGit(const QString &workDir, const QStringList &args)
{
    QProcess git;
    git.setWorkingDirectory(workDir);
    git.start(QStringLiteral("git"), QStringList{QStringLiteral("-c"), QStringLiteral("user.name=Test"), QStringLiteral("-c"), QStringLiteral("user.email=test@example.com")} + args);
    if (!git.waitForFinished(30000)) {
        return false;
    }
    if (git.exitCode() != 0) {
        qWarning() << "git" << args << "failed:" << git.readAllStandardError();
    }
    return git.exitStatus() == QProcess::NormalExit && git.exitCode() == 0;
}

} // namespace

void StateCommitterTest::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void StateCommitterTest::cleanup()
{
    delete m_tempDir;
    m_tempDir = nullptr;
}

void StateCommitterTest::testBackoffIsCappedExponential()
{
    QCOMPARE(StateCommitter::backoffFor(1, 500, 4000), 500);
    QCOMPARE(StateCommitter::backoffFor(2, 500, 4000), 1000);
    QCOMPARE(StateCommitter::backoffFor(3, 500, 4000), 2000);
    QCOMPARE(StateCommitter::backoffFor(4, 500, 4000), 4000);
    QCOMPARE(StateCommitter::backoffFor(10, 500, 4000), 4000);
    QCOMPARE(StateCommitter::backoffFor(3, 0, 4000), 0);
}

void StateCommitterTest::testCommitMessage()
{
    QVERIFY(StateCommitter::commitMessage(QStringLiteral("7")).contains(QStringLiteral("#7")));
}

void StateCommitterTest::testFirstAttemptPushes()
{
    InstallLayout layout(m_tempDir->path());
    const QString log = writeLog(layout, QStringLiteral("a.jsonl"));

    FakeHistoryStore store;
    StateCommitter committer(layout, &store, fastPolicy());

    CommitResult result = committer.commit(QStringLiteral("7"), log, recordFor(layout, QStringLiteral("7"), log));
    QVERIFY(result.committed);
    QCOMPARE(result.attempts, 1);
    QCOMPARE(store.pushCalls, 1);
    QCOMPARE(store.rebaseCalls, 0);
    QCOMPARE(store.commitMessages.size(), 1);

    bool ok = false;
    MappingRecord stored = MappingRecord::load(layout.mappingPath(QStringLiteral("7")), &ok);
    QVERIFY(ok);
    QCOMPARE(layout.toAbsolute(stored.logPath), log);
}

void StateCommitterTest::testRetriesAfterRejection()
{
    InstallLayout layout(m_tempDir->path());
    const QString log = writeLog(layout, QStringLiteral("a.jsonl"));

    FakeHistoryStore store;
    store.pushScript = {PushStatus::Rejected, PushStatus::Rejected, PushStatus::Pushed};
    StateCommitter committer(layout, &store, fastPolicy(3));
    QSignalSpy spy(&committer, &StateCommitter::attemptFailed);

    CommitResult result = committer.commit(QStringLiteral("7"), log, recordFor(layout, QStringLiteral("7"), log));
    QVERIFY(result.committed);
    QCOMPARE(result.attempts, 3);
    QCOMPARE(store.rebaseCalls, 2);
    QCOMPARE(spy.count(), 2);
    QVERIFY(result.errorString.isEmpty());
}

void StateCommitterTest::testMappingRewrittenEachAttempt()
{
    InstallLayout layout(m_tempDir->path());
    const QString log = writeLog(layout, QStringLiteral("mine.jsonl"));

    ConcurrentWriterStore store;
    store.mappingPath = layout.mappingPath(QStringLiteral("7"));
    store.pushScript = {PushStatus::Rejected, PushStatus::Pushed};
    StateCommitter committer(layout, &store, fastPolicy(3));

    CommitResult result = committer.commit(QStringLiteral("7"), log, recordFor(layout, QStringLiteral("7"), log));
    QVERIFY(result.committed);
    QCOMPARE(result.attempts, 2);

    // The rebase brought in another run's record; ours is on top again
    bool ok = false;
    MappingRecord stored = MappingRecord::load(store.mappingPath, &ok);
    QVERIFY(ok);
    QCOMPARE(stored.logPath, layout.toRelative(log));
    QCOMPARE(store.commitMessages.size(), 2);
}

void StateCommitterTest::testExhaustionReportsFailure()
{
    InstallLayout layout(m_tempDir->path());
    const QString log = writeLog(layout, QStringLiteral("a.jsonl"));

    FakeHistoryStore store;
    store.pushScript = {PushStatus::Rejected, PushStatus::Failed, PushStatus::Rejected, PushStatus::Pushed};
    StateCommitter committer(layout, &store, fastPolicy(3));

    CommitResult result = committer.commit(QStringLiteral("7"), log, recordFor(layout, QStringLiteral("7"), log));
    QVERIFY(!result.committed);
    QCOMPARE(result.attempts, 3);
    QCOMPARE(store.pushCalls, 3);
    QVERIFY(!result.errorString.isEmpty());

    // No rebase after the last attempt
    QCOMPARE(store.rebaseCalls, 2);
}

void StateCommitterTest::testLogAndMappingStagedTogether()
{
    InstallLayout layout(m_tempDir->path());
    const QString log = writeLog(layout, QStringLiteral("a.jsonl"));

    FakeHistoryStore store;
    StateCommitter committer(layout, &store, fastPolicy());
    QVERIFY(committer.commit(QStringLiteral("7"), log, recordFor(layout, QStringLiteral("7"), log)).committed);

    QCOMPARE(store.stageCalls, 1);
    QCOMPARE(store.stagedPaths, QStringList({log, layout.mappingPath(QStringLiteral("7"))}));
    QCOMPARE(store.commitMessages.size(), 1);
}

void StateCommitterTest::testCommitAllChangesStagesWorkspace()
{
    InstallLayout layout(m_tempDir->path());
    const QString log = writeLog(layout, QStringLiteral("a.jsonl"));

    FakeHistoryStore withAll;
    StateCommitter all(layout, &withAll, fastPolicy());
    QVERIFY(all.commit(QStringLiteral("7"), log, recordFor(layout, QStringLiteral("7"), log)).committed);
    QCOMPARE(withAll.stageAllCalls, 1);

    CommitPolicy policy = fastPolicy();
    policy.commitAllChanges = false;
    FakeHistoryStore stateOnly;
    StateCommitter state(layout, &stateOnly, policy);
    QVERIFY(state.commit(QStringLiteral("7"), log, recordFor(layout, QStringLiteral("7"), log)).committed);
    QCOMPARE(stateOnly.stageAllCalls, 0);
}

void StateCommitterTest::testStageFailureStops()
{
    InstallLayout layout(m_tempDir->path());
    const QString log = writeLog(layout, QStringLiteral("a.jsonl"));

    FakeHistoryStore store;
    store.stageSucceeds = false;
    StateCommitter committer(layout, &store, fastPolicy());

    CommitResult result = committer.commit(QStringLiteral("7"), log, recordFor(layout, QStringLiteral("7"), log));
    QVERIFY(!result.committed);
    QCOMPARE(store.pushCalls, 0);
    QCOMPARE(result.errorString, QStringLiteral("scripted failure"));
}

void StateCommitterTest::testMissingLogCommitsNothing()
{
    InstallLayout layout(m_tempDir->path());
    const QString log = layout.sessionsDir() + QStringLiteral("/never-written.jsonl");

    FakeHistoryStore store;
    StateCommitter committer(layout, &store, fastPolicy());

    CommitResult result = committer.commit(QStringLiteral("7"), log, recordFor(layout, QStringLiteral("7"), log));
    QVERIFY(!result.committed);
    QVERIFY(result.errorString.contains(QStringLiteral("never-written.jsonl")));
    QVERIFY(!QFileInfo::exists(layout.mappingPath(QStringLiteral("7"))));
    QCOMPARE(store.stageCalls, 0);
    QCOMPARE(store.pushCalls, 0);
    QVERIFY(store.commitMessages.isEmpty());
}

void StateCommitterTest::testStagedCheckFailureStops()
{
    InstallLayout layout(m_tempDir->path());
    const QString log = writeLog(layout, QStringLiteral("a.jsonl"));

    FakeHistoryStore store;
    store.inspectSucceeds = false;
    StateCommitter committer(layout, &store, fastPolicy());

    CommitResult result = committer.commit(QStringLiteral("7"), log, recordFor(layout, QStringLiteral("7"), log));
    QVERIFY(!result.committed);
    QCOMPARE(result.errorString, QStringLiteral("scripted failure"));
    QVERIFY(store.commitMessages.isEmpty());
    QCOMPARE(store.pushCalls, 0);
}

void StateCommitterTest::testClearRemovesMapping()
{
    InstallLayout layout(m_tempDir->path());
    const QString log = writeLog(layout, QStringLiteral("a.jsonl"));
    const QString mapping = layout.mappingPath(QStringLiteral("7"));
    QVERIFY(recordFor(layout, QStringLiteral("7"), log).save(mapping));

    FakeHistoryStore store;
    store.pushScript = {PushStatus::Rejected, PushStatus::Pushed};
    StateCommitter committer(layout, &store, fastPolicy());

    CommitResult result = committer.clear(QStringLiteral("7"));
    QVERIFY(result.committed);
    QCOMPARE(result.attempts, 2);
    QVERIFY(!QFileInfo::exists(mapping));
    QVERIFY(QFileInfo::exists(log));
    QCOMPARE(store.stagedPaths, QStringList({mapping}));
    QCOMPARE(store.commitMessages, QStringList({StateCommitter::clearMessage(QStringLiteral("7"))}));
}

void StateCommitterTest::testClearWithoutMappingStagesNothing()
{
    InstallLayout layout(m_tempDir->path());

    FakeHistoryStore store;
    StateCommitter committer(layout, &store, fastPolicy());

    CommitResult result = committer.clear(QStringLiteral("7"));
    QVERIFY(result.committed);
    QCOMPARE(store.stageCalls, 0);
    QVERIFY(store.commitMessages.isEmpty());
}

void StateCommitterTest::testGitConcurrentWritersBothLand()
{
    if (!GitHistoryStore::isAvailable()) {
        QSKIP("git not available");
    }

    const QString root = m_tempDir->path();
    const QString origin = root + QStringLiteral("/origin.git");
    const QString first = root + QStringLiteral("/first");
    const QString second = root + QStringLiteral("/second");
    const QString check = root + QStringLiteral("/check");

    QVERIFY(runGit(root, {QStringLiteral("init"), QStringLiteral("--bare"), origin}));
    QVERIFY(runGit(origin, {QStringLiteral("symbolic-ref"), QStringLiteral("HEAD"), QStringLiteral("refs/heads/main")}));

    // Seed the remote
    QVERIFY(runGit(root, {QStringLiteral("clone"), origin, first}));
    {
        QFile readme(first + QStringLiteral("/README.md"));
        QVERIFY(readme.open(QIODevice::WriteOnly));
        readme.write("widgets\n");
    }
    QVERIFY(runGit(first, {QStringLiteral("add"), QStringLiteral("README.md")}));
    QVERIFY(runGit(first, {QStringLiteral("commit"), QStringLiteral("-m"), QStringLiteral("init")}));
    QVERIFY(runGit(first, {QStringLiteral("push"), QStringLiteral("origin"), QStringLiteral("HEAD:main")}));

    // Second checkout starts from the same tip
    QVERIFY(runGit(root, {QStringLiteral("clone"), origin, second}));

    InstallLayout firstLayout(first);
    GitHistoryStore firstStore(first);
    firstStore.setAuthor(QStringLiteral("threadkeeper[bot]"), QStringLiteral("bot@example.com"));
    StateCommitter firstCommitter(firstLayout, &firstStore, fastPolicy());
    const QString firstLog = writeLog(firstLayout, QStringLiteral("first.jsonl"));
    CommitResult firstResult = firstCommitter.commit(QStringLiteral("7"), firstLog, recordFor(firstLayout, QStringLiteral("7"), firstLog));
    QVERIFY2(firstResult.committed, qPrintable(firstResult.errorString));
    QCOMPARE(firstResult.attempts, 1);

    // Pushes onto a tip that moved after its checkout
    InstallLayout secondLayout(second);
    GitHistoryStore secondStore(second);
    secondStore.setAuthor(QStringLiteral("threadkeeper[bot]"), QStringLiteral("bot@example.com"));
    StateCommitter secondCommitter(secondLayout, &secondStore, fastPolicy());
    const QString secondLog = writeLog(secondLayout, QStringLiteral("second.jsonl"));
    CommitResult secondResult = secondCommitter.commit(QStringLiteral("8"), secondLog, recordFor(secondLayout, QStringLiteral("8"), secondLog));
    QVERIFY2(secondResult.committed, qPrintable(secondResult.errorString));
    QCOMPARE(secondResult.attempts, 2);

    QVERIFY(runGit(root, {QStringLiteral("clone"), origin, check}));
    InstallLayout checkLayout(check);
    bool ok = false;
    QCOMPARE(MappingRecord::load(checkLayout.mappingPath(QStringLiteral("7")), &ok).logPath, QStringLiteral(".threadkeeper/state/sessions/first.jsonl"));
    QVERIFY(ok);
    QCOMPARE(MappingRecord::load(checkLayout.mappingPath(QStringLiteral("8")), &ok).logPath, QStringLiteral(".threadkeeper/state/sessions/second.jsonl"));
    QVERIFY(ok);
    QVERIFY(QFileInfo::exists(checkLayout.sessionsDir() + QStringLiteral("/first.jsonl")));
    QVERIFY(QFileInfo::exists(checkLayout.sessionsDir() + QStringLiteral("/second.jsonl")));
}

void StateCommitterTest::testGitRetryKeepsUncommittedEdits()
{
    if (!GitHistoryStore::isAvailable()) {
        QSKIP("git not available");
    }

    const QString root = m_tempDir->path();
    const QString origin = root + QStringLiteral("/origin.git");
    const QString first = root + QStringLiteral("/first");
    const QString second = root + QStringLiteral("/second");
    const QString check = root + QStringLiteral("/check");

    QVERIFY(runGit(root, {QStringLiteral("init"), QStringLiteral("--bare"), origin}));
    QVERIFY(runGit(origin, {QStringLiteral("symbolic-ref"), QStringLiteral("HEAD"), QStringLiteral("refs/heads/main")}));
    QVERIFY(runGit(root, {QStringLiteral("clone"), origin, first}));
    {
        QFile readme(first + QStringLiteral("/README.md"));
        QVERIFY(readme.open(QIODevice::WriteOnly));
        readme.write("widgets\n");
    }
    QVERIFY(runGit(first, {QStringLiteral("add"), QStringLiteral("README.md")}));
    QVERIFY(runGit(first, {QStringLiteral("commit"), QStringLiteral("-m"), QStringLiteral("init")}));
    QVERIFY(runGit(first, {QStringLiteral("push"), QStringLiteral("origin"), QStringLiteral("HEAD:main")}));
    QVERIFY(runGit(root, {QStringLiteral("clone"), origin, second}));

    CommitPolicy stateOnly = fastPolicy();
    stateOnly.commitAllChanges = false;

    InstallLayout firstLayout(first);
    GitHistoryStore firstStore(first);
    firstStore.setAuthor(QStringLiteral("threadkeeper[bot]"), QStringLiteral("bot@example.com"));
    StateCommitter firstCommitter(firstLayout, &firstStore, stateOnly);
    const QString firstLog = writeLog(firstLayout, QStringLiteral("first.jsonl"));
    QVERIFY(firstCommitter.commit(QStringLiteral("7"), firstLog, recordFor(firstLayout, QStringLiteral("7"), firstLog)).committed);

    // The engine edited a tracked file that is not part of the state commit
    {
        QFile readme(second + QStringLiteral("/README.md"));
        QVERIFY(readme.open(QIODevice::WriteOnly | QIODevice::Truncate));
        readme.write("edited by the engine\n");
    }

    InstallLayout secondLayout(second);
    GitHistoryStore secondStore(second);
    secondStore.setAuthor(QStringLiteral("threadkeeper[bot]"), QStringLiteral("bot@example.com"));
    StateCommitter secondCommitter(secondLayout, &secondStore, stateOnly);
    const QString secondLog = writeLog(secondLayout, QStringLiteral("second.jsonl"));
    CommitResult result = secondCommitter.commit(QStringLiteral("8"), secondLog, recordFor(secondLayout, QStringLiteral("8"), secondLog));
    QVERIFY2(result.committed, qPrintable(result.errorString));
    QCOMPARE(result.attempts, 2);

    // The edit survives locally and stays out of the pushed history
    {
        QFile readme(second + QStringLiteral("/README.md"));
        QVERIFY(readme.open(QIODevice::ReadOnly));
        QCOMPARE(readme.readAll(), QByteArray("edited by the engine\n"));
    }
    QVERIFY(runGit(root, {QStringLiteral("clone"), origin, check}));
    {
        QFile readme(check + QStringLiteral("/README.md"));
        QVERIFY(readme.open(QIODevice::ReadOnly));
        QCOMPARE(readme.readAll(), QByteArray("widgets\n"));
    }
    InstallLayout checkLayout(check);
    QVERIFY(QFileInfo::exists(checkLayout.mappingPath(QStringLiteral("7"))));
    QVERIFY(QFileInfo::exists(checkLayout.mappingPath(QStringLiteral("8"))));
}

void StateCommitterTest::testGitRejectedPushDetection()
{
    QVERIFY(GitHistoryStore::isRejectedPushOutput(QStringLiteral(" ! [rejected]        HEAD -> main (fetch first)\n"
                                                                  "error: failed to push some refs to 'origin'")));
    QVERIFY(GitHistoryStore::isRejectedPushOutput(QStringLiteral(" ! [rejected]        HEAD -> main (non-fast-forward)")));
    QVERIFY(!GitHistoryStore::isRejectedPushOutput(QStringLiteral("fatal: Authentication failed for 'https://github.com/acme/widgets'")));
    QVERIFY(!GitHistoryStore::isRejectedPushOutput(QString()));
}

QTEST_GUILESS_MAIN(StateCommitterTest)

#include "moc_StateCommitterTest.cpp"
