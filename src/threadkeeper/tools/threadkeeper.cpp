/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    threadkeeper - answer an issue event with a persistent conversation

    Runs once per issue or comment event inside a CI job. The event is read
    from the payload file the CI system provides; the reply is posted to the
    issue and the conversation state is pushed back to the repository.

    Usage:
        threadkeeper [--root <dir>] [--event <payload.json>] [--event-name <name>]
        threadkeeper --check-enabled
        threadkeeper --preflight

    Exit codes:
        0 done, 1 usage or configuration error, 2 access denied,
        3 not enabled, 4 engine failure, 5 reply not posted,
        6 state not recorded
*/

#include "AgentDriver.h"
#include "Gate.h"
#include "GhPlatformClient.h"
#include "GitHistoryStore.h"
#include "InstallLayout.h"
#include "RunOrchestrator.h"
#include "StateCommitter.h"
#include "ThreadkeeperSettings.h"
#include "TriggerEvent.h"

#include <KLocalizedString>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QTextStream>

#include <utility>

using namespace Threadkeeper;

namespace
{

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_GATE_DENIED = 3;

QString resolveExecutable(const InstallLayout &layout, const ThreadkeeperSettings &settings)
{
    if (!settings.agentExecutable().isEmpty()) {
        return settings.agentExecutable();
    }

    // The installer puts the engine next to the configuration
    const QString bundled = layout.installDir() + QStringLiteral("/node_modules/.bin/pi");
    if (QFileInfo(bundled).isExecutable()) {
        return bundled;
    }
    return QStringLiteral("pi");
}

int runPreflight(const InstallLayout &layout, const ThreadkeeperSettings &settings)
{
    QTextStream out(stdout);
    QStringList problems = settings.validate();

    const GateResult gate = Gate(layout.sentinelPath()).checkEnabled();
    if (!gate.allowed) {
        problems.append(gate.reason);
    }

    const QString keyVariable = AgentDriver::requiredApiKeyVariable(settings.provider());
    if (!keyVariable.isEmpty() && qEnvironmentVariableIsEmpty(keyVariable.toLatin1().constData())) {
        problems.append(i18n("%1 is not set; provider %2 needs it", keyVariable, settings.provider()));
    }
    if (!GhPlatformClient::isAvailable()) {
        problems.append(i18n("gh is not installed"));
    }
    if (!GitHistoryStore::isAvailable()) {
        problems.append(i18n("git is not installed"));
    }

    if (problems.isEmpty()) {
        out << i18n("Threadkeeper is ready in %1", layout.rootDir()) << "\n";
        return 0;
    }

    for (const QString &problem : std::as_const(problems)) {
        out << "- " << problem << "\n";
    }
    return EXIT_USAGE;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("threadkeeper"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    KLocalizedString::setApplicationDomain("threadkeeper");

    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Answer an issue event with a persistent conversation"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption rootOption(QStringList() << QStringLiteral("r") << QStringLiteral("root"),
                                  i18n("Repository checkout (default: current directory)"),
                                  QStringLiteral("dir"));
    parser.addOption(rootOption);

    QCommandLineOption eventOption(QStringList() << QStringLiteral("e") << QStringLiteral("event"),
                                   i18n("Event payload file (default: $GITHUB_EVENT_PATH)"),
                                   QStringLiteral("path"));
    parser.addOption(eventOption);

    QCommandLineOption eventNameOption(QStringLiteral("event-name"),
                                       i18n("Event name, issues or issue_comment (default: $GITHUB_EVENT_NAME)"),
                                       QStringLiteral("name"));
    parser.addOption(eventNameOption);

    QCommandLineOption repositoryOption(QStringLiteral("repository"),
                                        i18n("owner/repo (default: $GITHUB_REPOSITORY)"),
                                        QStringLiteral("repo"));
    parser.addOption(repositoryOption);

    QCommandLineOption timeoutOption(QStringList() << QStringLiteral("t") << QStringLiteral("timeout"),
                                     i18n("Engine time budget in seconds (overrides the configuration)"),
                                     QStringLiteral("seconds"));
    parser.addOption(timeoutOption);

    QCommandLineOption checkEnabledOption(QStringLiteral("check-enabled"), i18n("Only check whether Threadkeeper is enabled"));
    parser.addOption(checkEnabledOption);

    QCommandLineOption preflightOption(QStringLiteral("preflight"), i18n("Validate configuration and tools, then exit"));
    parser.addOption(preflightOption);

    QCommandLineOption quietOption(QStringList() << QStringLiteral("q") << QStringLiteral("quiet"), i18n("Do not echo the engine stream"));
    parser.addOption(quietOption);

    parser.process(app);

    QTextStream err(stderr);
    const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    const InstallLayout layout(parser.value(rootOption));

    if (parser.isSet(checkEnabledOption)) {
        const GateResult gate = Gate(layout.sentinelPath()).checkEnabled();
        if (!gate.allowed) {
            err << gate.reason << "\n";
            return EXIT_GATE_DENIED;
        }
        return 0;
    }

    ThreadkeeperSettings settings(layout.configPath());

    if (parser.isSet(preflightOption)) {
        return runPreflight(layout, settings);
    }

    const QStringList problems = settings.validate();
    if (!problems.isEmpty()) {
        for (const QString &problem : problems) {
            err << "Error: " << problem << "\n";
        }
        return EXIT_USAGE;
    }

    const QString eventPath = parser.isSet(eventOption) ? parser.value(eventOption) : env.value(QStringLiteral("GITHUB_EVENT_PATH"));
    const QString eventName = parser.isSet(eventNameOption) ? parser.value(eventNameOption) : env.value(QStringLiteral("GITHUB_EVENT_NAME"));
    const QString repository = parser.isSet(repositoryOption) ? parser.value(repositoryOption) : env.value(QStringLiteral("GITHUB_REPOSITORY"));

    if (eventPath.isEmpty() || eventName.isEmpty()) {
        err << "Error: " << i18n("No event given; set --event and --event-name or run inside a CI job") << "\n";
        return EXIT_USAGE;
    }

    QString eventError;
    const TriggerEvent event = TriggerEvent::fromFile(eventPath, eventName, repository, &eventError);
    if (!event.isValid()) {
        err << "Error: " << eventError << "\n";
        return EXIT_USAGE;
    }
    if (event.repository.isEmpty()) {
        err << "Error: " << i18n("Repository unknown; set --repository or GITHUB_REPOSITORY") << "\n";
        return EXIT_USAGE;
    }

    if (TriggerEvent::isContinuousIntegration(env)) {
        qInfo() << "threadkeeper: Running in CI for" << event.repository;
    }

    GhPlatformClient platform(event.repository);

    AgentOptions agentOptions;
    agentOptions.executable = resolveExecutable(layout, settings);
    agentOptions.provider = settings.provider();
    agentOptions.model = settings.model();
    agentOptions.thinkingDepth = settings.thinkingDepth();
    agentOptions.toolAllowlist = settings.toolAllowlist();
    agentOptions.readOnlyTools = settings.readOnlyTools();
    agentOptions.workingDirectory = layout.rootDir();
    agentOptions.sessionsDir = InstallLayout::sessionsDirRelative();
    agentOptions.rawEventLogPath = settings.rawEventLogPath();
    // validate() has checked the configured budgets
    int timeoutSeconds = settings.agentTimeoutSeconds();
    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        timeoutSeconds = ThreadkeeperSettings::parseTimeoutSeconds(parser.value(timeoutOption), &ok);
        if (!ok) {
            err << "Error: "
                << i18n("--timeout expects 1 to %1 seconds, got \"%2\"", ThreadkeeperSettings::MAX_TIMEOUT_SECONDS, parser.value(timeoutOption)) << "\n";
            return EXIT_USAGE;
        }
    }
    agentOptions.timeoutMs = timeoutSeconds * 1000;
    agentOptions.exitGraceMs = settings.agentExitGraceSeconds() * 1000;
    agentOptions.echoStream = !parser.isSet(quietOption);
    agentOptions.environment = env;

    AgentDriver agent(agentOptions);

    GitHistoryStore store(layout.rootDir());
    store.setRemote(settings.remote());
    QString branch = settings.branch();
    if (branch.isEmpty()) {
        branch = event.defaultBranch.isEmpty() ? QStringLiteral("main") : event.defaultBranch;
    }
    store.setBranch(branch);
    store.setAuthor(settings.authorName(), settings.authorEmail());

    CommitPolicy policy;
    policy.maxAttempts = settings.commitAttempts();
    policy.backoffMs = settings.retryBackoffMs();
    policy.commitAllChanges = settings.commitAllChanges();
    StateCommitter committer(layout, &store, policy);

    RunOrchestrator orchestrator(layout, &platform, &agent, &committer);
    orchestrator.setAccessPolicy(settings.accessPolicy());
    orchestrator.setMaxCommentLength(settings.maxCommentLength());

    const RunOrchestrator::Outcome outcome = orchestrator.run(event);
    for (const QString &message : outcome.errors) {
        err << "Error: " << message << "\n";
    }

    return RunOrchestrator::exitCodeFor(outcome);
}
