/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ThreadkeeperSettings.h"

#include <KConfigGroup>
#include <KLocalizedString>
#include <QDir>

namespace Threadkeeper
{

ThreadkeeperSettings::ThreadkeeperSettings(const QString &configPath, QObject *parent)
    : QObject(parent)
    , m_configPath(configPath)
{
    // Absolute path: no XDG lookup, no cascading with system-wide files
    m_config = KSharedConfig::openConfig(configPath, KConfig::SimpleConfig);
}

ThreadkeeperSettings::~ThreadkeeperSettings() = default;

QString ThreadkeeperSettings::provider() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("Provider", QStringLiteral("anthropic"));
}

void ThreadkeeperSettings::setProvider(const QString &provider)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("Provider", provider);
    Q_EMIT settingsChanged();
}

QString ThreadkeeperSettings::model() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("Model", QStringLiteral("claude-sonnet-4"));
}

void ThreadkeeperSettings::setModel(const QString &model)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("Model", model);
    Q_EMIT settingsChanged();
}

QString ThreadkeeperSettings::thinkingDepth() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("ThinkingDepth", QStringLiteral("high"));
}

void ThreadkeeperSettings::setThinkingDepth(const QString &depth)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("ThinkingDepth", depth);
    Q_EMIT settingsChanged();
}

QStringList ThreadkeeperSettings::toolAllowlist() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("ToolAllowlist", QStringList());
}

void ThreadkeeperSettings::setToolAllowlist(const QStringList &tools)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("ToolAllowlist", tools);
    Q_EMIT settingsChanged();
}

QStringList ThreadkeeperSettings::readOnlyTools() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("ReadOnlyTools", QStringList{QStringLiteral("read"), QStringLiteral("grep"), QStringLiteral("find"), QStringLiteral("ls")});
}

void ThreadkeeperSettings::setReadOnlyTools(const QStringList &tools)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("ReadOnlyTools", tools);
    Q_EMIT settingsChanged();
}

QString ThreadkeeperSettings::agentExecutable() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("Executable", QString());
}

void ThreadkeeperSettings::setAgentExecutable(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("Executable", path);
    Q_EMIT settingsChanged();
}

int ThreadkeeperSettings::agentTimeoutSeconds() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("TimeoutSeconds", 300);
}

void ThreadkeeperSettings::setAgentTimeoutSeconds(int seconds)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("TimeoutSeconds", seconds);
    Q_EMIT settingsChanged();
}

int ThreadkeeperSettings::parseTimeoutSeconds(const QString &text, bool *ok)
{
    bool numeric = false;
    const int seconds = text.trimmed().toInt(&numeric);
    const bool valid = numeric && seconds > 0 && seconds <= MAX_TIMEOUT_SECONDS;
    if (ok) {
        *ok = valid;
    }
    return valid ? seconds : 0;
}

int ThreadkeeperSettings::agentExitGraceSeconds() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("ExitGraceSeconds", 10);
}

void ThreadkeeperSettings::setAgentExitGraceSeconds(int seconds)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("ExitGraceSeconds", seconds);
    Q_EMIT settingsChanged();
}

QString ThreadkeeperSettings::rawEventLogPath() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("RawEventLog", QDir::tempPath() + QStringLiteral("/threadkeeper-agent-raw.jsonl"));
}

void ThreadkeeperSettings::setRawEventLogPath(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("RawEventLog", path);
    Q_EMIT settingsChanged();
}

int ThreadkeeperSettings::maxCommentLength() const
{
    // GitHub rejects comments above 65536 characters; stay well below
    KConfigGroup group(m_config, QStringLiteral("Publish"));
    return group.readEntry("MaxCommentLength", 60000);
}

void ThreadkeeperSettings::setMaxCommentLength(int length)
{
    KConfigGroup group(m_config, QStringLiteral("Publish"));
    group.writeEntry("MaxCommentLength", length);
    Q_EMIT settingsChanged();
}

QString ThreadkeeperSettings::remote() const
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    return group.readEntry("Remote", QStringLiteral("origin"));
}

void ThreadkeeperSettings::setRemote(const QString &remote)
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    group.writeEntry("Remote", remote);
    Q_EMIT settingsChanged();
}

QString ThreadkeeperSettings::branch() const
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    return group.readEntry("Branch", QString());
}

void ThreadkeeperSettings::setBranch(const QString &branch)
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    group.writeEntry("Branch", branch);
    Q_EMIT settingsChanged();
}

int ThreadkeeperSettings::commitAttempts() const
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    return group.readEntry("CommitAttempts", 3);
}

void ThreadkeeperSettings::setCommitAttempts(int attempts)
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    group.writeEntry("CommitAttempts", attempts);
    Q_EMIT settingsChanged();
}

int ThreadkeeperSettings::retryBackoffMs() const
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    return group.readEntry("RetryBackoffMs", 500);
}

void ThreadkeeperSettings::setRetryBackoffMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    group.writeEntry("RetryBackoffMs", ms);
    Q_EMIT settingsChanged();
}

bool ThreadkeeperSettings::commitAllChanges() const
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    return group.readEntry("CommitAllChanges", true);
}

void ThreadkeeperSettings::setCommitAllChanges(bool enabled)
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    group.writeEntry("CommitAllChanges", enabled);
    Q_EMIT settingsChanged();
}

QString ThreadkeeperSettings::authorName() const
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    return group.readEntry("AuthorName", QStringLiteral("threadkeeper[bot]"));
}

void ThreadkeeperSettings::setAuthorName(const QString &name)
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    group.writeEntry("AuthorName", name);
    Q_EMIT settingsChanged();
}

QString ThreadkeeperSettings::authorEmail() const
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    return group.readEntry("AuthorEmail", QStringLiteral("threadkeeper[bot]@users.noreply.github.com"));
}

void ThreadkeeperSettings::setAuthorEmail(const QString &email)
{
    KConfigGroup group(m_config, QStringLiteral("State"));
    group.writeEntry("AuthorEmail", email);
    Q_EMIT settingsChanged();
}

QString ThreadkeeperSettings::minimumPermission() const
{
    KConfigGroup group(m_config, QStringLiteral("Access"));
    return group.readEntry("MinimumPermission", QStringLiteral("write"));
}

void ThreadkeeperSettings::setMinimumPermission(const QString &permission)
{
    KConfigGroup group(m_config, QStringLiteral("Access"));
    group.writeEntry("MinimumPermission", permission);
    Q_EMIT settingsChanged();
}

QStringList ThreadkeeperSettings::trustedUsers() const
{
    KConfigGroup group(m_config, QStringLiteral("Access"));
    return group.readEntry("TrustedUsers", QStringList());
}

void ThreadkeeperSettings::setTrustedUsers(const QStringList &users)
{
    KConfigGroup group(m_config, QStringLiteral("Access"));
    group.writeEntry("TrustedUsers", users);
    Q_EMIT settingsChanged();
}

QStringList ThreadkeeperSettings::semiTrustedRoles() const
{
    KConfigGroup group(m_config, QStringLiteral("Access"));
    return group.readEntry("SemiTrustedRoles", QStringList());
}

void ThreadkeeperSettings::setSemiTrustedRoles(const QStringList &roles)
{
    KConfigGroup group(m_config, QStringLiteral("Access"));
    group.writeEntry("SemiTrustedRoles", roles);
    Q_EMIT settingsChanged();
}

QString ThreadkeeperSettings::untrustedBehavior() const
{
    KConfigGroup group(m_config, QStringLiteral("Access"));
    return group.readEntry("UntrustedBehavior", QStringLiteral("block"));
}

void ThreadkeeperSettings::setUntrustedBehavior(const QString &behavior)
{
    KConfigGroup group(m_config, QStringLiteral("Access"));
    group.writeEntry("UntrustedBehavior", behavior);
    Q_EMIT settingsChanged();
}

AccessPolicy ThreadkeeperSettings::accessPolicy() const
{
    AccessPolicy policy(minimumPermission(), trustedUsers());
    policy.setSemiTrustedRoles(semiTrustedRoles());
    policy.setUntrustedBehavior(AccessPolicy::behaviorFromString(untrustedBehavior()));
    return policy;
}

QStringList ThreadkeeperSettings::thinkingDepths()
{
    return {QStringLiteral("low"), QStringLiteral("medium"), QStringLiteral("high")};
}

QStringList ThreadkeeperSettings::validate() const
{
    QStringList errors;

    if (provider().trimmed().isEmpty()) {
        errors << i18n("[Agent] Provider must not be empty");
    }
    if (model().trimmed().isEmpty()) {
        errors << i18n("[Agent] Model must not be empty");
    }
    if (!thinkingDepths().contains(thinkingDepth())) {
        errors << i18n("[Agent] ThinkingDepth must be one of [%1], got \"%2\"", thinkingDepths().join(QStringLiteral(", ")), thinkingDepth());
    }
    if (agentTimeoutSeconds() <= 0 || agentTimeoutSeconds() > MAX_TIMEOUT_SECONDS) {
        errors << i18n("[Agent] TimeoutSeconds must be between 1 and %1", MAX_TIMEOUT_SECONDS);
    }
    if (agentExitGraceSeconds() < 0 || agentExitGraceSeconds() > MAX_TIMEOUT_SECONDS) {
        errors << i18n("[Agent] ExitGraceSeconds must be between 0 and %1", MAX_TIMEOUT_SECONDS);
    }
    if (maxCommentLength() <= 0) {
        errors << i18n("[Publish] MaxCommentLength must be positive");
    }
    if (remote().trimmed().isEmpty()) {
        errors << i18n("[State] Remote must not be empty");
    }
    if (commitAttempts() < 1) {
        errors << i18n("[State] CommitAttempts must be at least 1");
    }
    if (retryBackoffMs() < 0) {
        errors << i18n("[State] RetryBackoffMs must not be negative");
    }
    const QString permission = minimumPermission();
    if (AccessPolicy::permissionRank(permission) <= AccessPolicy::permissionRank(QStringLiteral("none"))) {
        errors << i18n("[Access] MinimumPermission must be one of [%1], got \"%2\"",
                       AccessPolicy::permissionLevels().mid(1).join(QStringLiteral(", ")),
                       permission);
    }
    const QStringList roles = semiTrustedRoles();
    for (const QString &role : roles) {
        if (AccessPolicy::permissionRank(role) <= AccessPolicy::permissionRank(QStringLiteral("none"))) {
            errors << i18n("[Access] SemiTrustedRoles contains invalid value \"%1\" (must be one of [%2])",
                           role,
                           AccessPolicy::permissionLevels().mid(1).join(QStringLiteral(", ")));
        }
    }
    bool behaviorOk = false;
    AccessPolicy::behaviorFromString(untrustedBehavior(), &behaviorOk);
    if (!behaviorOk) {
        errors << i18n("[Access] UntrustedBehavior must be one of [%1], got \"%2\"",
                       AccessPolicy::behaviorNames().join(QStringLiteral(", ")),
                       untrustedBehavior());
    }
    if (readOnlyTools().isEmpty()) {
        errors << i18n("[Agent] ReadOnlyTools must not be empty");
    }

    return errors;
}

void ThreadkeeperSettings::save()
{
    m_config->sync();
}

} // namespace Threadkeeper

#include "moc_ThreadkeeperSettings.cpp"
