/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef THREADKEEPER_SETTINGS_H
#define THREADKEEPER_SETTINGS_H

#include "threadkeeper_export.h"

#include "AccessPolicy.h"

#include <QObject>
#include <QString>
#include <QStringList>

#include <KSharedConfig>

namespace Threadkeeper
{

/**
 * ThreadkeeperSettings reads and writes the per-repository configuration.
 *
 * The file lives at .threadkeeper/config/threadkeeperrc inside the checkout
 * and is committed together with the repository. A missing file yields the
 * defaults below.
 *
 * Settings include:
 * - Reasoning engine selection (provider, model, thinking depth, tool allowlist)
 * - Engine executable and time budget
 * - Maximum comment size for replies
 * - Git remote/branch and commit retry policy
 * - Minimum permission tier, trusted users and semi-trusted roles
 */
class THREADKEEPER_EXPORT ThreadkeeperSettings : public QObject
{
    Q_OBJECT

public:
    explicit ThreadkeeperSettings(const QString &configPath, QObject *parent = nullptr);
    ~ThreadkeeperSettings() override;

    QString configPath() const { return m_configPath; }

    // ========== Agent ==========

    /**
     * Backend provider passed to the engine (e.g. "anthropic", "openai")
     */
    QString provider() const;
    void setProvider(const QString &provider);

    /**
     * Engine-specific model identifier
     */
    QString model() const;
    void setModel(const QString &model);

    /**
     * Thinking depth: "low", "medium" or "high"
     */
    QString thinkingDepth() const;
    void setThinkingDepth(const QString &depth);

    /**
     * Tools the engine may use (empty = engine default)
     */
    QStringList toolAllowlist() const;
    void setToolAllowlist(const QStringList &tools);

    /**
     * Tools a semi-trusted actor's run is limited to
     */
    QStringList readOnlyTools() const;
    void setReadOnlyTools(const QStringList &tools);

    /**
     * Engine executable; empty means the installed default
     */
    QString agentExecutable() const;
    void setAgentExecutable(const QString &path);

    int agentTimeoutSeconds() const;
    void setAgentTimeoutSeconds(int seconds);

    /**
     * Upper bound for time budgets; keeps milliseconds within int
     */
    static constexpr int MAX_TIMEOUT_SECONDS = 24 * 60 * 60;

    /**
     * Parse a time budget given in seconds.
     *
     * @param ok Set to false for non-numbers and values outside 1..MAX_TIMEOUT_SECONDS
     */
    static int parseTimeoutSeconds(const QString &text, bool *ok);

    /**
     * How long the engine may linger after closing its output
     */
    int agentExitGraceSeconds() const;
    void setAgentExitGraceSeconds(int seconds);

    /**
     * Where the raw engine stream is copied to
     */
    QString rawEventLogPath() const;
    void setRawEventLogPath(const QString &path);

    // ========== Publish ==========

    int maxCommentLength() const;
    void setMaxCommentLength(int length);

    // ========== State ==========

    QString remote() const;
    void setRemote(const QString &remote);

    /**
     * Branch to push state to (empty = repository default branch)
     */
    QString branch() const;
    void setBranch(const QString &branch);

    int commitAttempts() const;
    void setCommitAttempts(int attempts);

    int retryBackoffMs() const;
    void setRetryBackoffMs(int ms);

    /**
     * Also commit files the engine edited, not just session state
     */
    bool commitAllChanges() const;
    void setCommitAllChanges(bool enabled);

    QString authorName() const;
    void setAuthorName(const QString &name);

    QString authorEmail() const;
    void setAuthorEmail(const QString &email);

    // ========== Access ==========

    /**
     * Lowest repository permission an actor needs: read, triage, write, maintain, admin
     */
    QString minimumPermission() const;
    void setMinimumPermission(const QString &permission);

    /**
     * Logins that are always allowed regardless of permission level
     */
    QStringList trustedUsers() const;
    void setTrustedUsers(const QStringList &users);

    /**
     * Permission levels whose actors run with read-only tools
     */
    QStringList semiTrustedRoles() const;
    void setSemiTrustedRoles(const QStringList &roles);

    /**
     * "block" (default) or "read-only-response"
     */
    QString untrustedBehavior() const;
    void setUntrustedBehavior(const QString &behavior);

    /**
     * Access policy built from the [Access] group
     */
    AccessPolicy accessPolicy() const;

    /**
     * Check the settings for values the engine or the run cannot work with.
     * Returns one human-readable line per problem; empty when valid.
     */
    QStringList validate() const;

    static QStringList thinkingDepths();

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    QString m_configPath;
    KSharedConfig::Ptr m_config;
};

} // namespace Threadkeeper

#endif // THREADKEEPER_SETTINGS_H
