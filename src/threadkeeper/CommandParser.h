/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef COMMANDPARSER_H
#define COMMANDPARSER_H

#include "threadkeeper_export.h"

#include <QString>
#include <QStringList>

namespace Threadkeeper
{

/**
 * A comment split into a command and its arguments.
 *
 * Plain text is the "agent" command with the whole comment as input.
 */
struct THREADKEEPER_EXPORT ParsedCommand {
    QString command;        // lower case, without the slash
    QStringList args;       // whitespace separated words after the command on the first line
    QString rawText;        // the trimmed comment
    QString agentInput;     // what the engine receives when the command runs it
    bool isSlashCommand = false;

    /**
     * Whether the command is answered without running the engine
     */
    bool isLocal() const;
};

/**
 * CommandParser recognizes slash commands at the start of a comment.
 *
 * Only the first line is inspected. "/agent <text>" hands <text> to the
 * engine; unknown commands are treated as plain text so a comment that
 * merely starts with a path still reaches the engine.
 */
class THREADKEEPER_EXPORT CommandParser
{
public:
    static ParsedCommand parse(const QString &text);

    static QStringList supportedCommands();
    static bool isSupported(const QString &command);

    /**
     * Commands that change the recorded state; restricted to trusted actors
     */
    static bool isMutation(const QString &command);

    static QString description(const QString &command);

    /**
     * Markdown list of the supported commands
     */
    static QString helpText();

private:
    CommandParser() = default;
};

} // namespace Threadkeeper

#endif // COMMANDPARSER_H
