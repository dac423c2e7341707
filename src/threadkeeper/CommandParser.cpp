/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "CommandParser.h"

#include <KLocalizedString>

#include <QRegularExpression>

namespace Threadkeeper
{

namespace
{

const QString AGENT = QStringLiteral("agent");
const QString HELP = QStringLiteral("help");
const QString STATUS = QStringLiteral("status");
const QString RESET = QStringLiteral("reset");

} // namespace

bool ParsedCommand::isLocal() const
{
    return command == HELP || command == STATUS || command == RESET;
}

QStringList CommandParser::supportedCommands()
{
    return {AGENT, HELP, STATUS, RESET};
}

bool CommandParser::isSupported(const QString &command)
{
    return supportedCommands().contains(command);
}

bool CommandParser::isMutation(const QString &command)
{
    return command == RESET;
}

QString CommandParser::description(const QString &command)
{
    if (command == AGENT) {
        return i18n("Run one engine turn with the rest of the comment");
    }
    if (command == HELP) {
        return i18n("Show the available commands");
    }
    if (command == STATUS) {
        return i18n("Show which conversation this issue continues");
    }
    if (command == RESET) {
        return i18n("Forget the conversation; the next message starts a new one");
    }
    return QString();
}

QString CommandParser::helpText()
{
    QStringList lines;
    lines << i18n("Commands (anything else is passed to the engine):") << QString();
    const QStringList commands = supportedCommands();
    for (const QString &command : commands) {
        lines << QStringLiteral("- `/%1` %2").arg(command, description(command));
    }
    return lines.join(QLatin1Char('\n'));
}

ParsedCommand CommandParser::parse(const QString &text)
{
    ParsedCommand parsed;
    parsed.rawText = text.trimmed();
    parsed.command = AGENT;
    parsed.agentInput = parsed.rawText;

    const int newline = parsed.rawText.indexOf(QLatin1Char('\n'));
    const QString firstLine = (newline < 0 ? parsed.rawText : parsed.rawText.left(newline)).trimmed();
    if (!firstLine.startsWith(QLatin1Char('/'))) {
        return parsed;
    }

    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    QStringList words = firstLine.mid(1).split(whitespace, Qt::SkipEmptyParts);
    const QString name = words.isEmpty() ? QString() : words.takeFirst().toLower();
    if (!isSupported(name)) {
        return parsed;
    }

    parsed.command = name;
    parsed.args = words;
    parsed.isSlashCommand = true;

    if (name == AGENT) {
        // Everything after "/agent", including further lines
        const int start = parsed.rawText.indexOf(QLatin1Char('/'));
        QString rest = parsed.rawText.mid(start + 1);
        rest = rest.mid(rest.indexOf(AGENT, 0, Qt::CaseInsensitive) + AGENT.size());
        parsed.agentInput = rest.trimmed();
    } else {
        parsed.agentInput.clear();
    }
    return parsed;
}

} // namespace Threadkeeper
