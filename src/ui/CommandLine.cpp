#include "tasktrack/ui/CommandLine.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QRegularExpression>

#include "version.h"

#include "tasktrack/ui/DeadlineInput.hpp"

namespace tasktrack {
namespace ui {

namespace {
const QString ADD_COMMAND = QStringLiteral("add");
const QString COMPLETE_COMMAND = QStringLiteral("complete");
const QString DELETE_COMMAND = QStringLiteral("delete");
const QString LIST_COMMAND = QStringLiteral("list");

QCommandLineOption fileOption()
{
    return QCommandLineOption({ QStringLiteral("f"), QStringLiteral("file") },
                              QStringLiteral("Task file to use (default: ./database)."),
                              QStringLiteral("path"));
}

void setErrorMessage(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

bool fail(QString *errorMessage, const QString &message)
{
    setErrorMessage(errorMessage, message);
    return false;
}

bool containsLineBreak(const QString &text)
{
    return text.contains(QLatin1Char('\n')) || text.contains(QLatin1Char('\r'));
}

bool validateName(const QString &name, QString *errorMessage)
{
    if (name.isEmpty()) {
        return fail(errorMessage, QStringLiteral("Task name must not be empty."));
    }
    if (name.contains(QLatin1Char('|')) || containsLineBreak(name)) {
        return fail(errorMessage, QStringLiteral("Task name must not contain '|' or line breaks."));
    }
    return true;
}

bool collectTags(const QStringList &values, QStringList *tags, QString *errorMessage)
{
    for (const QString &value : values) {
        const QString tag = value.trimmed();
        if (tag.isEmpty()) {
            return fail(errorMessage, QStringLiteral("Tags must not be empty."));
        }
        if (tag.contains(QLatin1Char('|')) || tag.contains(QLatin1Char(',')) || containsLineBreak(tag)) {
            return fail(errorMessage, QStringLiteral("Tag '%1' must not contain '|', ',' or line breaks.").arg(tag));
        }
        if (!tags->contains(tag)) {
            tags->append(tag);
        }
    }
    return true;
}

std::optional<std::size_t> parseCount(const QString &text)
{
    static const QRegularExpression digits(QStringLiteral("^[0-9]+$"));
    if (!digits.match(text).hasMatch()) {
        return std::nullopt;
    }
    bool ok = false;
    const qulonglong value = text.toULongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(value);
}

bool rejectPositionals(const QCommandLineParser &parser, const QString &command, QString *errorMessage)
{
    const QStringList extra = parser.positionalArguments();
    if (!extra.isEmpty()) {
        return fail(errorMessage, QStringLiteral("Unexpected argument '%1' for '%2'.").arg(extra.first(), command));
    }
    return true;
}
} // namespace

CommandLine::CommandLine(QDateTime now)
    : m_now(std::move(now))
{
}

std::optional<ParsedCommand> CommandLine::parse(const QStringList &arguments, QString *errorMessage) const
{
    ParsedCommand command;

    QCommandLineParser global;
    global.setApplicationDescription(QStringLiteral("A todo CLI application"));
    global.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    const QCommandLineOption helpOption = global.addHelpOption();
    const QCommandLineOption versionOption = global.addVersionOption();
    const QCommandLineOption globalFile = fileOption();
    const QCommandLineOption verboseOption(QStringLiteral("verbose"), QStringLiteral("Print debug output."));
    global.addOption(globalFile);
    global.addOption(verboseOption);
    global.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("add | complete | delete | list"),
                                 QStringLiteral("<command> [options]"));

    if (!global.parse(arguments)) {
        setErrorMessage(errorMessage, global.errorText());
        return std::nullopt;
    }
    if (global.isSet(helpOption)) {
        command.kind = ParsedCommand::Kind::Help;
        command.text = global.helpText();
        return command;
    }
    if (global.isSet(versionOption)) {
        command.kind = ParsedCommand::Kind::Version;
        command.text = QStringLiteral("tasktrack %1").arg(QLatin1String(kTaskTrackVersion));
        return command;
    }
    if (global.isSet(globalFile)) {
        command.filePath = global.value(globalFile);
    }
    command.verbose = global.isSet(verboseOption);

    const QStringList positional = global.positionalArguments();
    if (positional.isEmpty()) {
        setErrorMessage(errorMessage, QStringLiteral("Missing command. Use --help to see the available commands."));
        return std::nullopt;
    }
    const QString name = positional.first();

    QCommandLineParser sub;
    const QCommandLineOption subHelp = sub.addHelpOption();
    const QCommandLineOption subFile = fileOption();
    sub.addOption(subFile);

    const QCommandLineOption nameOption({ QStringLiteral("n"), QStringLiteral("name") },
                                        QStringLiteral("Name of the task."), QStringLiteral("name"));
    const QCommandLineOption tagOption({ QStringLiteral("t"), QStringLiteral("tag") },
                                       QStringLiteral("Tag to categorize the task. Repeatable."), QStringLiteral("tag"));
    const QCommandLineOption deadlineOption({ QStringLiteral("d"), QStringLiteral("deadline") },
                                            QStringLiteral("Deadline: 'yyyy-MM-dd HH:mm', 'yyyy-MM-dd' or 'HH:mm'. "
                                                           "Defaults to today at 17:00."),
                                            QStringLiteral("when"));
    const QCommandLineOption allOption({ QStringLiteral("a"), QStringLiteral("all") },
                                       QStringLiteral("Also show completed tasks."));
    const QCommandLineOption overdueOption({ QStringLiteral("o"), QStringLiteral("overdue") },
                                           QStringLiteral("Only show tasks that are overdue."));
    const QCommandLineOption tagFilterOption({ QStringLiteral("t"), QStringLiteral("tag") },
                                             QStringLiteral("Only show tasks with this tag. Repeatable."),
                                             QStringLiteral("tag"));
    const QCommandLineOption numberOption({ QStringLiteral("n"), QStringLiteral("number") },
                                          QStringLiteral("Only show the next <count> tasks."), QStringLiteral("count"));

    if (name == ADD_COMMAND) {
        command.kind = ParsedCommand::Kind::Add;
        sub.setApplicationDescription(QStringLiteral("Adds a new task."));
        sub.addOption(nameOption);
        sub.addOption(tagOption);
        sub.addOption(deadlineOption);
    } else if (name == COMPLETE_COMMAND || name == DELETE_COMMAND) {
        const bool complete = name == COMPLETE_COMMAND;
        command.kind = complete ? ParsedCommand::Kind::Complete : ParsedCommand::Kind::Delete;
        sub.setApplicationDescription(complete ? QStringLiteral("Marks an existing task as finished.")
                                               : QStringLiteral("Removes a task."));
        sub.addPositionalArgument(QStringLiteral("id"),
                                  QStringLiteral("Id of the task, as shown by 'list'."));
    } else if (name == LIST_COMMAND) {
        command.kind = ParsedCommand::Kind::List;
        sub.setApplicationDescription(QStringLiteral("Shows incomplete tasks, soonest deadline first."));
        sub.addOption(allOption);
        sub.addOption(overdueOption);
        sub.addOption(tagFilterOption);
        sub.addOption(numberOption);
    } else {
        setErrorMessage(errorMessage, QStringLiteral("Unknown command '%1'. Use --help to see the available commands.").arg(name));
        return std::nullopt;
    }

    const QStringList subArguments = QStringList{ arguments.value(0) + QLatin1Char(' ') + name } + positional.mid(1);
    if (!sub.parse(subArguments)) {
        setErrorMessage(errorMessage, sub.errorText());
        return std::nullopt;
    }
    if (sub.isSet(subHelp)) {
        command.kind = ParsedCommand::Kind::Help;
        command.text = sub.helpText();
        return command;
    }
    if (sub.isSet(subFile)) {
        command.filePath = sub.value(subFile);
    }

    switch (command.kind) {
    case ParsedCommand::Kind::Add: {
        if (!rejectPositionals(sub, name, errorMessage)) {
            return std::nullopt;
        }
        if (!sub.isSet(nameOption)) {
            setErrorMessage(errorMessage, QStringLiteral("Missing required option --name."));
            return std::nullopt;
        }
        command.name = sub.value(nameOption).trimmed();
        if (!validateName(command.name, errorMessage)
            || !collectTags(sub.values(tagOption), &command.tags, errorMessage)) {
            return std::nullopt;
        }
        if (sub.isSet(deadlineOption)) {
            const auto deadline = DeadlineInput::parse(sub.value(deadlineOption), m_now, errorMessage);
            if (!deadline) {
                return std::nullopt;
            }
            command.deadline = *deadline;
        } else {
            command.deadline = DeadlineInput::defaultDeadline(m_now);
        }
        break;
    }
    case ParsedCommand::Kind::Complete:
    case ParsedCommand::Kind::Delete: {
        const QStringList ids = sub.positionalArguments();
        if (ids.size() != 1) {
            setErrorMessage(errorMessage, ids.isEmpty() ? QStringLiteral("Missing task id.")
                                                        : QStringLiteral("Expected a single task id."));
            return std::nullopt;
        }
        const auto index = parseCount(ids.first());
        if (!index) {
            setErrorMessage(errorMessage, QStringLiteral("Invalid task id '%1': expected a non-negative integer.").arg(ids.first()));
            return std::nullopt;
        }
        command.index = *index;
        break;
    }
    case ParsedCommand::Kind::List: {
        if (!rejectPositionals(sub, name, errorMessage)) {
            return std::nullopt;
        }
        command.filter.all = sub.isSet(allOption);
        command.filter.overdue = sub.isSet(overdueOption);
        if (!collectTags(sub.values(tagFilterOption), &command.filter.tags, errorMessage)) {
            return std::nullopt;
        }
        if (sub.isSet(numberOption)) {
            const auto limit = parseCount(sub.value(numberOption));
            if (!limit) {
                setErrorMessage(errorMessage,
                                QStringLiteral("Invalid count '%1': expected a non-negative integer.").arg(sub.value(numberOption)));
                return std::nullopt;
            }
            command.filter.limit = *limit;
        }
        break;
    }
    default:
        break;
    }

    return command;
}

} // namespace ui
} // namespace tasktrack
