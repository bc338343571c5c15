#include "tasktrack/ui/Application.hpp"

#include <QProcessEnvironment>
#include <QSettings>

#include "tasktrack/core/AppConfig.hpp"
#include "tasktrack/core/Logging.hpp"
#include "tasktrack/data/PlainTextTaskTracker.hpp"
#include "tasktrack/ui/TaskTable.hpp"

namespace tasktrack {
namespace ui {

namespace {
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
} // namespace

Application::Application(QTextStream &out, QTextStream &err)
    : m_out(out)
    , m_err(err)
{
}

int Application::run(const QStringList &arguments, bool stdoutIsTerminal)
{
    const QDateTime now = QDateTime::currentDateTime();
    QString errorMessage;
    const auto command = CommandLine(now).parse(arguments, &errorMessage);
    if (!command) {
        m_err << errorMessage << '\n';
        m_err.flush();
        return EXIT_FAILED;
    }

    if (command->kind == ParsedCommand::Kind::Help || command->kind == ParsedCommand::Kind::Version) {
        m_out << command->text;
        if (!command->text.endsWith(QLatin1Char('\n'))) {
            m_out << '\n';
        }
        m_out.flush();
        return EXIT_OK;
    }

    if (command->verbose) {
        core::enableVerboseLogging();
    }

    QSettings settings;
    const auto config = core::AppConfig::resolve(command->filePath, settings,
                                                 QProcessEnvironment::systemEnvironment(), stdoutIsTerminal);
    data::PlainTextTaskTracker tracker(config.filePath());
    return execute(*command, tracker, config.colorOutput(), now);
}

int Application::execute(const ParsedCommand &command, data::TaskTracker &tracker, bool colorOutput,
                         const QDateTime &now)
{
    data::TaskStoreError error;
    bool ok = true;

    switch (command.kind) {
    case ParsedCommand::Kind::Add:
        ok = tracker.addTask(command.name, command.tags, command.deadline, &error);
        break;
    case ParsedCommand::Kind::Complete:
        ok = tracker.completeTask(command.index, &error);
        break;
    case ParsedCommand::Kind::Delete:
        ok = tracker.deleteTask(command.index, &error);
        break;
    case ParsedCommand::Kind::List: {
        const auto rows = tracker.listTasks(command.filter, now, &error);
        ok = rows.has_value();
        if (ok) {
            TaskTableOptions options;
            options.showIds = !command.filter.all;
            options.colorize = colorOutput;
            options.now = now;
            m_out << TaskTable::render(*rows, options);
            m_out.flush();
        }
        break;
    }
    default:
        break;
    }

    if (!ok) {
        qCDebug(core::lcApp) << "Command failed:" << error.description();
        m_err << QStringLiteral("Process failed: %1").arg(error.description()) << '\n';
        m_err.flush();
        return EXIT_FAILED;
    }
    return EXIT_OK;
}

} // namespace ui
} // namespace tasktrack
