#pragma once

#include <QDateTime>
#include <QStringList>
#include <QTextStream>

#include "tasktrack/ui/CommandLine.hpp"

namespace tasktrack {
namespace data {
class TaskTracker;
}

namespace ui {

// Runs exactly one command per process and maps its outcome to an exit code.
class Application
{
public:
    Application(QTextStream &out, QTextStream &err);

    int run(const QStringList &arguments, bool stdoutIsTerminal);
    int execute(const ParsedCommand &command, data::TaskTracker &tracker, bool colorOutput,
                const QDateTime &now = QDateTime::currentDateTime());

private:
    QTextStream &m_out;
    QTextStream &m_err;
};

} // namespace ui
} // namespace tasktrack
