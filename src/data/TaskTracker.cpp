#include "tasktrack/data/TaskTracker.hpp"

namespace tasktrack {
namespace data {

TaskStoreError TaskStoreError::fromDevice(const QString &path, const QFileDevice &device)
{
    TaskStoreError error;
    error.kind = Kind::Io;
    error.path = path;
    error.fileError = device.error();
    error.ioMessage = device.errorString();
    return error;
}

TaskStoreError TaskStoreError::fromParseError(const TaskParseError &parseError, int lineNumber)
{
    TaskStoreError error;
    error.kind = Kind::InvalidTask;
    error.parseError = parseError;
    error.lineNumber = lineNumber;
    return error;
}

QString TaskStoreError::description() const
{
    switch (kind) {
    case Kind::InvalidTask:
        return QStringLiteral("line %1: %2").arg(lineNumber).arg(parseError.message());
    case Kind::Io:
    default:
        return QStringLiteral("%1: %2").arg(path, ioMessage);
    }
}

std::optional<std::vector<ListedTask>> TaskTracker::listTasks(const ListFilter &filter, const QDateTime &now,
                                                              TaskStoreError *error) const
{
    const auto tasks = fetchTasks(error);
    if (!tasks) {
        return std::nullopt;
    }
    return TaskCollection::select(*tasks, filter, now);
}

} // namespace data
} // namespace tasktrack
