#pragma once

#include <QDateTime>
#include <QFileDevice>
#include <QString>
#include <QStringList>
#include <cstddef>
#include <optional>
#include <vector>

#include "tasktrack/data/Task.hpp"
#include "tasktrack/data/TaskCodec.hpp"
#include "tasktrack/data/TaskCollection.hpp"

namespace tasktrack {
namespace data {

struct TaskStoreError
{
    enum class Kind
    {
        Io,
        InvalidTask,
    };

    Kind kind = Kind::Io;

    // Io
    QString path;
    QFileDevice::FileError fileError = QFileDevice::NoError;
    QString ioMessage;

    // InvalidTask
    TaskParseError parseError;
    int lineNumber = 0;

    static TaskStoreError fromDevice(const QString &path, const QFileDevice &device);
    static TaskStoreError fromParseError(const TaskParseError &parseError, int lineNumber);

    QString description() const;
};

class TaskTracker
{
public:
    virtual ~TaskTracker() = default;

    // All tasks, sorted by deadline.
    virtual std::optional<std::vector<Task>> fetchTasks(TaskStoreError *error = nullptr) const = 0;
    virtual bool addTask(const QString &name, const QStringList &tags, const QDateTime &deadline,
                         TaskStoreError *error = nullptr) = 0;
    // |index| counts incomplete tasks only. Out of range is a successful no-op.
    virtual bool completeTask(std::size_t index, TaskStoreError *error = nullptr) = 0;
    virtual bool deleteTask(std::size_t index, TaskStoreError *error = nullptr) = 0;

    std::optional<std::vector<ListedTask>> listTasks(const ListFilter &filter, const QDateTime &now,
                                                     TaskStoreError *error = nullptr) const;
};

} // namespace data
} // namespace tasktrack
