#include "tasktrack/data/PlainTextTaskTracker.hpp"

#include <QFile>
#include <QSaveFile>
#include <QTextCodec>

#include "tasktrack/core/Logging.hpp"

namespace tasktrack {
namespace data {

PlainTextTaskTracker::PlainTextTaskTracker(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &PlainTextTaskTracker::filePath() const
{
    return m_filePath;
}

std::optional<std::vector<Task>> PlainTextTaskTracker::fetchTasks(TaskStoreError *error) const
{
    if (!ensureFileExists(error)) {
        return std::nullopt;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(core::lcStore) << "Cannot open" << m_filePath << "for reading:" << file.errorString();
        if (error) {
            *error = TaskStoreError::fromDevice(m_filePath, file);
        }
        return std::nullopt;
    }

    TaskStoreError readError;
    auto tasks = readTasks(file, &readError);
    if (!tasks) {
        qCWarning(core::lcStore) << "Failed to load" << m_filePath << "-" << readError.description();
        if (error) {
            *error = readError;
        }
        return std::nullopt;
    }

    qCDebug(core::lcStore) << "Loaded" << tasks->size() << "tasks from" << m_filePath;
    return tasks;
}

bool PlainTextTaskTracker::addTask(const QString &name, const QStringList &tags, const QDateTime &deadline,
                                   TaskStoreError *error)
{
    Task task;
    task.name = name;
    task.tags = tags;
    task.deadline = deadline.isValid() ? deadline.toUTC() : QDateTime();

    // A last line without terminator would swallow the new record.
    bool needsLineBreak = false;
    QFile existing(m_filePath);
    if (existing.exists() && existing.size() > 0) {
        if (!existing.open(QIODevice::ReadOnly) || !existing.seek(existing.size() - 1)) {
            if (error) {
                *error = TaskStoreError::fromDevice(m_filePath, existing);
            }
            return false;
        }
        needsLineBreak = existing.read(1) != QByteArray("\n");
        existing.close();
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qCWarning(core::lcStore) << "Cannot open" << m_filePath << "for appending:" << file.errorString();
        if (error) {
            *error = TaskStoreError::fromDevice(m_filePath, file);
        }
        return false;
    }

    if ((needsLineBreak && file.write("\n") != 1) || !writeTask(file, task)) {
        qCWarning(core::lcStore) << "Cannot append to" << m_filePath << ":" << file.errorString();
        if (error) {
            *error = TaskStoreError::fromDevice(m_filePath, file);
        }
        return false;
    }

    qCDebug(core::lcStore) << "Appended" << task.name << "to" << m_filePath;
    return true;
}

bool PlainTextTaskTracker::completeTask(std::size_t index, TaskStoreError *error)
{
    auto tasks = fetchTasks(error);
    if (!tasks) {
        return false;
    }
    if (!TaskCollection::completeIncomplete(*tasks, index)) {
        qCDebug(core::lcStore) << "No incomplete task at index" << index << "- nothing to complete";
        return true;
    }
    return rewrite(*tasks, error);
}

bool PlainTextTaskTracker::deleteTask(std::size_t index, TaskStoreError *error)
{
    auto tasks = fetchTasks(error);
    if (!tasks) {
        return false;
    }
    if (!TaskCollection::removeIncomplete(*tasks, index)) {
        qCDebug(core::lcStore) << "No incomplete task at index" << index << "- nothing to delete";
        return true;
    }
    return rewrite(*tasks, error);
}

std::optional<std::vector<Task>> PlainTextTaskTracker::readTasks(QIODevice &device, TaskStoreError *error)
{
    QTextCodec *codec = QTextCodec::codecForName("UTF-8");

    std::vector<Task> tasks;
    int lineNumber = 0;
    while (!device.atEnd()) {
        QByteArray bytes = device.readLine();
        ++lineNumber;
        while (bytes.endsWith('\n') || bytes.endsWith('\r')) {
            bytes.chop(1);
        }

        // A line that is not valid UTF-8 would come back with replacement
        // characters and be written out that way by the next rewrite.
        QTextCodec::ConverterState state;
        const QString line = codec->toUnicode(bytes.constData(), bytes.size(), &state);
        if (state.invalidChars > 0 || state.remainingChars > 0) {
            if (error) {
                *error = TaskStoreError::fromParseError(TaskParseError{ TaskParseErrorKind::InvalidEncoding, {} },
                                                        lineNumber);
            }
            return std::nullopt;
        }

        if (line.trimmed().isEmpty()) {
            continue;
        }
        TaskParseError parseError;
        auto task = TaskCodec::decode(line, &parseError);
        if (!task) {
            if (error) {
                *error = TaskStoreError::fromParseError(parseError, lineNumber);
            }
            return std::nullopt;
        }
        tasks.push_back(std::move(*task));
    }

    TaskCollection::sortByDeadline(tasks);
    return tasks;
}

bool PlainTextTaskTracker::writeTask(QIODevice &device, const Task &task)
{
    const QByteArray line = TaskCodec::encode(task).toUtf8() + '\n';
    return device.write(line) == line.size();
}

bool PlainTextTaskTracker::ensureFileExists(TaskStoreError *error) const
{
    QFile file(m_filePath);
    if (file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(core::lcStore) << "Cannot create" << m_filePath << ":" << file.errorString();
        if (error) {
            *error = TaskStoreError::fromDevice(m_filePath, file);
        }
        return false;
    }
    qCDebug(core::lcStore) << "Created empty task file" << m_filePath;
    return true;
}

bool PlainTextTaskTracker::rewrite(const std::vector<Task> &tasks, TaskStoreError *error) const
{
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(core::lcStore) << "Cannot open" << m_filePath << "for writing:" << file.errorString();
        if (error) {
            *error = TaskStoreError::fromDevice(m_filePath, file);
        }
        return false;
    }

    for (const Task &task : tasks) {
        if (!writeTask(file, task)) {
            file.cancelWriting();
            break;
        }
    }

    if (!file.commit()) {
        qCWarning(core::lcStore) << "Cannot rewrite" << m_filePath << ":" << file.errorString();
        if (error) {
            *error = TaskStoreError::fromDevice(m_filePath, file);
        }
        return false;
    }

    qCDebug(core::lcStore) << "Rewrote" << m_filePath << "with" << tasks.size() << "tasks";
    return true;
}

} // namespace data
} // namespace tasktrack
