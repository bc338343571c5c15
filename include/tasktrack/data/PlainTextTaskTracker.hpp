#pragma once

#include <QIODevice>
#include <QString>

#include "tasktrack/data/TaskTracker.hpp"

namespace tasktrack {
namespace data {

// Tasks stored one per line in a text file. The file is the only state: every
// call reads it again, and complete/delete rewrite it whole. A missing file is
// created empty on first read.
class PlainTextTaskTracker : public TaskTracker
{
public:
    explicit PlainTextTaskTracker(QString filePath);
    ~PlainTextTaskTracker() override = default;

    const QString &filePath() const;

    std::optional<std::vector<Task>> fetchTasks(TaskStoreError *error = nullptr) const override;
    bool addTask(const QString &name, const QStringList &tags, const QDateTime &deadline,
                 TaskStoreError *error = nullptr) override;
    bool completeTask(std::size_t index, TaskStoreError *error = nullptr) override;
    bool deleteTask(std::size_t index, TaskStoreError *error = nullptr) override;

    // Decodes every non-blank line and sorts the result. Stops at the first bad line.
    static std::optional<std::vector<Task>> readTasks(QIODevice &device, TaskStoreError *error = nullptr);
    // Writes |task| as one line followed by '\n'.
    static bool writeTask(QIODevice &device, const Task &task);

private:
    bool ensureFileExists(TaskStoreError *error) const;
    bool rewrite(const std::vector<Task> &tasks, TaskStoreError *error) const;

    QString m_filePath;
};

} // namespace data
} // namespace tasktrack
