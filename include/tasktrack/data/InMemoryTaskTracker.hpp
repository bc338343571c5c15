#pragma once

#include "tasktrack/data/TaskTracker.hpp"

namespace tasktrack {
namespace data {

class InMemoryTaskTracker : public TaskTracker
{
public:
    InMemoryTaskTracker();
    explicit InMemoryTaskTracker(std::vector<Task> tasks);
    ~InMemoryTaskTracker() override;

    std::optional<std::vector<Task>> fetchTasks(TaskStoreError *error = nullptr) const override;
    bool addTask(const QString &name, const QStringList &tags, const QDateTime &deadline,
                 TaskStoreError *error = nullptr) override;
    bool completeTask(std::size_t index, TaskStoreError *error = nullptr) override;
    bool deleteTask(std::size_t index, TaskStoreError *error = nullptr) override;

private:
    // Insertion order; sorting happens on read, as with the file backend.
    std::vector<Task> m_tasks;
};

} // namespace data
} // namespace tasktrack
