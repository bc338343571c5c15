#include "tasktrack/data/InMemoryTaskTracker.hpp"

namespace tasktrack {
namespace data {

InMemoryTaskTracker::InMemoryTaskTracker() = default;

InMemoryTaskTracker::InMemoryTaskTracker(std::vector<Task> tasks)
    : m_tasks(std::move(tasks))
{
}

InMemoryTaskTracker::~InMemoryTaskTracker() = default;

std::optional<std::vector<Task>> InMemoryTaskTracker::fetchTasks(TaskStoreError *) const
{
    std::vector<Task> tasks = m_tasks;
    TaskCollection::sortByDeadline(tasks);
    return tasks;
}

bool InMemoryTaskTracker::addTask(const QString &name, const QStringList &tags, const QDateTime &deadline,
                                  TaskStoreError *)
{
    Task task;
    task.name = name;
    task.tags = tags;
    task.deadline = deadline.isValid() ? deadline.toUTC() : QDateTime();
    m_tasks.push_back(std::move(task));
    return true;
}

bool InMemoryTaskTracker::completeTask(std::size_t index, TaskStoreError *)
{
    std::vector<Task> tasks = *fetchTasks();
    if (TaskCollection::completeIncomplete(tasks, index)) {
        m_tasks = std::move(tasks);
    }
    return true;
}

bool InMemoryTaskTracker::deleteTask(std::size_t index, TaskStoreError *)
{
    std::vector<Task> tasks = *fetchTasks();
    if (TaskCollection::removeIncomplete(tasks, index)) {
        m_tasks = std::move(tasks);
    }
    return true;
}

} // namespace data
} // namespace tasktrack
