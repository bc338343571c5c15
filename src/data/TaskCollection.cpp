#include "tasktrack/data/TaskCollection.hpp"

#include <algorithm>

namespace tasktrack {
namespace data {

void TaskCollection::sortByDeadline(std::vector<Task> &tasks)
{
    std::stable_sort(tasks.begin(), tasks.end(), [](const Task &lhs, const Task &rhs) {
        if (!lhs.hasDeadline() || !rhs.hasDeadline()) {
            return lhs.hasDeadline() && !rhs.hasDeadline();
        }
        return lhs.deadline < rhs.deadline;
    });
}

std::optional<std::size_t> TaskCollection::findIncomplete(const std::vector<Task> &tasks, std::size_t index)
{
    std::size_t seen = 0;
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        if (tasks[i].complete) {
            continue;
        }
        if (seen == index) {
            return i;
        }
        ++seen;
    }
    return std::nullopt;
}

bool TaskCollection::completeIncomplete(std::vector<Task> &tasks, std::size_t index)
{
    const auto position = findIncomplete(tasks, index);
    if (!position) {
        return false;
    }
    tasks[*position].markComplete();
    return true;
}

bool TaskCollection::removeIncomplete(std::vector<Task> &tasks, std::size_t index)
{
    const auto position = findIncomplete(tasks, index);
    if (!position) {
        return false;
    }
    tasks.erase(tasks.begin() + static_cast<long>(*position));
    return true;
}

bool TaskCollection::isOverdue(const Task &task, const QDateTime &now)
{
    return !task.complete && task.hasDeadline() && task.deadline <= now;
}

bool TaskCollection::sharesTag(const Task &task, const QStringList &tags)
{
    return std::any_of(tags.cbegin(), tags.cend(), [&task](const QString &tag) {
        return task.tags.contains(tag);
    });
}

std::vector<ListedTask> TaskCollection::select(const std::vector<Task> &tasks, const ListFilter &filter, const QDateTime &now)
{
    std::vector<ListedTask> rows;
    std::size_t incompleteIndex = 0;
    for (const Task &task : tasks) {
        if (!filter.all && task.complete) {
            continue;
        }
        ListedTask row;
        row.task = task;
        if (!filter.all) {
            row.id = incompleteIndex++;
        }
        if (filter.overdue && !isOverdue(task, now)) {
            continue;
        }
        if (!filter.tags.isEmpty() && !sharesTag(task, filter.tags)) {
            continue;
        }
        if (filter.limit && rows.size() >= *filter.limit) {
            break;
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace data
} // namespace tasktrack
