#pragma once

#include <QDateTime>
#include <QStringList>
#include <cstddef>
#include <optional>
#include <vector>

#include "tasktrack/data/Task.hpp"

namespace tasktrack {
namespace data {

struct ListFilter
{
    bool all = false;
    bool overdue = false;
    // Empty means no tag filter.
    QStringList tags;
    std::optional<std::size_t> limit;
};

struct ListedTask
{
    // Position among incomplete tasks, usable with complete/delete. Unset when
    // completed tasks are listed too.
    std::optional<std::size_t> id;
    Task task;
};

class TaskCollection
{
public:
    // Stable: equal deadlines keep their relative order. Tasks without a deadline go last.
    static void sortByDeadline(std::vector<Task> &tasks);

    // Position in |tasks| of the |index|-th incomplete task.
    static std::optional<std::size_t> findIncomplete(const std::vector<Task> &tasks, std::size_t index);

    // Both return false and leave |tasks| untouched when |index| is out of range.
    static bool completeIncomplete(std::vector<Task> &tasks, std::size_t index);
    static bool removeIncomplete(std::vector<Task> &tasks, std::size_t index);

    static bool isOverdue(const Task &task, const QDateTime &now);
    static bool sharesTag(const Task &task, const QStringList &tags);

    // Ids are assigned before the overdue, tag and limit filters run.
    static std::vector<ListedTask> select(const std::vector<Task> &tasks, const ListFilter &filter, const QDateTime &now);
};

} // namespace data
} // namespace tasktrack
