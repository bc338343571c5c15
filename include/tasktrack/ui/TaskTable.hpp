#pragma once

#include <QDateTime>
#include <QString>
#include <vector>

#include "tasktrack/data/TaskCollection.hpp"

namespace tasktrack {
namespace ui {

struct TaskTableOptions
{
    bool showIds = true;
    bool colorize = false;
    // Reference time for highlighting overdue deadlines.
    QDateTime now;
};

// Renders a listing as a pipe-separated table. Column widths follow the widest
// value in each column, never below the header width.
class TaskTable
{
public:
    static QString render(const std::vector<data::ListedTask> &rows, const TaskTableOptions &options);
};

} // namespace ui
} // namespace tasktrack
