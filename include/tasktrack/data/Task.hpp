#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

namespace tasktrack {
namespace data {

struct Task
{
    QString name;
    // Empty means "no tags"; the two are not distinguished.
    QStringList tags;
    // Invalid means "no deadline". Valid deadlines are kept in UTC.
    QDateTime deadline;
    bool complete = false;

    bool hasDeadline() const { return deadline.isValid(); }
    void markComplete() { complete = true; }
};

inline bool operator==(const Task &lhs, const Task &rhs)
{
    if (lhs.hasDeadline() != rhs.hasDeadline()) {
        return false;
    }
    if (lhs.hasDeadline() && lhs.deadline != rhs.deadline) {
        return false;
    }
    return lhs.name == rhs.name && lhs.tags == rhs.tags && lhs.complete == rhs.complete;
}

inline bool operator!=(const Task &lhs, const Task &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace tasktrack
