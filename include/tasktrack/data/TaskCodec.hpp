#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

#include "tasktrack/data/Task.hpp"

namespace tasktrack {
namespace data {

enum class TaskParseErrorKind
{
    InvalidFormat,
    InvalidBoolean,
    InvalidTimestamp,
    InvalidEncoding,
};

struct TaskParseError
{
    TaskParseErrorKind kind = TaskParseErrorKind::InvalidFormat;
    // Underlying reason for InvalidTimestamp, e.g. "premature end of input".
    QString detail;

    QString message() const;
};

class TaskCodec
{
public:
    // Storage line without a line terminator:
    // "| name | tag1, tag2 | false | 2025-03-17T22:00:00+00:00 |"
    static QString encode(const Task &task);

    // Strict: the first failing field aborts the whole line. |error| may be null.
    static std::optional<Task> decode(const QString &line, TaskParseError *error = nullptr);

    // RFC 3339 in UTC with an explicit +00:00 offset. Empty for an invalid value.
    static QString formatTimestamp(const QDateTime &timestamp);
    static std::optional<QDateTime> parseTimestamp(const QString &value, QString *reason = nullptr);

    // Local time, "MM/dd/yyyy HH:mm:ss". Display only, never decoded.
    static QString formatDeadlineForDisplay(const Task &task);

    static QString joinTags(const QStringList &tags);
};

} // namespace data
} // namespace tasktrack
