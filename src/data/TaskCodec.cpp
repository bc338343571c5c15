#include "tasktrack/data/TaskCodec.hpp"

#include <QDate>
#include <QRegularExpression>
#include <QTime>
#include <algorithm>

namespace tasktrack {
namespace data {

namespace {
constexpr auto TAG_SEPARATOR = ", ";
constexpr auto STORAGE_FORMAT = "yyyy-MM-dd'T'HH:mm:ss";
constexpr auto STORAGE_FORMAT_MSECS = "yyyy-MM-dd'T'HH:mm:ss.zzz";
constexpr auto DISPLAY_FORMAT = "MM/dd/yyyy HH:mm:ss";
constexpr int FIELD_COUNT = 4;

const QString PREMATURE_END = QStringLiteral("premature end of input");
const QString INVALID_CHARACTERS = QStringLiteral("input contains invalid characters");
const QString TRAILING_INPUT = QStringLiteral("trailing input");
const QString OUT_OF_RANGE = QStringLiteral("input is out of range");

const QRegularExpression &timestampPattern()
{
    static const QRegularExpression pattern(QStringLiteral(
        "([0-9]{4})-([0-9]{2})-([0-9]{2})[Tt ]([0-9]{2}):([0-9]{2}):([0-9]{2})(?:\\.([0-9]+))?"
        "(?:[Zz]|([+-])([0-9]{2}):([0-9]{2}))"));
    return pattern;
}

void setError(TaskParseError *error, TaskParseErrorKind kind, const QString &detail = QString())
{
    if (error) {
        error->kind = kind;
        error->detail = detail;
    }
}

std::optional<QDateTime> failTimestamp(QString *reason, const QString &message)
{
    if (reason) {
        *reason = message;
    }
    return std::nullopt;
}

} // namespace

QString TaskParseError::message() const
{
    switch (kind) {
    case TaskParseErrorKind::InvalidBoolean:
        return QStringLiteral("provided string was not `true` or `false`");
    case TaskParseErrorKind::InvalidTimestamp:
        return detail;
    case TaskParseErrorKind::InvalidEncoding:
        return QStringLiteral("stream did not contain valid UTF-8");
    case TaskParseErrorKind::InvalidFormat:
    default:
        return QStringLiteral("provided string could not be converted to a task");
    }
}

QString TaskCodec::encode(const Task &task)
{
    return QStringLiteral("| %1 | %2 | %3 | %4 |")
        .arg(task.name,
             joinTags(task.tags),
             task.complete ? QStringLiteral("true") : QStringLiteral("false"),
             formatTimestamp(task.deadline));
}

std::optional<Task> TaskCodec::decode(const QString &line, TaskParseError *error)
{
    QString body = line.trimmed();
    int begin = 0;
    int end = body.size();
    while (begin < end && body.at(begin) == QLatin1Char('|')) {
        ++begin;
    }
    while (end > begin && body.at(end - 1) == QLatin1Char('|')) {
        --end;
    }
    body = body.mid(begin, end - begin);

    const QStringList fields = body.split(QLatin1Char('|'));
    if (fields.size() != FIELD_COUNT) {
        setError(error, TaskParseErrorKind::InvalidFormat);
        return std::nullopt;
    }

    Task task;
    task.name = fields.at(0).trimmed();

    const QString tagsField = fields.at(1).trimmed();
    const QStringList pieces = tagsField.split(QLatin1Char(','));
    const bool anyTag = std::any_of(pieces.cbegin(), pieces.cend(), [](const QString &piece) {
        return !piece.trimmed().isEmpty();
    });
    if (anyTag) {
        task.tags = tagsField.split(QLatin1String(TAG_SEPARATOR));
    }

    const QString completeField = fields.at(2).trimmed();
    if (completeField == QLatin1String("true")) {
        task.complete = true;
    } else if (completeField == QLatin1String("false")) {
        task.complete = false;
    } else {
        setError(error, TaskParseErrorKind::InvalidBoolean);
        return std::nullopt;
    }

    const QString deadlineField = fields.at(3).trimmed();
    if (!deadlineField.isEmpty()) {
        QString reason;
        const auto deadline = parseTimestamp(deadlineField, &reason);
        if (!deadline) {
            setError(error, TaskParseErrorKind::InvalidTimestamp, reason);
            return std::nullopt;
        }
        task.deadline = *deadline;
    }

    return task;
}

QString TaskCodec::formatTimestamp(const QDateTime &timestamp)
{
    if (!timestamp.isValid()) {
        return {};
    }
    const QDateTime utc = timestamp.toUTC();
    const auto format = utc.time().msec() == 0 ? STORAGE_FORMAT : STORAGE_FORMAT_MSECS;
    return utc.toString(QLatin1String(format)) + QStringLiteral("+00:00");
}

std::optional<QDateTime> TaskCodec::parseTimestamp(const QString &value, QString *reason)
{
    if (value.isEmpty()) {
        return failTimestamp(reason, PREMATURE_END);
    }

    const QRegularExpressionMatch match = timestampPattern().match(
        value, 0, QRegularExpression::PartialPreferCompleteMatch, QRegularExpression::AnchoredMatchOption);
    if (match.hasPartialMatch()) {
        return failTimestamp(reason, PREMATURE_END);
    }
    if (!match.hasMatch()) {
        return failTimestamp(reason, INVALID_CHARACTERS);
    }
    if (match.capturedLength() != value.size()) {
        return failTimestamp(reason, TRAILING_INPUT);
    }

    // Fractional seconds are truncated to milliseconds.
    const QString fraction = (match.captured(7) + QStringLiteral("00")).left(3);
    const QDate date(match.captured(1).toInt(), match.captured(2).toInt(), match.captured(3).toInt());
    const QTime time(match.captured(4).toInt(), match.captured(5).toInt(), match.captured(6).toInt(),
                     match.captured(7).isEmpty() ? 0 : fraction.toInt());
    const int offsetHours = match.captured(9).toInt();
    const int offsetMinutes = match.captured(10).toInt();
    if (!date.isValid() || !time.isValid() || offsetHours >= 24 || offsetMinutes >= 60) {
        return failTimestamp(reason, OUT_OF_RANGE);
    }

    const int offsetSeconds = (offsetHours * 3600 + offsetMinutes * 60) * (match.captured(8) == QLatin1String("-") ? -1 : 1);
    return QDateTime(date, time, Qt::OffsetFromUTC, offsetSeconds).toUTC();
}

QString TaskCodec::formatDeadlineForDisplay(const Task &task)
{
    if (!task.hasDeadline()) {
        return {};
    }
    return task.deadline.toLocalTime().toString(QLatin1String(DISPLAY_FORMAT));
}

QString TaskCodec::joinTags(const QStringList &tags)
{
    return tags.join(QLatin1String(TAG_SEPARATOR));
}

} // namespace data
} // namespace tasktrack
