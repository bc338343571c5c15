#include "tasktrack/ui/DeadlineInput.hpp"

#include <QDate>
#include <QTime>

namespace tasktrack {
namespace ui {

namespace {
constexpr auto DATE_TIME_FORMAT = "yyyy-MM-dd HH:mm";
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
constexpr auto TIME_FORMAT = "HH:mm";
constexpr auto TIME_WITH_SECONDS_FORMAT = "HH:mm:ss";

std::optional<QDateTime> localDateTime(const QDate &date, const QTime &time, QString *errorMessage)
{
    const QDateTime result(date, time, Qt::LocalTime);
    if (!result.isValid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 %2 does not exist in the local time zone")
                                .arg(date.toString(QLatin1String(DATE_FORMAT)), time.toString(QLatin1String(TIME_FORMAT)));
        }
        return std::nullopt;
    }
    return result;
}
} // namespace

QDateTime DeadlineInput::defaultDeadline(const QDateTime &now)
{
    return QDateTime(now.toLocalTime().date(), QTime(DEFAULT_HOUR, 0), Qt::LocalTime);
}

std::optional<QDateTime> DeadlineInput::parse(const QString &text, const QDateTime &now, QString *errorMessage)
{
    const QString input = text.trimmed();

    const QDateTime dateTime = QDateTime::fromString(input, QLatin1String(DATE_TIME_FORMAT));
    if (dateTime.isValid()) {
        return localDateTime(dateTime.date(), dateTime.time(), errorMessage);
    }

    const QDate date = QDate::fromString(input, QLatin1String(DATE_FORMAT));
    if (date.isValid()) {
        return localDateTime(date, QTime(DEFAULT_HOUR, 0), errorMessage);
    }

    QTime time = QTime::fromString(input, QLatin1String(TIME_WITH_SECONDS_FORMAT));
    if (!time.isValid()) {
        time = QTime::fromString(input, QLatin1String(TIME_FORMAT));
    }
    if (time.isValid()) {
        return localDateTime(now.toLocalTime().date(), time, errorMessage);
    }

    if (errorMessage) {
        *errorMessage = QStringLiteral("'%1' cannot be parsed to Date, Time, or DateTime").arg(text);
    }
    return std::nullopt;
}

} // namespace ui
} // namespace tasktrack
