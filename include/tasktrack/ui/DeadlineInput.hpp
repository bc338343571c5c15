#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

namespace tasktrack {
namespace ui {

// Deadlines as typed on the command line, interpreted in local time:
//   "2025-03-17 22:00"  date and time
//   "2025-03-17"        date, at DEFAULT_HOUR
//   "22:00", "22:00:30" today at that time
class DeadlineInput
{
public:
    static constexpr int DEFAULT_HOUR = 17;

    // Today at DEFAULT_HOUR.
    static QDateTime defaultDeadline(const QDateTime &now);
    static std::optional<QDateTime> parse(const QString &text, const QDateTime &now, QString *errorMessage = nullptr);
};

} // namespace ui
} // namespace tasktrack
