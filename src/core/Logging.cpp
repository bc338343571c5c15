#include "tasktrack/core/Logging.hpp"

namespace tasktrack {
namespace core {

Q_LOGGING_CATEGORY(lcStore, "tasktrack.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcApp, "tasktrack.app", QtInfoMsg)

void enableVerboseLogging()
{
    QLoggingCategory::setFilterRules(QStringLiteral("tasktrack.*.debug=true"));
}

} // namespace core
} // namespace tasktrack
