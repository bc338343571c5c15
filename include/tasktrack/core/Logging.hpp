#pragma once

#include <QLoggingCategory>

namespace tasktrack {
namespace core {

Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

// Turns on debug output for every tasktrack.* category.
void enableVerboseLogging();

} // namespace core
} // namespace tasktrack
