#include "tasktrack/core/AppConfig.hpp"

#include <QtGlobal>

#if defined(Q_OS_UNIX)
#include <unistd.h>
#elif defined(Q_OS_WIN)
#include <io.h>
#endif

#include "tasktrack/core/Logging.hpp"

namespace tasktrack {
namespace core {

AppConfig AppConfig::resolve(const std::optional<QString> &fileOverride,
                             const QSettings &settings,
                             const QProcessEnvironment &environment,
                             bool stdoutIsTerminal)
{
    AppConfig config;

    const QString environmentFile = environment.value(QLatin1String(FILE_ENVIRONMENT_VARIABLE));
    const QString settingsFile = settings.value(QLatin1String(FILE_SETTINGS_KEY)).toString();
    if (fileOverride && !fileOverride->isEmpty()) {
        config.m_filePath = *fileOverride;
    } else if (!environmentFile.isEmpty()) {
        config.m_filePath = environmentFile;
    } else if (!settingsFile.isEmpty()) {
        config.m_filePath = settingsFile;
    } else {
        config.m_filePath = QLatin1String(DEFAULT_FILE);
    }

    config.m_colorOutput = settings.value(QLatin1String(COLOR_SETTINGS_KEY), stdoutIsTerminal).toBool();

    qCDebug(lcApp) << "Using task file" << config.m_filePath << "colors:" << config.m_colorOutput;
    return config;
}

bool AppConfig::isTerminal(int fileDescriptor)
{
    if (fileDescriptor < 0) {
        return false;
    }
#if defined(Q_OS_UNIX)
    return ::isatty(fileDescriptor) != 0;
#elif defined(Q_OS_WIN)
    return ::_isatty(fileDescriptor) != 0;
#else
    return false;
#endif
}

const QString &AppConfig::filePath() const
{
    return m_filePath;
}

bool AppConfig::colorOutput() const
{
    return m_colorOutput;
}

} // namespace core
} // namespace tasktrack
