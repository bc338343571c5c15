#pragma once

#include <QProcessEnvironment>
#include <QSettings>
#include <QString>
#include <optional>

namespace tasktrack {
namespace core {

class AppConfig
{
public:
    static constexpr auto DEFAULT_FILE = "./database";
    static constexpr auto FILE_ENVIRONMENT_VARIABLE = "TASKTRACK_FILE";
    static constexpr auto FILE_SETTINGS_KEY = "storage/file";
    static constexpr auto COLOR_SETTINGS_KEY = "output/color";

    // File path precedence: |fileOverride|, TASKTRACK_FILE, storage/file, DEFAULT_FILE.
    // Colors: output/color when present, otherwise |stdoutIsTerminal|.
    static AppConfig resolve(const std::optional<QString> &fileOverride,
                             const QSettings &settings,
                             const QProcessEnvironment &environment,
                             bool stdoutIsTerminal);

    // False for anything that is not an interactive terminal, including invalid descriptors.
    static bool isTerminal(int fileDescriptor);

    const QString &filePath() const;
    bool colorOutput() const;

private:
    QString m_filePath;
    bool m_colorOutput = false;
};

} // namespace core
} // namespace tasktrack
