#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QTemporaryFile>

#include "tasktrack/core/AppConfig.hpp"

using namespace tasktrack::core;

class AppConfigTest : public QObject
{
    Q_OBJECT

private slots:
    void defaults();
    void settingsThenEnvironmentThenOverride();
    void colorSetting();
    void regularFileIsNotTerminal();
};

void AppConfigTest::defaults()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("tasktrack.ini")), QSettings::IniFormat);
    const QProcessEnvironment environment;

    const auto config = AppConfig::resolve(std::nullopt, settings, environment, false);
    QCOMPARE(config.filePath(), QStringLiteral("./database"));
    QVERIFY(!config.colorOutput());

    QVERIFY(AppConfig::resolve(std::nullopt, settings, environment, true).colorOutput());
}

void AppConfigTest::settingsThenEnvironmentThenOverride()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("tasktrack.ini")), QSettings::IniFormat);
    settings.setValue(QLatin1String(AppConfig::FILE_SETTINGS_KEY), QStringLiteral("/from/settings"));

    QProcessEnvironment environment;
    QCOMPARE(AppConfig::resolve(std::nullopt, settings, environment, false).filePath(), QStringLiteral("/from/settings"));

    environment.insert(QLatin1String(AppConfig::FILE_ENVIRONMENT_VARIABLE), QStringLiteral("/from/env"));
    QCOMPARE(AppConfig::resolve(std::nullopt, settings, environment, false).filePath(), QStringLiteral("/from/env"));

    QCOMPARE(AppConfig::resolve(QStringLiteral("/from/cli"), settings, environment, false).filePath(),
             QStringLiteral("/from/cli"));
    QCOMPARE(AppConfig::resolve(QString(), settings, environment, false).filePath(), QStringLiteral("/from/env"));
}

void AppConfigTest::colorSetting()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("tasktrack.ini")), QSettings::IniFormat);
    settings.setValue(QLatin1String(AppConfig::COLOR_SETTINGS_KEY), false);

    QVERIFY(!AppConfig::resolve(std::nullopt, settings, QProcessEnvironment(), true).colorOutput());

    settings.setValue(QLatin1String(AppConfig::COLOR_SETTINGS_KEY), true);
    QVERIFY(AppConfig::resolve(std::nullopt, settings, QProcessEnvironment(), false).colorOutput());
}

void AppConfigTest::regularFileIsNotTerminal()
{
    QTemporaryFile file;
    QVERIFY(file.open());
    QVERIFY(!AppConfig::isTerminal(file.handle()));
    QVERIFY(!AppConfig::isTerminal(-1));
}

QTEST_GUILESS_MAIN(AppConfigTest)
#include "AppConfigTest.moc"
