#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "tasktrack/data/InMemoryTaskTracker.hpp"
#include "tasktrack/data/PlainTextTaskTracker.hpp"
#include "tasktrack/ui/Application.hpp"

using namespace tasktrack;

namespace {
const QDateTime NOW(QDate(2025, 3, 18), QTime(12, 0), Qt::UTC);

ui::ParsedCommand listCommand()
{
    ui::ParsedCommand command;
    command.kind = ui::ParsedCommand::Kind::List;
    return command;
}
} // namespace

class ApplicationTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void addThenList();
    void outOfRangeCompleteSucceeds();
    void storeErrorsExitNonZero();
    void argumentErrorsExitNonZero();
    void helpIsPrintedWithoutTouchingStore();
    void runAgainstFile();
};

void ApplicationTest::initTestCase()
{
    QCoreApplication::setOrganizationName(QStringLiteral("tasktrack-tests"));
    QCoreApplication::setApplicationName(QStringLiteral("ApplicationTest"));
}

void ApplicationTest::addThenList()
{
    QString outText;
    QString errText;
    QTextStream out(&outText);
    QTextStream err(&errText);
    ui::Application app(out, err);
    data::InMemoryTaskTracker tracker;

    ui::ParsedCommand add;
    add.kind = ui::ParsedCommand::Kind::Add;
    add.name = QStringLiteral("Buy milk");
    add.tags = QStringList{ QStringLiteral("home") };
    add.deadline = NOW.addDays(1);
    QCOMPARE(app.execute(add, tracker, false, NOW), 0);

    QCOMPARE(app.execute(listCommand(), tracker, false, NOW), 0);
    QVERIFY(outText.startsWith(QStringLiteral("| # | Name")));
    QVERIFY(outText.contains(QStringLiteral("| 0 | Buy milk | home |")));
    QVERIFY(errText.isEmpty());
}

void ApplicationTest::outOfRangeCompleteSucceeds()
{
    QString outText;
    QString errText;
    QTextStream out(&outText);
    QTextStream err(&errText);
    ui::Application app(out, err);
    data::InMemoryTaskTracker tracker;

    ui::ParsedCommand complete;
    complete.kind = ui::ParsedCommand::Kind::Complete;
    complete.index = 7;
    QCOMPARE(app.execute(complete, tracker, false, NOW), 0);
    QVERIFY(errText.isEmpty());
}

void ApplicationTest::storeErrorsExitNonZero()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("database"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    QVERIFY(file.write("| only | three |\n") > 0);
    file.close();

    QString outText;
    QString errText;
    QTextStream out(&outText);
    QTextStream err(&errText);
    ui::Application app(out, err);
    data::PlainTextTaskTracker tracker(path);

    QCOMPARE(app.execute(listCommand(), tracker, false, NOW), 1);
    QVERIFY(outText.isEmpty());
    QCOMPARE(errText, QStringLiteral("Process failed: line 1: provided string could not be converted to a task\n"));
}

void ApplicationTest::argumentErrorsExitNonZero()
{
    QString outText;
    QString errText;
    QTextStream out(&outText);
    QTextStream err(&errText);
    ui::Application app(out, err);

    QCOMPARE(app.run({ QStringLiteral("tasktrack"), QStringLiteral("frobnicate") }, false), 1);
    QVERIFY(errText.contains(QStringLiteral("Unknown command")));

    QCOMPARE(app.run({ QStringLiteral("tasktrack"), QStringLiteral("--version") }, false), 0);
    QVERIFY(outText.startsWith(QStringLiteral("tasktrack ")));
}

void ApplicationTest::helpIsPrintedWithoutTouchingStore()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("database"));

    QString outText;
    QString errText;
    QTextStream out(&outText);
    QTextStream err(&errText);
    ui::Application app(out, err);

    QCOMPARE(app.run({ QStringLiteral("tasktrack"), QStringLiteral("--file"), path, QStringLiteral("list"),
                       QStringLiteral("--help") },
                     false),
             0);
    QVERIFY(outText.contains(QStringLiteral("--overdue")));
    QVERIFY(outText.endsWith(QLatin1Char('\n')));
    QVERIFY(errText.isEmpty());
    QVERIFY(!QFile::exists(path));
}

void ApplicationTest::runAgainstFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("database"));

    QString outText;
    QString errText;
    QTextStream out(&outText);
    QTextStream err(&errText);
    ui::Application app(out, err);

    QCOMPARE(app.run({ QStringLiteral("tasktrack"), QStringLiteral("--file"), path, QStringLiteral("add"),
                       QStringLiteral("-n"), QStringLiteral("Write report"), QStringLiteral("-d"),
                       QStringLiteral("2025-03-20 08:15") },
                     false),
             0);
    QCOMPARE(app.run({ QStringLiteral("tasktrack"), QStringLiteral("-f"), path, QStringLiteral("complete"), QStringLiteral("0") },
                     false),
             0);

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray content = file.readAll();
    QVERIFY(content.startsWith("| Write report |  | true | 2025-03-"));
    QVERIFY(content.endsWith("+00:00 |\n"));
    QVERIFY2(errText.isEmpty(), qPrintable(errText));
}

QTEST_GUILESS_MAIN(ApplicationTest)
#include "ApplicationTest.moc"
