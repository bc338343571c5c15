#include <QtTest/QtTest>

#include "tasktrack/ui/TextStyle.hpp"

using namespace tasktrack::ui;

class TextStyleTest : public QObject
{
    Q_OBJECT

private slots:
    void padsToWidth();
    void keepsLongerText();
    void countsGraphemeClusters();
    void wrapsInEscapeSequence();
};

void TextStyleTest::padsToWidth()
{
    QCOMPARE(rightPad(QStringLiteral("#"), 3), QStringLiteral("#  "));
    QCOMPARE(rightPad(QStringLiteral("ab"), 5, QLatin1Char('.')), QStringLiteral("ab..."));
    QCOMPARE(rightPad(QString(), 2), QStringLiteral("  "));
}

void TextStyleTest::keepsLongerText()
{
    QCOMPARE(rightPad(QStringLiteral("Name"), 2), QStringLiteral("Name"));
}

void TextStyleTest::countsGraphemeClusters()
{
    const QString combining = QStringLiteral("Cafe") + QChar(0x0301);
    const QString emoji = QString::fromUtf8("\xF0\x9F\x8E\x89 party");
    QCOMPARE(displayWidth(QString()), 0);
    QCOMPARE(displayWidth(combining), 4);
    QCOMPARE(displayWidth(emoji), 7);
    QCOMPARE(rightPad(combining, 6), combining + QStringLiteral("  "));
    QCOMPARE(rightPad(emoji, 8), emoji + QLatin1Char(' '));
}

void TextStyleTest::wrapsInEscapeSequence()
{
    QCOMPARE(applyTextEffect(QStringLiteral("late"), TextEffect::Red), QStringLiteral("\x1b[31mlate\x1b[0m"));
    QCOMPARE(applyTextEffect(QStringLiteral("ok"), TextEffect::Green), QStringLiteral("\x1b[32mok\x1b[0m"));
    QCOMPARE(applyTextEffect(QStringLiteral("x"), TextEffect::StrikeThrough), QStringLiteral("\x1b[9mx\x1b[0m"));
}

QTEST_GUILESS_MAIN(TextStyleTest)
#include "TextStyleTest.moc"
