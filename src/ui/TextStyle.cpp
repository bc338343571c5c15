#include "tasktrack/ui/TextStyle.hpp"

#include <QTextBoundaryFinder>

namespace tasktrack {
namespace ui {

QString ansiCode(TextEffect effect)
{
    switch (effect) {
    case TextEffect::StrikeThrough:
        return QStringLiteral("9");
    case TextEffect::Red:
        return QStringLiteral("31");
    case TextEffect::Green:
    default:
        return QStringLiteral("32");
    }
}

int displayWidth(const QString &text)
{
    QTextBoundaryFinder finder(QTextBoundaryFinder::Grapheme, text);
    int width = 0;
    while (finder.toNextBoundary() != -1) {
        ++width;
    }
    return width;
}

QString rightPad(const QString &text, int width, QChar fill)
{
    const int missing = width - displayWidth(text);
    return missing > 0 ? text + QString(missing, fill) : text;
}

QString applyTextEffect(const QString &text, TextEffect effect)
{
    return QStringLiteral("\x1b[%1m%2\x1b[0m").arg(ansiCode(effect), text);
}

} // namespace ui
} // namespace tasktrack
