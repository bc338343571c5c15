#pragma once

#include <QChar>
#include <QString>

namespace tasktrack {
namespace ui {

enum class TextEffect
{
    StrikeThrough,
    Red,
    Green,
};

QString ansiCode(TextEffect effect);

// Number of user-perceived characters (grapheme clusters), so that combining marks
// and surrogate pairs count once.
int displayWidth(const QString &text);

// Pads |text| on the right with |fill| up to a displayWidth() of |width|. Longer text is returned as is.
QString rightPad(const QString &text, int width, QChar fill = QLatin1Char(' '));

// Wraps |text| in the ANSI escape sequence for |effect| followed by a reset.
QString applyTextEffect(const QString &text, TextEffect effect);

} // namespace ui
} // namespace tasktrack
