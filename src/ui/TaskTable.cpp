#include "tasktrack/ui/TaskTable.hpp"

#include <QStringList>
#include <algorithm>

#include "tasktrack/data/TaskCodec.hpp"
#include "tasktrack/ui/TextStyle.hpp"

namespace tasktrack {
namespace ui {

namespace {
constexpr int MIN_ID_WIDTH = 1;
constexpr int MIN_NAME_WIDTH = 4;
constexpr int MIN_TAGS_WIDTH = 4;
constexpr int MIN_DUE_WIDTH = 3;
constexpr int DONE_WIDTH = 4;

const QString CHECK_MARK = QString::fromUtf8("✓");

QString joinRow(const QStringList &cells)
{
    return QStringLiteral("| ") + cells.join(QStringLiteral(" | ")) + QStringLiteral(" |");
}
} // namespace

QString TaskTable::render(const std::vector<data::ListedTask> &rows, const TaskTableOptions &options)
{
    int idWidth = MIN_ID_WIDTH;
    int nameWidth = MIN_NAME_WIDTH;
    int tagsWidth = MIN_TAGS_WIDTH;
    int dueWidth = MIN_DUE_WIDTH;
    for (const auto &row : rows) {
        if (row.id) {
            idWidth = std::max(idWidth, QString::number(*row.id).size());
        }
        nameWidth = std::max(nameWidth, displayWidth(row.task.name));
        tagsWidth = std::max(tagsWidth, displayWidth(data::TaskCodec::joinTags(row.task.tags)));
        dueWidth = std::max(dueWidth, data::TaskCodec::formatDeadlineForDisplay(row.task).size());
    }

    QStringList header;
    if (options.showIds) {
        header << rightPad(QStringLiteral("#"), idWidth);
    }
    header << rightPad(QStringLiteral("Name"), nameWidth)
           << rightPad(QStringLiteral("Tags"), tagsWidth)
           << rightPad(QStringLiteral("Due"), dueWidth)
           << rightPad(QStringLiteral("Done"), DONE_WIDTH);
    const QString headerLine = joinRow(header);

    QStringList lines;
    lines << headerLine << QString(headerLine.size(), QLatin1Char('='));

    for (const auto &row : rows) {
        const data::Task &task = row.task;
        QString name = rightPad(task.name, nameWidth);
        QString due = rightPad(data::TaskCodec::formatDeadlineForDisplay(task), dueWidth);
        QString done = task.complete ? QStringLiteral(" %1  ").arg(CHECK_MARK) : QString(DONE_WIDTH, QLatin1Char(' '));
        if (options.colorize) {
            if (task.complete) {
                name = applyTextEffect(name, TextEffect::StrikeThrough);
                done = applyTextEffect(done, TextEffect::Green);
            }
            if (data::TaskCollection::isOverdue(task, options.now)) {
                due = applyTextEffect(due, TextEffect::Red);
            }
        }

        QStringList cells;
        if (options.showIds) {
            cells << rightPad(row.id ? QString::number(*row.id) : QString(), idWidth);
        }
        cells << name << rightPad(data::TaskCodec::joinTags(task.tags), tagsWidth) << due << done;
        lines << joinRow(cells);
    }

    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace ui
} // namespace tasktrack
