#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <cstddef>
#include <optional>

#include "tasktrack/data/TaskCollection.hpp"

namespace tasktrack {
namespace ui {

struct ParsedCommand
{
    enum class Kind
    {
        Add,
        Complete,
        Delete,
        List,
        Help,
        Version,
    };

    Kind kind = Kind::Help;
    std::optional<QString> filePath;
    bool verbose = false;

    // Add
    QString name;
    QStringList tags;
    QDateTime deadline;

    // Complete, Delete
    std::size_t index = 0;

    // List
    data::ListFilter filter;

    // Help, Version
    QString text;
};

// tasktrack [--file <path>] [--verbose] <add|complete|delete|list> [options]
class CommandLine
{
public:
    explicit CommandLine(QDateTime now = QDateTime::currentDateTime());

    // |arguments| includes the program name. Returns nullopt with |errorMessage|
    // set when the arguments are not valid.
    std::optional<ParsedCommand> parse(const QStringList &arguments, QString *errorMessage = nullptr) const;

private:
    QDateTime m_now;
};

} // namespace ui
} // namespace tasktrack
