#include <QCoreApplication>
#include <QString>
#include <QTextStream>
#include <cstdio>

#include "version.h"

#include "tasktrack/core/AppConfig.hpp"
#include "tasktrack/ui/Application.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("tasktrack"));
    QCoreApplication::setApplicationName(QStringLiteral("tasktrack"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTaskTrackVersion));

    QCoreApplication app(argc, argv);

    QTextStream out(stdout);
    QTextStream err(stderr);
    out.setCodec("UTF-8");
    err.setCodec("UTF-8");

    tasktrack::ui::Application application(out, err);
    return application.run(QCoreApplication::arguments(), tasktrack::core::AppConfig::isTerminal(fileno(stdout)));
}
