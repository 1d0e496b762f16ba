#include "watch_service.h"
#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("ragwatchd"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    rw::WatchService service;
    return service.run();
}
