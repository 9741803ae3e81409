#include <QCoreApplication>
#include <QDebug>
#include <clocale>
#include "config.hpp"
#include "command_service.hpp"
#include "refreshDaemon.hpp"
#include "feedpp.h"


int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    std::setlocale(LC_TIME, "C");

    const QString configPath = argc > 1 ? QString::fromLocal8Bit(argv[1])
                                        : QStringLiteral("res/config.json");
    Config config;
    try {
        config.parse(configPath);
    } catch (const std::exception& e) {
        qCritical() << "[main] config" << configPath << ":" << e.what();
        return 1;
    }

    feedpp::parser::global_init();

    int rc = 1;
    {
        RefreshDaemon daemon(config);
        QObject::connect(&app, &QCoreApplication::aboutToQuit, &daemon, &RefreshDaemon::stop);

        if (daemon.start()) {
            CommandService svc(daemon.orchestrator(), daemon.sourceManager(),
                               config.redis_url, config.in_channel, config.out_channel);
            if (!svc.start())
                qWarning() << "[main] command service is not available, running on timers only";

            rc = app.exec();
        } else {
            qCritical() << "[main] daemon failed to start";
        }
    }

    feedpp::parser::global_cleanup();
    return rc;
}
