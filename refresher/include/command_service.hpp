#pragma once
#include <QObject>
#include <QByteArray>
#include <QString>
#include <memory>
#include "eventCodec.hpp"

class CommandSubscriber;
class RefreshOrchestrator;
class SourceManager;

namespace sw { namespace redis {
    class Redis;
}}

/**
 * CommandService: мост между Redis и оркестратором.
 *  - слушает входной канал с командами (refresh, check_status, cancel_*)
 *  - каждое событие раунда публикует в выходной канал как {"event": ...}
 */
class CommandService : public QObject {
    Q_OBJECT
public:
    CommandService(RefreshOrchestrator& orchestrator,
                   SourceManager& sources,
                   QString redisUrl,
                   QString inChannel,
                   QString outChannel,
                   QObject* parent = nullptr);
    ~CommandService() override;

    // Поднимает издателя и запускает подписчика
    bool start();

public slots:
    void handleCommand(const RefreshCommand& command);
    void handleMalformed(const QString& error, const QByteArray& payload);

signals:
    void started();

protected:
    // Публикация в выходной канал; false: Redis недоступен
    virtual bool publish(const QByteArray& json);

private:
    void wireOrchestrator();
    void publishEvent(const QString& name, const QJsonObject& fields = {});

    RefreshOrchestrator& orchestrator_;
    SourceManager& sources_;

    QString redisUrl_;
    QString inChan_;
    QString outChan_;

    CommandSubscriber* sub_ = nullptr;
    std::unique_ptr<sw::redis::Redis> pub_;
};
