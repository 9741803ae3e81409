#pragma once
#include <QObject>
#include <QByteArray>
#include <QString>
#include <atomic>
#include <memory>
#include "eventCodec.hpp"

class QThread;

namespace sw { namespace redis {
    struct ConnectionOptions;
}}

Q_DECLARE_METATYPE(RefreshCommand)

// redis://[:password@]host:port/db -> ConnectionOptions (без TLS)
sw::redis::ConnectionOptions redisOptionsFromUri(const QString& uri);

/**
 * CommandSubscriber: подписка на входной канал команд.
 * consume() крутится в отдельном QThread, payload разбирается там же;
 * наружу уходят уже готовые команды.
 */
class CommandSubscriber : public QObject {
    Q_OBJECT
public:
    explicit CommandSubscriber(QString url, QString channel, QObject* parent = nullptr);
    ~CommandSubscriber() override;

    // Диапазон бэкоффа при реконнекте (мс)
    void setReconnectDelay(int minMs, int maxMs);

public slots:
    void start();
    void stop();

signals:
    void connected();
    void disconnected(const QString& reason);
    void commandReceived(const RefreshCommand& command);
    void malformedCommand(const QString& error, const QByteArray& payload);

private:
    class Worker;
    std::shared_ptr<std::atomic_bool> running_ = std::make_shared<std::atomic_bool>(false);
    Worker* worker_ = nullptr;
    QThread* thread_ = nullptr;
};
