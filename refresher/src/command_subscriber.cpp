#include "command_subscriber.hpp"
#include <QThread>
#include <QDebug>
#include <QUrl>
#include <atomic>
#include <memory>
#include <chrono>
#include <random>
#include <utility>

#include <sw/redis++/redis++.h>

sw::redis::ConnectionOptions redisOptionsFromUri(const QString& uri) {
    sw::redis::ConnectionOptions opts;
    QUrl u(uri);
    if (u.isValid() && u.scheme() == "redis") {
        opts.host = u.host().toStdString();
        opts.port = static_cast<int>(u.port(6379));
        // db из пути: /0
        QString path = u.path();
        if (path.startsWith('/')) path = path.mid(1);
        bool ok = false;
        int db = path.toInt(&ok);
        if (ok) opts.db = db;
        if (!u.password().isEmpty()) opts.password = u.password().toStdString();
    } else {
        qWarning() << "[CommandSubscriber] unsupported redis url" << uri << ", using 127.0.0.1:6379/0";
        opts.host = "127.0.0.1";
        opts.port = 6379;
        opts.db   = 0;
    }
    // consume() периодически бросает TimeoutError: шанс выйти по stop()
    opts.socket_timeout = std::chrono::milliseconds(2000);
    opts.connect_timeout = std::chrono::milliseconds(2000);
    return opts;
}

class CommandSubscriber::Worker : public QObject {
    Q_OBJECT
public:
    Worker(QString url, QString channel, std::shared_ptr<std::atomic_bool> running, QObject* parent = nullptr)
        : QObject(parent), url_(std::move(url)), channel_(std::move(channel)), running_(std::move(running)) {}

    void setReconnectRange(int minMs, int maxMs) {
        minDelayMs_.store(std::max(10, minMs));
        maxDelayMs_.store(std::max(minDelayMs_.load(), maxMs));
    }

public slots:
    void start() {
        loop();
    }

signals:
    void connected();
    void disconnected(const QString& reason);
    void commandReceived(const RefreshCommand& command);
    void malformedCommand(const QString& error, const QByteArray& payload);
    void finished();

private:
    void dispatch(const std::string& msg) {
        const QByteArray payload(msg.data(), static_cast<int>(msg.size()));
        RefreshCommand cmd;
        QString err;
        if (parseRefreshCommand(payload, cmd, &err))
            emit commandReceived(cmd);
        else
            emit malformedCommand(err, payload);
    }

    void loop() {
        std::mt19937 rng{std::random_device{}()};
        while (running_->load()) {
            try {
                sw::redis::Redis redis(redisOptionsFromUri(url_));
                auto sub = redis.subscriber();

                sub.on_message([this](std::string, std::string msg) { dispatch(msg); });
                sub.subscribe(channel_.toStdString());

                emit connected();

                while (running_->load()) {
                    try {
                        sub.consume(); // блокируется до события/таймаута
                    } catch (const sw::redis::TimeoutError&) {
                        // нормальный сценарий
                    }
                }
            } catch (const std::exception& e) {
                emit disconnected(QString::fromUtf8(e.what()));
                std::uniform_int_distribution<int> dist(minDelayMs_.load(), maxDelayMs_.load());
                const int ms = dist(rng);
                for (int slept = 0; running_->load() && slept < ms; slept += 100)
                    QThread::msleep(100);
            }
        }
        emit finished();
    }

    QString url_;
    QString channel_;
    std::shared_ptr<std::atomic_bool> running_;
    std::atomic_int minDelayMs_{500};
    std::atomic_int maxDelayMs_{5000};
};

CommandSubscriber::CommandSubscriber(QString url, QString channel, QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<RefreshCommand>("RefreshCommand");

    worker_ = new Worker(std::move(url), std::move(channel), running_);
    thread_ = new QThread(this);
    worker_->moveToThread(thread_);

    QObject::connect(thread_, &QThread::started,  worker_, &Worker::start);
    QObject::connect(worker_, &Worker::finished,  thread_, &QThread::quit);
    QObject::connect(thread_, &QThread::finished, worker_, &QObject::deleteLater);

    QObject::connect(worker_, &Worker::connected,        this, &CommandSubscriber::connected);
    QObject::connect(worker_, &Worker::disconnected,     this, &CommandSubscriber::disconnected);
    QObject::connect(worker_, &Worker::commandReceived,  this, &CommandSubscriber::commandReceived);
    QObject::connect(worker_, &Worker::malformedCommand, this, &CommandSubscriber::malformedCommand);
}

CommandSubscriber::~CommandSubscriber() {
    stop();
    if (thread_->isRunning()) {
        // connect/socket таймауты по 2s, бэкофф шагами по 100мс
        thread_->wait();
    } else if (!thread_->isFinished()) {
        // поток так и не запускали
        delete worker_;
    }
    worker_ = nullptr;
}

void CommandSubscriber::setReconnectDelay(int minMs, int maxMs) {
    worker_->setReconnectRange(minMs, maxMs);
}

void CommandSubscriber::start() {
    if (thread_->isRunning() || thread_->isFinished()) return;
    running_->store(true);
    thread_->start();
}

// Флаг общий с воркером: его цикл занят consume(), до очереди событий он не дойдёт
void CommandSubscriber::stop() {
    running_->store(false);
}

#include "command_subscriber.moc"
