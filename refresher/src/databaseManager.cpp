#include "databaseManager.hpp"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

static QString toIso(const QDateTime& ts) {
    return ts.isValid() ? ts.toUTC().toString(Qt::ISODateWithMs) : QString();
}

static QDateTime fromIso(const QVariant& v) {
    if (v.isNull()) return {};
    QDateTime dt = QDateTime::fromString(v.toString(), Qt::ISODateWithMs);
    if (!dt.isValid()) dt = QDateTime::fromString(v.toString(), Qt::ISODate);
    return dt;
}

static QVariant nullableText(const QString& s) {
    return s.isEmpty() ? QVariant(QMetaType(QMetaType::QString)) : QVariant(s);
}

static QString configToJson(const QVariantMap& cfg) {
    if (cfg.isEmpty()) return QString();
    return QString::fromUtf8(QJsonDocument(QJsonObject::fromVariantMap(cfg)).toJson(QJsonDocument::Compact));
}

static QVariantMap configFromJson(const QString& json) {
    if (json.isEmpty()) return {};
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject()) {
        qWarning() << "[DBManager] bad custom_config json:" << json;
        return {};
    }
    return doc.object().toVariantMap();
}

// порядок колонок должен совпадать с sourceFromQuery
static const char* kSourceColumns =
    "id, name, type, url, category_name, is_enabled, custom_config, "
    "status, last_error, last_checked_time, consecutive_error_count";

static NewsSource sourceFromQuery(const QSqlQuery& q) {
    NewsSource s;
    s.id                    = q.value(0).toInt();
    s.name                  = q.value(1).toString();
    s.type                  = q.value(2).toString();
    s.url                   = q.value(3).toString();
    s.category              = q.value(4).toString();
    s.enabled               = q.value(5).toInt() != 0;
    s.customConfig          = configFromJson(q.value(6).toString());
    s.status                = sourceStatusFromString(q.value(7).toString());
    s.lastError             = q.value(8).toString();
    s.lastCheckedTime       = fromIso(q.value(9));
    s.consecutiveErrorCount = q.value(10).toInt();
    return s;
}

DBManager::DBManager(const QString& conn_name, const QString& db_path, const QString& driver)
    : conn_name_(conn_name)
    , db_path_(db_path)
{
    db = QSqlDatabase::addDatabase(driver, conn_name);
}

DBManager::~DBManager() {
    close();
    // removeDatabase требует, чтобы копий QSqlDatabase не осталось
    db = QSqlDatabase();
    QSqlDatabase::removeDatabase(conn_name_);
}

bool DBManager::dbCheck()
{
    if (!db.isOpen()) {
        qWarning() << "[DBManager]" << conn_name_ << "DB not open";
        return false;
    }
    return true;
}

bool DBManager::ensureSchema() {
    const QStringList ddl = {
        R"SQL(
        CREATE TABLE IF NOT EXISTS news_sources (
            id                      INTEGER PRIMARY KEY AUTOINCREMENT,
            name                    TEXT UNIQUE NOT NULL,
            type                    TEXT NOT NULL,
            url                     TEXT,
            category_name           TEXT,
            is_enabled              INTEGER NOT NULL DEFAULT 1,
            custom_config           TEXT,
            status                  TEXT NOT NULL DEFAULT 'unchecked',
            last_error              TEXT,
            last_checked_time       TEXT,
            consecutive_error_count INTEGER NOT NULL DEFAULT 0
        )
        )SQL",

        R"SQL(
        CREATE TABLE IF NOT EXISTS articles (
            id           INTEGER PRIMARY KEY AUTOINCREMENT,
            link         TEXT UNIQUE NOT NULL,
            title        TEXT,
            summary      TEXT,
            content      TEXT,
            publish_time TEXT,
            source_name  TEXT,
            category     TEXT,
            image_url    TEXT,
            language     TEXT,
            created_at   TEXT NOT NULL
        )
        )SQL",

        R"SQL(
        CREATE INDEX IF NOT EXISTS idx_articles_source ON articles (source_name)
        )SQL"
    };

    for (const QString& sql : ddl) {
        if (!exec(sql))
            return false;
    }
    return true;
}

bool DBManager::open() {
    if (db.isOpen())
        return true;

    if (db_path_ != QLatin1String(":memory:")) {
        const QFileInfo fi(db_path_);
        if (!QDir().mkpath(fi.absolutePath())) {
            qWarning() << "[DBManager] cannot create directory for" << db_path_;
            return false;
        }
    }

    db.setDatabaseName(db_path_);
    db.setConnectOptions("QSQLITE_BUSY_TIMEOUT=5000");

    qDebug() << "[DBManager] about to open" << conn_name_ << "path=" << db_path_;

    if (!db.open()) {
        qWarning() << "[DBManager] DB open error:" << db.lastError().text();
        return false;
    }

    // WAL: несколько соединений из разных потоков пишут без взаимных блокировок читателей
    exec("PRAGMA journal_mode=WAL");

    if (!ensureSchema()) {
        db.close();
        return false;
    }
    return true;
}

void DBManager::close() {
    if (db.isOpen())
        db.close();
}

bool DBManager::isOpen() const {
    return db.isOpen();
}

bool DBManager::exec(const QString& queryStr) {
    QSqlQuery query(db);
    if (!query.exec(queryStr)) {
        qWarning() << "[DBManager] query error:" << query.lastError().text();
        return false;
    }
    return true;
}

std::optional<int> DBManager::addSource(const NewsSource& source) {
    if (!dbCheck()) return std::nullopt;

    QSqlQuery q(db);
    q.prepare(R"SQL(
        INSERT INTO news_sources (name, type, url, category_name, is_enabled, custom_config,
                                  status, last_error, last_checked_time, consecutive_error_count)
        VALUES (:name, :type, :url, :cat, :en, :cfg, :st, :err, :chk, :cnt)
    )SQL");
    q.bindValue(":name", source.name);
    q.bindValue(":type", source.type);
    q.bindValue(":url",  nullableText(source.url));
    q.bindValue(":cat",  source.category);
    q.bindValue(":en",   source.enabled ? 1 : 0);
    q.bindValue(":cfg",  nullableText(configToJson(source.customConfig)));
    q.bindValue(":st",   sourceStatusToString(source.status));
    q.bindValue(":err",  nullableText(source.lastError));
    q.bindValue(":chk",  nullableText(toIso(source.lastCheckedTime)));
    q.bindValue(":cnt",  source.consecutiveErrorCount);

    if (!q.exec()) {
        qWarning() << "[DBManager] addSource failed:" << q.lastError().text() << source.name;
        return std::nullopt;
    }
    const QVariant id = q.lastInsertId();
    if (!id.isValid()) {
        qWarning() << "[DBManager] addSource: no id returned for" << source.name;
        return std::nullopt;
    }
    return id.toInt();
}

bool DBManager::updateSource(const NewsSource& source) {
    if (!dbCheck()) return false;
    if (!source.id) {
        qWarning() << "[DBManager] updateSource without id:" << source.name;
        return false;
    }

    QSqlQuery q(db);
    q.prepare(R"SQL(
        UPDATE news_sources
        SET name = :name, type = :type, url = :url, category_name = :cat,
            is_enabled = :en, custom_config = :cfg
        WHERE id = :id
    )SQL");
    q.bindValue(":name", source.name);
    q.bindValue(":type", source.type);
    q.bindValue(":url",  nullableText(source.url));
    q.bindValue(":cat",  source.category);
    q.bindValue(":en",   source.enabled ? 1 : 0);
    q.bindValue(":cfg",  nullableText(configToJson(source.customConfig)));
    q.bindValue(":id",   *source.id);

    if (!q.exec()) {
        qWarning() << "[DBManager] updateSource failed:" << q.lastError().text();
        return false;
    }
    return q.numRowsAffected() > 0;
}

bool DBManager::removeSource(int id) {
    if (!dbCheck()) return false;

    QSqlQuery q(db);
    q.prepare("DELETE FROM news_sources WHERE id = :id");
    q.bindValue(":id", id);
    if (!q.exec()) {
        qWarning() << "[DBManager] removeSource failed:" << q.lastError().text();
        return false;
    }
    return q.numRowsAffected() > 0;
}

std::optional<NewsSource> DBManager::selectOneSource(const QString& where, const QVariant& value) {
    if (!dbCheck()) return std::nullopt;

    QSqlQuery q(db);
    q.prepare(QString("SELECT %1 FROM news_sources WHERE %2 = :v LIMIT 1")
                  .arg(QLatin1String(kSourceColumns), where));
    q.bindValue(":v", value);
    if (!q.exec()) {
        qWarning() << "[DBManager] select source failed:" << q.lastError().text();
        return std::nullopt;
    }
    if (!q.next())
        return std::nullopt;
    return sourceFromQuery(q);
}

std::optional<NewsSource> DBManager::getSourceById(int id) {
    return selectOneSource("id", id);
}

std::optional<NewsSource> DBManager::getSourceByName(const QString& name) {
    return selectOneSource("name", name);
}

QList<NewsSource> DBManager::listSources() {
    QList<NewsSource> out;
    if (!dbCheck()) return out;

    QSqlQuery q(db);
    if (!q.exec(QString("SELECT %1 FROM news_sources ORDER BY type ASC, name ASC")
                    .arg(QLatin1String(kSourceColumns)))) {
        qWarning() << "[DBManager] listSources failed:" << q.lastError().text();
        return out;
    }
    while (q.next())
        out.append(sourceFromQuery(q));
    return out;
}

bool DBManager::updateSourceHealth(int sourceId,
                                   SourceStatus status,
                                   const QString& lastError,
                                   const QDateTime& checkedAt,
                                   int consecutiveErrors) {
    if (!dbCheck()) return false;

    QSqlQuery q(db);
    q.prepare(R"SQL(
        UPDATE news_sources
        SET status = :st, last_error = :err, last_checked_time = :chk,
            consecutive_error_count = :cnt
        WHERE id = :id
    )SQL");
    q.bindValue(":st",  sourceStatusToString(status));
    q.bindValue(":err", nullableText(lastError));
    q.bindValue(":chk", nullableText(toIso(checkedAt)));
    q.bindValue(":cnt", consecutiveErrors);
    q.bindValue(":id",  sourceId);

    if (!q.exec()) {
        qWarning() << "[DBManager] updateSourceHealth failed:" << q.lastError().text() << "id=" << sourceId;
        return false;
    }
    if (q.numRowsAffected() <= 0) {
        qWarning() << "[DBManager] updateSourceHealth: no source with id" << sourceId;
        return false;
    }
    return true;
}

int DBManager::insertArticles(const RawArticleList& rows) {
    if (!dbCheck()) return -1;
    if (rows.isEmpty()) return 0;

    if (!db.transaction()) {
        qWarning() << "[insertArticles] tx begin failed:" << db.lastError().text();
        return -1;
    }

    QSqlQuery q(db);
    q.prepare(R"SQL(
        INSERT OR IGNORE INTO articles
            (link, title, summary, content, publish_time, source_name, category,
             image_url, language, created_at)
        VALUES (:link, :title, :summary, :content, :pub, :src, :cat, :img, :lang, :created)
    )SQL");

    const QString now = toIso(QDateTime::currentDateTimeUtc());
    int inserted = 0;

    for (const auto& r : rows) {
        const QString link = r.value("link").toString();
        if (link.isEmpty()) {
            qDebug() << "[insertArticles] skip row without link, title=" << r.value("title");
            continue;
        }

        q.bindValue(":link",    link);
        q.bindValue(":title",   r.value("title").toString());
        q.bindValue(":summary", nullableText(r.value("summary").toString()));
        q.bindValue(":content", nullableText(r.value("content").toString()));
        q.bindValue(":pub",     nullableText(toIso(r.value("publish_time").toDateTime())));
        q.bindValue(":src",     r.value("source_name").toString());
        q.bindValue(":cat",     r.value("category").toString());
        q.bindValue(":img",     nullableText(r.value("image_url").toString()));
        q.bindValue(":lang",    r.contains("language") ? r.value("language").toString()
                                                       : QStringLiteral("unknown"));
        q.bindValue(":created", now);

        if (!q.exec()) {
            qWarning() << "[insertArticles] insert failed:" << q.lastError().text() << "link=" << link;
            db.rollback();
            return -1;
        }
        if (q.numRowsAffected() > 0)
            ++inserted;
    }

    if (!db.commit()) {
        qWarning() << "[insertArticles] commit failed:" << db.lastError().text();
        db.rollback();
        return -1;
    }
    return inserted;
}

int DBManager::articleCount() {
    if (!dbCheck()) return -1;

    QSqlQuery q(db);
    if (!q.exec("SELECT COUNT(*) FROM articles") || !q.next()) {
        qWarning() << "[DBManager] articleCount failed:" << q.lastError().text();
        return -1;
    }
    return q.value(0).toInt();
}

SqlHealthStoreFactory::SqlHealthStoreFactory(QString db_path)
    : db_path_(std::move(db_path))
{}

std::unique_ptr<HealthStore> SqlHealthStoreFactory::open(const QString& connectionName) {
    auto store = std::make_unique<DBManager>(connectionName, db_path_);
    if (!store->open()) {
        qWarning() << "[SqlHealthStoreFactory] cannot open" << connectionName;
        return nullptr;
    }
    return store;
}
