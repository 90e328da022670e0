#include "QSqliteService.hpp"
#include "services/SqlCommon.hpp"
#include "match/DescriptorCodec.hpp"
#include "log/LogCategories.hpp"
#include <QSqlDatabase>
#include <QSqlDriver>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QVariantList>
#include <QDebug>

using namespace SqlCommon;

// 호출 스레드 전용 커넥션 확보 (QSqlDatabase는 스레드 간 공유 불가)
static QSqlDatabase ensureOpenConnectionForThisThread(const QString& dbPath) {
    const QString name = SqlCommon::connectionNameForCurrentThread(dbPath);
    QSqlDatabase db;

    if (QSqlDatabase::contains(name)) {
        db = QSqlDatabase::database(name, /*open=*/false);
        // 종료된 풀 스레드와 id가 겹치면 남의 커넥션이라 invalid
        if (!db.isValid())
            QSqlDatabase::removeDatabase(name);
    }
    if (!db.isValid()) {
        db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
        db.setDatabaseName(dbPath);
        db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=5000"));
    }

    if (!db.isOpen() && !db.open()) {
        qCCritical(lcSql) << "[SQL] DB open failed:" << db.lastError().text()
                    << " path=" << db.databaseName()
                    << " drivers=" << QSqlDatabase::drivers();
    }
    return db;
}

static QString placeholders(int n)
{
    QStringList marks;
    marks.reserve(n);
    for (int i = 0; i < n; ++i) marks << QStringLiteral("?");
    return marks.join(',');
}

QSqliteService::QSqliteService(const QString& dbPath)
    : dbPath_(SqlCommon::prepareDbFile(dbPath)) {}

bool QSqliteService::initializeDatabase()
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) {
        qCCritical(lcSql) << "[SQL] Open failed:" << db.lastError().text()
                    << " path=" << db.databaseName();
        return false;
    }

    {   // 신뢰성 옵션
        QSqlQuery pragma(db);
        if (!pragma.exec("PRAGMA journal_mode=WAL;"))
            qCWarning(lcSql) << "[SQL] journal_mode=WAL failed (ignored):" << pragma.lastError().text();
        if (!pragma.exec("PRAGMA synchronous=NORMAL;"))
            qCWarning(lcSql) << "[SQL] synchronous=NORMAL failed (ignored):" << pragma.lastError().text();
        if (!pragma.exec("PRAGMA foreign_keys=ON;"))
            qCWarning(lcSql) << "[SQL] foreign_keys=ON failed (ignored):" << pragma.lastError().text();
    }

    const char* schema[] = {
        "CREATE TABLE IF NOT EXISTS identities ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "identity_key TEXT NOT NULL UNIQUE, "
        "external_key TEXT NOT NULL UNIQUE, "
        "display_name TEXT NOT NULL, "
        "created_at   TEXT NOT NULL)",

        "CREATE TABLE IF NOT EXISTS embeddings ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "identity_key TEXT NOT NULL REFERENCES identities(identity_key), "
        "source_ref   TEXT, "
        "descriptor   TEXT NOT NULL)",

        "CREATE TABLE IF NOT EXISTS attendance_marks ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "identity_key TEXT NOT NULL, "
        "session_key  TEXT NOT NULL, "
        "status       TEXT NOT NULL CHECK (status IN ('Present','Absent')), "
        "updated_at   TEXT NOT NULL, "
        "UNIQUE (identity_key, session_key))",

        "CREATE TABLE IF NOT EXISTS system_logs ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "level INTEGER NOT NULL, "
        "tag TEXT, "
        "message TEXT NOT NULL, "
        "timestamp TEXT NOT NULL, "
        "extra TEXT)"
    };

    QSqlQuery q(db);
    for (const char* ddl : schema) {
        if (!q.exec(QString::fromLatin1(ddl))) {
            qCCritical(lcSql) << "[SQL] schema failed:" << q.lastError().text();
            return false;
        }
    }

    // 인덱스
    const char* indexes[] = {
        "CREATE INDEX IF NOT EXISTS idx_emb_identity  ON embeddings(identity_key)",
        "CREATE INDEX IF NOT EXISTS idx_mark_session  ON attendance_marks(session_key)",
        "CREATE INDEX IF NOT EXISTS idx_sys_ts        ON system_logs(timestamp)",
        "CREATE INDEX IF NOT EXISTS idx_sys_level     ON system_logs(level)"
    };
    for (const char* ddl : indexes) {
        if (!q.exec(QString::fromLatin1(ddl)))
            qCWarning(lcSql) << "[SQL] index failed (ignored):" << q.lastError().text();
    }

    qCDebug(lcSql) << "[SQL] Database opened & schema ready. path=" << db.databaseName()
             << " driver=" << db.driverName();
    return true;
}

bool QSqliteService::identityExists(const QString& identityKey, const QString& externalKey, bool* exists)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    q.prepare("SELECT COUNT(*) FROM identities WHERE identity_key = ? OR external_key = ?");
    q.addBindValue(identityKey);
    q.addBindValue(externalKey);
    if (!q.exec() || !q.next()) {
        qCCritical(lcSql) << "[identityExists] query failed:" << q.lastError().text();
        return false;
    }
    if (exists) *exists = q.value(0).toInt() > 0;
    return true;
}

StoreResult QSqliteService::createIdentity(const Identity& identity,
                                           const std::vector<StoredEmbedding>& embeddings)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return StoreResult::Failed;

    if (!db.transaction()) {
        qCCritical(lcSql) << "[createIdentity] begin failed:" << db.lastError().text();
        return StoreResult::Failed;
    }

    QSqlQuery q(db);
    q.prepare("INSERT INTO identities (identity_key, external_key, display_name, created_at) "
              "VALUES (?, ?, ?, ?)");
    q.addBindValue(identity.identityKey);
    q.addBindValue(identity.externalKey);
    q.addBindValue(identity.displayName);
    q.addBindValue(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));
    if (!q.exec()) {
        const QSqlError err = q.lastError();
        db.rollback();
        if (SqlCommon::isUniqueViolation(err.nativeErrorCode())) {
            qCWarning(lcSql) << "[createIdentity] duplicate key:" << identity.identityKey << identity.externalKey;
            return StoreResult::Conflict;
        }
        qCCritical(lcSql) << "[createIdentity] insert identity failed:" << err.text();
        return StoreResult::Failed;
    }

    QVariantList owners, refs, descs;
    for (const auto& e : embeddings) {
        owners << identity.identityKey;
        refs   << e.sourceRef;
        descs  << DescriptorCodec::encode(e.vector);
    }

    QSqlQuery qe(db);
    qe.prepare("INSERT INTO embeddings (identity_key, source_ref, descriptor) VALUES (?, ?, ?)");
    qe.addBindValue(owners);
    qe.addBindValue(refs);
    qe.addBindValue(descs);
    if (!qe.execBatch()) {
        qCCritical(lcSql) << "[createIdentity] insert embeddings failed:" << qe.lastError().text();
        db.rollback();
        return StoreResult::Failed;
    }

    if (!db.commit()) {
        qCCritical(lcSql) << "[createIdentity] commit failed:" << db.lastError().text();
        db.rollback();
        return StoreResult::Failed;
    }
    return StoreResult::Ok;
}

bool QSqliteService::loadDescriptorRows(const QStringList& identityKeys, std::vector<DescriptorRow>* outRows)
{
    if (outRows) outRows->clear();
    if (identityKeys.isEmpty()) return true;

	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    q.prepare("SELECT identity_key, descriptor FROM embeddings "
              "WHERE identity_key IN (" + placeholders(identityKeys.size()) + ") "
              "ORDER BY identity_key, id");
    for (const auto& k : identityKeys) q.addBindValue(k);

    if (!q.exec()) {
        qCCritical(lcSql) << "[loadDescriptorRows] query failed:" << q.lastError().text();
        return false;
    }

    if (outRows) {
        while (q.next()) {
            DescriptorRow r;
            r.identityKey = q.value(0).toString();
            r.descriptor  = q.value(1).toString();
            outRows->push_back(std::move(r));
        }
    }
    return true;
}

bool QSqliteService::upsertMarks(const QString& sessionKey, const QStringList& identityKeys,
                                 AttendanceStatus status)
{
    if (identityKeys.isEmpty()) return true;

	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    if (!db.transaction()) {
        qCCritical(lcSql) << "[upsertMarks] begin failed:" << db.lastError().text();
        return false;
    }

    const QString now = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    QVariantList keys, sessions, statuses, stamps;
    for (const auto& k : identityKeys) {
        keys     << k;
        sessions << sessionKey;
        statuses << toString(status);
        stamps   << now;
    }

    QSqlQuery q(db);
    q.prepare("INSERT INTO attendance_marks (identity_key, session_key, status, updated_at) "
              "VALUES (?, ?, ?, ?) "
              "ON CONFLICT(identity_key, session_key) "
              "DO UPDATE SET status = excluded.status, updated_at = excluded.updated_at");
    q.addBindValue(keys);
    q.addBindValue(sessions);
    q.addBindValue(statuses);
    q.addBindValue(stamps);

    if (!q.execBatch()) {
        qCCritical(lcSql) << "[upsertMarks] failed:" << q.lastError().text()
                          << "session=" << sessionKey << "status=" << toString(status);
        db.rollback();
        return false;
    }
    if (!db.commit()) {
        qCCritical(lcSql) << "[upsertMarks] commit failed:" << db.lastError().text();
        db.rollback();
        return false;
    }
    return true;
}

bool QSqliteService::selectMarks(const QString& sessionKey, QVector<AttendanceMark>* outRows)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    q.prepare("SELECT a.identity_key, a.session_key, a.status, a.updated_at, "
              "COALESCE(i.display_name, '') "
              "FROM attendance_marks a "
              "LEFT JOIN identities i ON i.identity_key = a.identity_key "
              "WHERE a.session_key = ? "
              "ORDER BY i.display_name, a.identity_key");
    q.addBindValue(sessionKey);
    if (!q.exec()) {
        qCCritical(lcSql) << "[selectMarks] query failed:" << q.lastError().text();
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            AttendanceMark m;
            m.identityKey = q.value(0).toString();
            m.sessionKey  = q.value(1).toString();
            m.status      = q.value(2).toString() == QLatin1String("Present")
                                ? AttendanceStatus::Present : AttendanceStatus::Absent;
            m.updatedAt   = QDateTime::fromString(q.value(3).toString(), Qt::ISODateWithMs);
            m.displayName = q.value(4).toString();
            outRows->push_back(m);
        }
    }
    return true;
}

bool QSqliteService::countIdentities(int* outCount)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    if (!q.exec("SELECT COUNT(*) FROM identities") || !q.next()) return false;
    if (outCount) *outCount = q.value(0).toInt();
    return true;
}

bool QSqliteService::countEmbeddings(const QString& identityKey, int* outCount)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    q.prepare("SELECT COUNT(*) FROM embeddings WHERE identity_key = ?");
    q.addBindValue(identityKey);
    if (!q.exec() || !q.next()) return false;
    if (outCount) *outCount = q.value(0).toInt();
    return true;
}

bool QSqliteService::insertSystemLog(int level, const QString& tag, const QString& message,
                                     const QDateTime& timestamp, const QString& extra)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) {
        qCCritical(lcSql) << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    QSqlQuery q(db);
    q.prepare("INSERT INTO system_logs (level, tag, message, timestamp, extra) "
              "VALUES (?, ?, ?, ?, ?)");
    q.addBindValue(level);
    q.addBindValue(tag);
    q.addBindValue(message);
    q.addBindValue(timestamp.toString(Qt::ISODateWithMs));
    q.addBindValue(extra);

    if (!q.exec()) {
        qCCritical(lcSql) << "Insert system log failed:" << q.lastError().text();
        return false;
    }
    return true;
}

bool QSqliteService::selectSystemLogs(int offset, int limit,
                                      int minLevel, const QString& tagLike,
                                      QVector<SystemLog>* outRows, int* outTotal)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    QString where = "WHERE level >= ?";
    QList<QVariant> binds; binds << minLevel;
    if (!tagLike.isEmpty()) { where += " AND tag LIKE ?"; binds << ("%"+tagLike+"%"); }

    // total
    QSqlQuery qc(db);
    qc.prepare("SELECT COUNT(*) FROM system_logs " + where);
    for (auto& v : binds) qc.addBindValue(v);
    if (!qc.exec() || !qc.next()) return false;
    if (outTotal) *outTotal = qc.value(0).toInt();

    // rows
    QSqlQuery q(db);
    q.prepare("SELECT id, level, tag, message, timestamp, extra "
              "FROM system_logs " + where + " ORDER BY id DESC LIMIT ? OFFSET ?");
    for (auto& v : binds) q.addBindValue(v);
    q.addBindValue(limit);
    q.addBindValue(offset);

    if (!q.exec()) return false;

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            SystemLog r;
            r.id        = q.value(0).toInt();
            r.level     = q.value(1).toInt();
            r.tag       = q.value(2).toString();
            r.message   = q.value(3).toString();
            r.timestamp = QDateTime::fromString(q.value(4).toString(), Qt::ISODateWithMs);
            r.extra     = q.value(5).toString();
            outRows->push_back(r);
        }
    }
    return true;
}
