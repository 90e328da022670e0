#pragma once
#include <QByteArray>
#include <QDateTime>
#include <QVector>
#include <QString>
#include <QMutex>
#include "services/AttendanceStore.hpp"
#include "log/SystemLogTypes.hpp"


class QSqliteService : public IAttendanceStore {
public:
    explicit QSqliteService(const QString& dbPath);

    bool initializeDatabase();
    const QString& databasePath() const { return dbPath_; }

    // IAttendanceStore
    bool identityExists(const QString& identityKey, const QString& externalKey, bool* exists) override;
    StoreResult createIdentity(const Identity& identity,
                               const std::vector<StoredEmbedding>& embeddings) override;
    bool loadDescriptorRows(const QStringList& identityKeys, std::vector<DescriptorRow>* outRows) override;
    bool upsertMarks(const QString& sessionKey, const QStringList& identityKeys,
                     AttendanceStatus status) override;
    bool selectMarks(const QString& sessionKey, QVector<AttendanceMark>* outRows) override;

    // 통계/점검용
    bool countIdentities(int* outCount);
    bool countEmbeddings(const QString& identityKey, int* outCount);

    // 시스템로그 입력
    bool insertSystemLog(int level, const QString& tag, const QString& message,
                         const QDateTime& timestamp, const QString& extra = QString());

    bool selectSystemLogs(int offset, int limit,
                          int minLevel, const QString& tagLike,
                          QVector<SystemLog>* outRows,
                          int* outTotal);

private:
	QString dbPath_;
	QMutex dbMutex;
};
