#pragma once
#include <vector>
#include <QString>
#include <QStringList>
#include <QVector>
#include "include/types.hpp"

enum class StoreResult { Ok = 0, Conflict, Failed };

// 등록/출석 코어가 보는 저장소 (identities, embeddings, attendance_marks)
class IAttendanceStore {
public:
	virtual ~IAttendanceStore() = default;

	// 두 키 중 하나라도 이미 있으면 *exists = true. 조회 실패 시 false
	virtual bool identityExists(const QString& identityKey, const QString& externalKey, bool* exists) = 0;

	// identity + embeddings 를 한 트랜잭션으로 기록. unique 위반은 Conflict
	virtual StoreResult createIdentity(const Identity& identity,
									   const std::vector<StoredEmbedding>& embeddings) = 0;

	virtual bool loadDescriptorRows(const QStringList& identityKeys, std::vector<DescriptorRow>* outRows) = 0;

	// (identity_key, session_key) 단위 upsert
	virtual bool upsertMarks(const QString& sessionKey, const QStringList& identityKeys,
							 AttendanceStatus status) = 0;

	virtual bool selectMarks(const QString& sessionKey, QVector<AttendanceMark>* outRows) = 0;
};
