#pragma once
#include <map>
#include <set>
#include <utility>
#include <vector>
#include <QAtomicInt>
#include <QByteArray>
#include <QHash>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QStringList>
#include <QThread>

#include "ai/EmbeddingExtractor.hpp"
#include "services/AttendanceStore.hpp"
#include "services/BlobIntake.hpp"

namespace testing_fakes {

// 축 하나만 쓰는 4차원 벡터. 두 벡터 거리 = |a - b|
inline FaceEmbedding vec(float x, float y = 0.0f)
{
	return FaceEmbedding{x, y, 0.0f, 0.0f};
}

inline DetectedFace face(const FaceEmbedding& e)
{
	DetectedFace f;
	f.embedding = e;
	f.score = 0.9f;
	return f;
}

// 이미지 바이트 -> 미리 정한 얼굴 목록. 등록되지 않은 바이트는 디코드 실패로 취급
class FakeExtractor : public IEmbeddingExtractor {
public:
	bool ready = true;
	size_t dim = 4;
	unsigned long delayMs = 0;
	mutable QAtomicInt calls{0};

	void add(const QByteArray& image, const std::vector<FaceEmbedding>& faces)
	{
		ExtractResult r;
		r.ok = true;
		for (const auto& e : faces) r.faces.push_back(face(e));
		r.detectedCount = static_cast<int>(r.faces.size());
		table_[image] = r;
	}

	bool isReady() const override { return ready; }
	size_t dimension() const override { return dim; }

	ExtractResult extract(const QByteArray& image, ExtractMode mode) const override
	{
		calls.fetchAndAddRelaxed(1);
		if (delayMs) QThread::msleep(delayMs);

		const auto it = table_.find(image);
		if (it == table_.end()) return ExtractResult::failure(QStringLiteral("cannot decode image"));

		ExtractResult r = it->second;
		if (mode == ExtractMode::BestFace && r.faces.size() > 1) r.faces.resize(1);
		return r;
	}

private:
	std::map<QByteArray, ExtractResult> table_;
};

// ref -> 바이트. 모르는 ref 는 실패
class FakeIntake : public IBlobIntake {
public:
	void add(const QString& ref, const QByteArray& bytes) { blobs_[ref] = bytes; }

	BlobFetch fetch(const QString& ref) const override
	{
		BlobFetch b;
		const auto it = blobs_.find(ref);
		if (it == blobs_.end()) {
			b.error = QStringLiteral("not found: %1").arg(ref);
			return b;
		}
		b.ok = true;
		b.bytes = it->second;
		return b;
	}

private:
	std::map<QString, QByteArray> blobs_;
};

// 메모리 저장소. fail* 플래그로 각 연산을 실패시킬 수 있다
class FakeStore : public IAttendanceStore {
public:
	bool failExists = false;
	bool failCreate = false;
	bool conflictOnCreate = false;
	bool failLoad = false;
	bool failUpsert = false;

	int createCalls = 0;
	int upsertCalls = 0;
	std::vector<Identity> identities;
	std::vector<StoredEmbedding> embeddings;
	std::vector<DescriptorRow> rows;						// loadDescriptorRows 가 돌려줄 원본
	std::map<std::pair<QString, QString>, AttendanceStatus> marks;	// (identity, session)

	bool identityExists(const QString& identityKey, const QString& externalKey, bool* exists) override
	{
		QMutexLocker lk(&mtx_);
		if (failExists) return false;
		bool found = false;
		for (const auto& i : identities)
			found = found || i.identityKey == identityKey || i.externalKey == externalKey;
		*exists = found;
		return true;
	}

	StoreResult createIdentity(const Identity& identity, const std::vector<StoredEmbedding>& embs) override
	{
		QMutexLocker lk(&mtx_);
		++createCalls;
		if (failCreate) return StoreResult::Failed;
		if (conflictOnCreate) return StoreResult::Conflict;
		identities.push_back(identity);
		embeddings.insert(embeddings.end(), embs.begin(), embs.end());
		return StoreResult::Ok;
	}

	bool loadDescriptorRows(const QStringList& identityKeys, std::vector<DescriptorRow>* outRows) override
	{
		QMutexLocker lk(&mtx_);
		if (failLoad) return false;
		outRows->clear();
		for (const auto& r : rows)
			if (identityKeys.contains(r.identityKey)) outRows->push_back(r);
		return true;
	}

	bool upsertMarks(const QString& sessionKey, const QStringList& identityKeys, AttendanceStatus status) override
	{
		QMutexLocker lk(&mtx_);
		++upsertCalls;
		if (failUpsert) return false;
		for (const auto& k : identityKeys) marks[{k, sessionKey}] = status;
		return true;
	}

	bool selectMarks(const QString& sessionKey, QVector<AttendanceMark>* outRows) override
	{
		QMutexLocker lk(&mtx_);
		outRows->clear();
		for (const auto& [key, st] : marks) {
			if (key.second != sessionKey) continue;
			AttendanceMark m;
			m.identityKey = key.first;
			m.sessionKey = key.second;
			m.status = st;
			outRows->push_back(m);
		}
		return true;
	}

private:
	QMutex mtx_;
};

} // namespace testing_fakes
