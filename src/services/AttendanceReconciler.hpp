#pragma once
#include <memory>
#include <set>
#include <vector>
#include <QHash>
#include <QMutex>
#include <QString>
#include <QStringList>

#include "include/types.hpp"
#include "include/errors.hpp"

class IEmbeddingExtractor;
class IAttendanceStore;
class QThreadPool;

struct ReconcileOutcome {
	PipelineError error;
	std::set<QString> present;
	std::set<QString> absent;

	int imagesTotal = 0;
	int imagesSkipped = 0;			// 읽기/디코드/추출 실패로 건너뛴 이미지
	int detections = 0;				// 검출된 얼굴 총수
	int unknownFaces = 0;
	int skippedDescriptors = 0;		// 깨진 저장 임베딩
	std::vector<PipelineError> imageErrors;	// 건너뛴 이미지마다 ExtractionError 하나

	bool ok() const { return !error.isError(); }
};

// 명단 + 수업 사진 -> 출석/결석 계산 후 명단 전체를 upsert.
// 같은 세션에 대한 두 실행의 기록 단계는 서로 겹치지 않는다
class AttendanceReconciler {
public:
	struct Params {
		float	matchThreshold = 0.6f;
		int		extractTimeoutMs = 30000;
	};

	AttendanceReconciler(const IEmbeddingExtractor& extractor, IAttendanceStore& store,
						 QThreadPool* pool, const Params& params);

	// 추출기 준비 여부. false 면 reconcile 은 NotReady 를 돌려준다
	bool isReady() const;

	ReconcileOutcome reconcile(const QString& sessionKey, const QStringList& roster,
							   const std::vector<ProbeImage>& probes);

	// 앞뒤 공백 제거, 빈 값/중복 제거 (순서 유지)
	static QStringList normalizeRoster(const QStringList& roster);

private:
	const IEmbeddingExtractor& extractor_;
	IAttendanceStore& store_;
	QThreadPool* pool_;
	Params params_;

	QMutex sessionLocksMutex_;
	QHash<QString, std::shared_ptr<QMutex>> sessionLocks_;

	std::shared_ptr<QMutex> sessionLock(const QString& sessionKey);
	bool persist(const QString& sessionKey, const QStringList& roster, const std::set<QString>& present);
};
