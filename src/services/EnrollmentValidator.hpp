#pragma once
#include <vector>
#include <QByteArray>
#include <QString>
#include <QStringList>

#include "include/types.hpp"
#include "include/errors.hpp"

class IEmbeddingExtractor;
class IAttendanceStore;
class QThreadPool;

struct EnrollRequest {
	QString identityKey;
	QString externalKey;
	QString displayName;
	std::vector<QByteArray> images;		// 정확히 3장
	QStringList sourceRefs;				// images 와 같은 순서 (비어 있으면 자동 생성)
};

struct EnrolledIdentity {
	Identity identity;
	std::vector<StoredEmbedding> embeddings;
};

struct EnrollOutcome {
	PipelineError error;
	EnrolledIdentity enrolled;
	float maxPairDistance = -1.0f;

	bool ok() const { return !error.isError(); }
};

// 3장 사진 -> 검증된 identity 1개 + 임베딩 3개.
// 모든 추출/검증이 끝난 뒤에만 저장소에 기록한다
class EnrollmentValidator {
public:
	struct Params {
		float	matchThreshold = 0.6f;		// 사진 간 최대 허용 거리
		bool	requireSingleFace = false;	// 사진당 얼굴 1개만
		int		extractTimeoutMs = 30000;
	};

	EnrollmentValidator(const IEmbeddingExtractor& extractor, IAttendanceStore& store,
						QThreadPool* pool, const Params& params);

	EnrollOutcome validateAndBuild(const EnrollRequest& req);

	const Params& params() const { return params_; }

private:
	const IEmbeddingExtractor& extractor_;
	IAttendanceStore& store_;
	QThreadPool* pool_;
	Params params_;
};
