#include "services/EnrollmentValidator.hpp"
#include "services/AttendanceStore.hpp"
#include "services/FanOut.hpp"
#include "ai/EmbeddingExtractor.hpp"
#include "match/FaceMatcher.hpp"
#include "include/recog_params.hpp"
#include "log/LogCategories.hpp"
#include "log/SystemLogger.hpp"

#include <QDebug>
#include <algorithm>

EnrollmentValidator::EnrollmentValidator(const IEmbeddingExtractor& extractor, IAttendanceStore& store,
										 QThreadPool* pool, const Params& params)
	: extractor_(extractor), store_(store), pool_(pool), params_(params) {}

EnrollOutcome EnrollmentValidator::validateAndBuild(const EnrollRequest& req)
{
	EnrollOutcome out;
	auto reject = [&](ErrorKind k, const QString& msg, int idx = -1) {
		out.error = PipelineError::make(k, msg, idx);
		qCWarning(lcEnroll) << "[Enroll]" << req.externalKey.trimmed() << out.error.toString();
		return out;
	};

	const QString identityKey = req.identityKey.trimmed();
	const QString externalKey = req.externalKey.trimmed();
	const QString displayName = req.displayName.trimmed();

	// 1) 입력 검사
	if (identityKey.isEmpty() || externalKey.isEmpty() || displayName.isEmpty()) {
		return reject(ErrorKind::Input, QStringLiteral("identity_key, external_key and display_name are required"));
	}
	if (static_cast<int>(req.images.size()) != recog::ENROLL_IMAGES) {
		return reject(ErrorKind::Input, QStringLiteral("exactly %1 images required (got %2)")
				.arg(recog::ENROLL_IMAGES).arg(req.images.size()));
	}
	for (int i = 0; i < recog::ENROLL_IMAGES; ++i) {
		if (req.images[i].isEmpty())
			return reject(ErrorKind::Input, QStringLiteral("image is empty"), i);
	}
	if (!extractor_.isReady()) {
		return reject(ErrorKind::NotReady, QStringLiteral("face extractor is not initialized"));
	}

	// 2) 중복 선검사 (최종 보장은 저장소 unique 제약)
	bool exists = false;
	if (!store_.identityExists(identityKey, externalKey, &exists)) {
		return reject(ErrorKind::Store, QStringLiteral("duplicate check failed"));
	}
	if (exists) {
		return reject(ErrorKind::Conflict, QStringLiteral("duplicate identity"));
	}

	// 3) 3장 병렬 추출
	std::vector<std::function<ExtractResult()>> tasks;
	for (const QByteArray& img : req.images) {
		const IEmbeddingExtractor* ex = &extractor_;
		tasks.push_back([ex, img]() { return ex->extract(img, ExtractMode::BestFace); });
	}
	const std::vector<ExtractResult> results = FanOut::run<ExtractResult>(
			pool_, std::move(tasks), params_.extractTimeoutMs,
			[](const QString& why) { return ExtractResult::failure(why); });

	std::vector<FaceEmbedding> embs;
	for (int i = 0; i < recog::ENROLL_IMAGES; ++i) {
		const ExtractResult& r = results[i];
		if (!r.ok) {
			return reject(ErrorKind::Validation, QStringLiteral("face extraction failed: %1").arg(r.error), i);
		}
		if (r.detectedCount == 0 || r.faces.empty()) {
			return reject(ErrorKind::Validation, QStringLiteral("no face detected"), i);
		}
		if (params_.requireSingleFace && r.detectedCount > 1) {
			return reject(ErrorKind::Validation, QStringLiteral("multiple faces detected"), i);
		}
		embs.push_back(r.faces.front().embedding);
	}

	// 4) 동일인 검사 (모든 쌍)
	float maxDist = 0.0f;
	for (int a = 0; a < recog::ENROLL_IMAGES; ++a) {
		for (int b = a + 1; b < recog::ENROLL_IMAGES; ++b) {
			const float d = FaceMatcher::euclidean(embs[a], embs[b]);
			qCDebug(lcEnroll) << "[Enroll] pair" << a + 1 << b + 1 << "d=" << d;
			maxDist = std::max(maxDist, d);
			if (!(d <= params_.matchThreshold)) {
				out.maxPairDistance = d;
				return reject(ErrorKind::Validation, QStringLiteral("images are not of the same person"), b);
			}
		}
	}
	out.maxPairDistance = maxDist;

	// 5) identity + 임베딩 3개 원자적 생성
	EnrolledIdentity built;
	built.identity.identityKey = identityKey;
	built.identity.externalKey = externalKey;
	built.identity.displayName = displayName;
	for (int i = 0; i < recog::ENROLL_IMAGES; ++i) {
		StoredEmbedding se;
		se.identityKey = built.identity.identityKey;
		se.vector = std::move(embs[i]);
		se.sourceRef = (i < req.sourceRefs.size() && !req.sourceRefs[i].isEmpty())
				? req.sourceRefs[i]
				: QStringLiteral("upload:%1/%2").arg(built.identity.externalKey).arg(i + 1);
		built.embeddings.push_back(std::move(se));
	}

	switch (store_.createIdentity(built.identity, built.embeddings)) {
		case StoreResult::Ok:
			break;
		case StoreResult::Conflict:
			return reject(ErrorKind::Conflict, QStringLiteral("duplicate identity"));
		case StoreResult::Failed:
			return reject(ErrorKind::Store, QStringLiteral("failed to persist identity"));
	}

	out.enrolled = std::move(built);
	qCInfo(lcEnroll) << "[Enroll] registered" << out.enrolled.identity.identityKey
					 << out.enrolled.identity.displayName << "maxPairDist=" << maxDist;
	SystemLogger::info("ENROLL", QStringLiteral("registered %1").arg(out.enrolled.identity.identityKey),
					   out.enrolled.identity.externalKey);
	return out;
}
