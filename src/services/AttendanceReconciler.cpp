#include "services/AttendanceReconciler.hpp"
#include "services/AttendanceStore.hpp"
#include "services/FanOut.hpp"
#include "ai/EmbeddingExtractor.hpp"
#include "match/DescriptorCodec.hpp"
#include "match/FaceMatcher.hpp"
#include "log/LogCategories.hpp"

#include <QDebug>
#include <algorithm>

AttendanceReconciler::AttendanceReconciler(const IEmbeddingExtractor& extractor, IAttendanceStore& store,
										   QThreadPool* pool, const Params& params)
	: extractor_(extractor), store_(store), pool_(pool), params_(params) {}

bool AttendanceReconciler::isReady() const
{
	return extractor_.isReady();
}

QStringList AttendanceReconciler::normalizeRoster(const QStringList& roster)
{
	QStringList out;
	for (const QString& k : roster) {
		const QString t = k.trimmed();
		if (!t.isEmpty()) out << t;
	}
	out.removeDuplicates();
	return out;
}

std::shared_ptr<QMutex> AttendanceReconciler::sessionLock(const QString& sessionKey)
{
	QMutexLocker lk(&sessionLocksMutex_);
	auto& m = sessionLocks_[sessionKey];
	if (!m) m = std::make_shared<QMutex>();
	return m;
}

// 1) 명단 전원 Absent  2) 검출된 사람 Present. 순서가 바뀌면 안 됨
bool AttendanceReconciler::persist(const QString& sessionKey, const QStringList& roster,
								   const std::set<QString>& present)
{
	auto lock = sessionLock(sessionKey);
	QMutexLocker lk(lock.get());

	if (!store_.upsertMarks(sessionKey, roster, AttendanceStatus::Absent)) {
		qCCritical(lcReconcile) << "[Reconcile] absent pass failed session=" << sessionKey;
		return false;
	}

	QStringList presentKeys;
	for (const QString& k : present) presentKeys << k;
	if (!store_.upsertMarks(sessionKey, presentKeys, AttendanceStatus::Present)) {
		qCCritical(lcReconcile) << "[Reconcile] present pass failed session=" << sessionKey;
		return false;
	}
	return true;
}

ReconcileOutcome AttendanceReconciler::reconcile(const QString& sessionKey, const QStringList& rosterIn,
												 const std::vector<ProbeImage>& probes)
{
	ReconcileOutcome out;
	out.imagesTotal = static_cast<int>(probes.size());

	const QString session = sessionKey.trimmed();
	const QStringList roster = normalizeRoster(rosterIn);
	if (session.isEmpty() || roster.isEmpty() || probes.empty()) {
		out.error = PipelineError::make(ErrorKind::Input,
				QStringLiteral("session_key, roster and images are required"));
		return out;
	}
	if (!isReady()) {
		out.error = PipelineError::make(ErrorKind::NotReady, QStringLiteral("face extractor is not initialized"));
		return out;
	}

	// 1) 명단에 한정된 인덱스
	std::vector<DescriptorRow> rows;
	if (!store_.loadDescriptorRows(roster, &rows)) {
		out.error = PipelineError::make(ErrorKind::Store, QStringLiteral("failed to load embeddings"));
		return out;
	}
	// 기준 차원은 모델 출력 차원 (깨진 행 하나가 기준이 되지 않게)
	const size_t dim = extractor_.dimension();
	DescriptorCodec::GroupStats gs;
	const auto grouped = DescriptorCodec::groupByIdentity(rows, dim, &gs);
	out.skippedDescriptors = gs.skipped;

	const FaceMatcher matcher = FaceMatcher::buildIndex(grouped, params_.matchThreshold, dim);
	if (matcher.empty()) {
		qCWarning(lcReconcile) << "[Reconcile] no usable embeddings for roster of" << roster.size()
							   << "session=" << session << "(everyone absent)";
	}

	// 2) 이미지별 병렬 추출. 읽기 실패한 이미지는 미리 제외
	std::vector<int> slotToProbe;
	std::vector<std::function<ExtractResult()>> tasks;
	for (int i = 0; i < static_cast<int>(probes.size()); ++i) {
		const ProbeImage& p = probes[i];
		if (!p.intakeError.isEmpty() || p.bytes.isEmpty()) {
			const QString why = p.intakeError.isEmpty() ? QStringLiteral("empty image") : p.intakeError;
			qCWarning(lcReconcile) << "[Reconcile] ExtractionError image" << i + 1 << p.ref << why;
			out.imageErrors.push_back(PipelineError::make(ErrorKind::Extraction, why, i));
			++out.imagesSkipped;
			continue;
		}
		const IEmbeddingExtractor* ex = &extractor_;
		const QByteArray bytes = p.bytes;
		tasks.push_back([ex, bytes]() { return ex->extract(bytes, ExtractMode::AllFaces); });
		slotToProbe.push_back(i);
	}

	std::vector<ExtractResult> results;
	if (!matcher.empty() && !tasks.empty()) {
		results = FanOut::run<ExtractResult>(pool_, std::move(tasks), params_.extractTimeoutMs,
				[](const QString& why) { return ExtractResult::failure(why); });
	}
	else if (!tasks.empty()) {
		qCDebug(lcReconcile) << "[Reconcile] skipping extraction, nothing to match against";
	}

	// join 이후 단일 스레드에서 합친다
	for (size_t s = 0; s < results.size(); ++s) {
		const ExtractResult& r = results[s];
		const ProbeImage& p = probes[slotToProbe[s]];
		if (!r.ok) {
			qCWarning(lcReconcile) << "[Reconcile] ExtractionError image" << slotToProbe[s] + 1 << p.ref << r.error;
			out.imageErrors.push_back(PipelineError::make(ErrorKind::Extraction, r.error, slotToProbe[s]));
			++out.imagesSkipped;
			continue;
		}
		out.detections += r.detectedCount;
		for (const DetectedFace& f : r.faces) {
			const MatchResult m = matcher.classify(f.embedding);
			if (m.known() && roster.contains(m.identityKey)) {
				out.present.insert(m.identityKey);
			}
			else {
				++out.unknownFaces;
			}
		}
	}

	std::sort(out.imageErrors.begin(), out.imageErrors.end(),
			  [](const PipelineError& a, const PipelineError& b) { return a.imageIndex < b.imageIndex; });

	// 3) absent = roster - present
	for (const QString& k : roster) {
		if (!out.present.count(k)) out.absent.insert(k);
	}

	// 4) 명단 전체 upsert
	if (!persist(session, roster, out.present)) {
		out.error = PipelineError::make(ErrorKind::Store, QStringLiteral("failed to persist attendance marks"));
		return out;
	}

	qCInfo(lcReconcile) << "[Reconcile] session" << session
						<< "present=" << out.present.size() << "absent=" << out.absent.size()
						<< "detections=" << out.detections << "skippedImages=" << out.imagesSkipped;
	return out;
}
