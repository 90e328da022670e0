#include "services/BackgroundJobRunner.hpp"
#include "services/AttendanceReconciler.hpp"
#include "services/BlobIntake.hpp"
#include "log/LogCategories.hpp"
#include "log/SystemLogger.hpp"

#include <QElapsedTimer>
#include <QDebug>
#include <exception>

BackgroundJobRunner::BackgroundJobRunner(AttendanceReconciler& reconciler, const IBlobIntake& intake,
										 QThreadPool* intakePool, const Params& params)
	: reconciler_(reconciler), intake_(intake), intakePool_(intakePool), params_(params)
{
	jobPool_.setMaxThreadCount(qMax(1, params_.maxConcurrentJobs));
	jobPool_.setObjectName(QStringLiteral("AttendanceJobs"));
}

BackgroundJobRunner::~BackgroundJobRunner()
{
	jobPool_.waitForDone();
}

SubmitOutcome BackgroundJobRunner::submit(const QString& sessionKey, const QStringList& roster,
										  const QStringList& imageRefs)
{
	SubmitOutcome out;
	const QString session = sessionKey.trimmed();
	const QStringList keys = AttendanceReconciler::normalizeRoster(roster);

	if (session.isEmpty() || keys.isEmpty() || imageRefs.isEmpty()) {
		out.error = PipelineError::make(ErrorKind::Input,
				QStringLiteral("session_key, roster and image refs are required"));
		return out;
	}
	// 접수 후 실패하면 호출자는 알 수 없으므로 여기서 거절
	if (!reconciler_.isReady()) {
		out.error = PipelineError::make(ErrorKind::NotReady, QStringLiteral("face extractor is not initialized"));
		return out;
	}

	out.ack.sessionKey	= session;
	out.ack.rosterCount	= keys.size();
	out.ack.imageCount	= imageRefs.size();

	active_.fetchAndAddRelaxed(1);
	jobPool_.start([this, session, keys, imageRefs]() {
		runJob(session, keys, imageRefs);
		active_.fetchAndAddRelaxed(-1);
	});

	qCInfo(lcJob) << "[Job] accepted session=" << session
				  << "roster=" << out.ack.rosterCount << "images=" << out.ack.imageCount;
	return out;
}

void BackgroundJobRunner::runJob(const QString& sessionKey, const QStringList& roster,
								 const QStringList& imageRefs)
{
	const QString extra = QStringLiteral("session=%1").arg(sessionKey);
	QElapsedTimer t; t.start();
	qCInfo(lcJob) << "[Job] start session" << sessionKey;
	SystemLogger::info("JOB", QStringLiteral("attendance start"), extra);

	try {
		// 1) 다운로드/읽기 (병렬)
		const std::vector<BlobFetch> blobs =
				BlobIntake::fetchAll(intake_, imageRefs, intakePool_, params_.downloadTimeoutMs);

		std::vector<ProbeImage> probes;
		probes.reserve(blobs.size());
		for (int i = 0; i < imageRefs.size(); ++i) {
			ProbeImage p;
			p.ref = imageRefs[i];
			if (blobs[i].ok) p.bytes = blobs[i].bytes;
			else p.intakeError = blobs[i].error;
			probes.push_back(std::move(p));
		}

		// 2) 매칭 + upsert
		const ReconcileOutcome r = reconciler_.reconcile(sessionKey, roster, probes);
		if (!r.ok()) {
			qCCritical(lcJob) << "[Job] failed session" << sessionKey << r.error.toString();
			SystemLogger::error("JOB", QStringLiteral("attendance failed: %1").arg(r.error.toString()), extra);
			return;
		}

		for (const PipelineError& e : r.imageErrors)
			SystemLogger::warn("JOB", e.toString(), extra);

		const QString summary = QStringLiteral("Present=%1, Absent=%2, Detections=%3, SkippedImages=%4")
				.arg(r.present.size()).arg(r.absent.size()).arg(r.detections).arg(r.imagesSkipped);
		qCInfo(lcJob) << "[Job] done session" << sessionKey << summary << "in" << t.elapsed() << "ms";
		SystemLogger::info("JOB", QStringLiteral("attendance done: %1").arg(summary), extra);
	} catch (const std::exception& e) {
		qCCritical(lcJob) << "[Job] processing error session" << sessionKey << e.what();
		SystemLogger::critical("JOB", QStringLiteral("processing error: %1").arg(QString::fromUtf8(e.what())), extra);
	}
}

bool BackgroundJobRunner::waitForIdle(int msecs)
{
	return jobPool_.waitForDone(msecs);
}
