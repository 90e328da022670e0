#include "services/AppContext.hpp"
#include "services/QSqliteService.hpp"
#include "services/BlobIntake.hpp"
#include "services/EnrollmentValidator.hpp"
#include "services/AttendanceReconciler.hpp"
#include "services/BackgroundJobRunner.hpp"
#include "ai/DnnEmbeddingExtractor.hpp"
#include "include/recog_params.hpp"
#include "log/SystemLogger.hpp"

#include <QDebug>

AppContext& AppContext::instance()
{
	static AppContext inst;
	return inst;
}

AppContext::~AppContext()
{
	shutdown();
}

void AppContext::requireReady(const char* what) const
{
	if (!ready_) qFatal("[AppContext] %s requested before initialization", what);
}

bool AppContext::initialize(const AppConfig& config)
{
	if (ready_) return true;

	QStringList errs;
	if (!config.validate(&errs)) {
		qCritical() << "[AppContext] invalid configuration:" << errs.join("; ");
		return false;
	}
	config_ = config;
	qInfo() << "[AppContext]" << config_.summary();

	// 1) DB 준비
	store_ = std::make_unique<QSqliteService>(config_.dbPath);
	if (!store_->initializeDatabase()) {
		qCritical() << "[AppContext] database initialization failed:" << config_.dbPath;
		store_.reset();
		return false;
	}
	SystemLogger::init(store_->databasePath());

	// 2) 모델 로드 (1회)
	DnnEmbeddingExtractor::Options eo;
	eo.detectorModel	= config_.detectorModel;
	eo.recognizerModel	= config_.recognizerModel;
	eo.maxWidth			= config_.detectMaxWidth;
	eo.scoreThr			= recog::DETECT_THR;
	eo.nmsThr			= recog::NMS_THR;
	eo.topK				= recog::DETECT_TOP_K;
	extractor_ = std::make_unique<DnnEmbeddingExtractor>(eo);
	if (!extractor_->isReady()) {
		qCritical() << "[AppContext] face models failed to load";
		SystemLogger::critical("APP", QStringLiteral("face models failed to load"));
		extractor_.reset();
		return false;
	}

	// 3) 풀 + 서비스
	workerPool_.setMaxThreadCount(config_.extractThreads);

	BlobIntake::Options io;
	io.timeoutMs	= config_.downloadTimeoutMs;
	io.maxBytes		= config_.maxImageBytes;
	intake_ = std::make_unique<BlobIntake>(io);

	EnrollmentValidator::Params ep;
	ep.matchThreshold		= static_cast<float>(config_.matchThreshold);
	ep.requireSingleFace	= config_.requireSingleFace;
	ep.extractTimeoutMs		= config_.extractTimeoutMs;
	enrollment_ = std::make_unique<EnrollmentValidator>(*extractor_, *store_, &workerPool_, ep);

	AttendanceReconciler::Params rp;
	rp.matchThreshold	= static_cast<float>(config_.matchThreshold);
	rp.extractTimeoutMs	= config_.extractTimeoutMs;
	reconciler_ = std::make_unique<AttendanceReconciler>(*extractor_, *store_, &workerPool_, rp);

	BackgroundJobRunner::Params jp;
	jp.maxConcurrentJobs	= config_.jobThreads;
	jp.downloadTimeoutMs	= config_.downloadTimeoutMs;
	jobs_ = std::make_unique<BackgroundJobRunner>(*reconciler_, *intake_, &workerPool_, jp);

	ready_ = true;
	SystemLogger::info("APP", QStringLiteral("runtime ready"), config_.summary());
	return true;
}

void AppContext::shutdown()
{
	if (jobs_) jobs_->waitForIdle();
	workerPool_.waitForDone();

	ready_ = false;
	jobs_.reset();
	reconciler_.reset();
	enrollment_.reset();
	intake_.reset();
	extractor_.reset();
	store_.reset();
}

QSqliteService& AppContext::store()				{ requireReady("store"); return *store_; }
BlobIntake& AppContext::intake()				{ requireReady("intake"); return *intake_; }
EnrollmentValidator& AppContext::enrollment()	{ requireReady("enrollment"); return *enrollment_; }
AttendanceReconciler& AppContext::reconciler()	{ requireReady("reconciler"); return *reconciler_; }
BackgroundJobRunner& AppContext::jobs()			{ requireReady("jobs"); return *jobs_; }
