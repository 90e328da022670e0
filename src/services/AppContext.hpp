#pragma once
#include <memory>
#include <QThreadPool>

#include "config/AppConfig.hpp"

class QSqliteService;
class DnnEmbeddingExtractor;
class BlobIntake;
class EnrollmentValidator;
class AttendanceReconciler;
class BackgroundJobRunner;

// 프로세스 전역 런타임. initialize() 성공 전에는 어떤 서비스도 꺼내 쓸 수 없다
class AppContext {
public:
	static AppContext& instance();

	// 저장소 -> 모델 -> 풀/서비스 순서. 하나라도 실패하면 not ready 유지
	bool initialize(const AppConfig& config);
	void shutdown();
	bool isReady() const { return ready_; }

	const AppConfig& config() const { return config_; }
	QSqliteService& store();
	BlobIntake& intake();
	QThreadPool* workerPool() { return &workerPool_; }
	EnrollmentValidator& enrollment();
	AttendanceReconciler& reconciler();
	BackgroundJobRunner& jobs();

private:
	AppContext() = default;
	~AppContext();
	AppContext(const AppContext&) = delete;
	AppContext& operator=(const AppContext&) = delete;

	void requireReady(const char* what) const;

	bool ready_ = false;
	AppConfig config_;
	QThreadPool workerPool_;
	std::unique_ptr<QSqliteService> store_;
	std::unique_ptr<DnnEmbeddingExtractor> extractor_;
	std::unique_ptr<BlobIntake> intake_;
	std::unique_ptr<EnrollmentValidator> enrollment_;
	std::unique_ptr<AttendanceReconciler> reconciler_;
	std::unique_ptr<BackgroundJobRunner> jobs_;
};
