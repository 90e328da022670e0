#pragma once
#include <QAtomicInt>
#include <QString>
#include <QStringList>
#include <QThreadPool>

#include "include/errors.hpp"

class AttendanceReconciler;
class IBlobIntake;

// 즉시 응답용 접수 정보 (결과는 포함하지 않음)
struct JobAck {
	QString sessionKey;
	int rosterCount = 0;
	int imageCount = 0;
};

struct SubmitOutcome {
	PipelineError error;
	JobAck ack;

	bool ok() const { return !error.isError(); }
};

// 출석 계산을 요청 흐름에서 떼어 전용 풀에서 실행한다.
// 완료/실패는 attendance_marks 상태와 로그로만 확인 가능
class BackgroundJobRunner {
public:
	struct Params {
		int maxConcurrentJobs = 2;
		int downloadTimeoutMs = 20000;
	};

	BackgroundJobRunner(AttendanceReconciler& reconciler, const IBlobIntake& intake,
						QThreadPool* intakePool, const Params& params);
	~BackgroundJobRunner();

	SubmitOutcome submit(const QString& sessionKey, const QStringList& roster,
						 const QStringList& imageRefs);

	// 종료/테스트용. msecs < 0 이면 무한 대기
	bool waitForIdle(int msecs = -1);
	int activeJobs() const { return active_.loadRelaxed(); }

private:
	AttendanceReconciler& reconciler_;
	const IBlobIntake& intake_;
	QThreadPool* intakePool_;
	Params params_;
	QThreadPool jobPool_;
	QAtomicInt active_{0};

	void runJob(const QString& sessionKey, const QStringList& roster, const QStringList& imageRefs);
};
