#pragma once
#include <QThreadPool>
#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include <QDeadlineTimer>
#include <QElapsedTimer>
#include <QString>
#include <QDebug>

#include <exception>
#include <functional>
#include <memory>
#include <vector>

// 독립 작업 N개를 풀에 뿌리고 모두 끝나거나 데드라인이 지날 때까지 기다린다.
// 각 작업은 자기 슬롯에만 쓴다. 데드라인은 작업이 실제로 시작한 시점부터 잰다
// (풀을 다른 배치와 나눠 쓰므로). 데드라인 뒤에 끝난 결과는 버린다.
// 작업은 호출자 스택을 참조로 잡으면 안 된다 (타임아웃 후에도 실행될 수 있음)
namespace FanOut {

// 시작도 못 한 작업을 기다리는 최대 시간 = 작업당 데드라인 x 이 값
constexpr int kQueueWaitFactor = 8;

template <typename T>
struct Batch {
	QMutex mtx;
	QWaitCondition cv;
	QElapsedTimer clock;
	std::vector<T> results;
	std::vector<qint64> startedAt;		// clock 기준 ms, -1 이면 아직 대기열
	std::vector<bool> done;
	int remaining = 0;
	bool abandoned = false;
};

template <typename T>
std::vector<T> run(QThreadPool* pool,
				   std::vector<std::function<T()>> tasks,
				   int perCallTimeoutMs,
				   const std::function<T(const QString& why)>& onFailure,
				   int queueTimeoutMs = -1)
{
	const int n = static_cast<int>(tasks.size());
	if (n == 0) return {};
	if (queueTimeoutMs < 0) queueTimeoutMs = perCallTimeoutMs * kQueueWaitFactor;

	auto batch = std::make_shared<Batch<T>>();
	batch->results.resize(n);
	batch->startedAt.assign(n, -1);
	batch->done.assign(n, false);
	batch->remaining = n;
	batch->clock.start();

	for (int i = 0; i < n; ++i) {
		auto task = std::move(tasks[i]);
		auto fail = onFailure;
		pool->start([batch, task = std::move(task), fail = std::move(fail), i]() {
			{
				QMutexLocker lk(&batch->mtx);
				if (batch->abandoned || batch->done[i]) return;
				batch->startedAt[i] = batch->clock.elapsed();
				batch->cv.wakeAll();		// 대기 측이 이 슬롯 데드라인을 다시 계산
			}

			T value;
			try {
				value = task();
			} catch (const std::exception& e) {
				qWarning() << "[FanOut] task" << i << "threw:" << e.what();
				value = fail(QString::fromUtf8(e.what()));
			}

			QMutexLocker lk(&batch->mtx);
			if (batch->abandoned || batch->done[i]) return;
			batch->results[i] = std::move(value);
			batch->done[i] = true;
			--batch->remaining;
			batch->cv.wakeAll();
		});
	}

	int timedOut = 0;
	int notStarted = 0;
	QMutexLocker lk(&batch->mtx);
	while (batch->remaining > 0) {
		const qint64 now = batch->clock.elapsed();
		qint64 nextDue = -1;
		for (int i = 0; i < n; ++i) {
			if (batch->done[i]) continue;
			const bool started = batch->startedAt[i] >= 0;
			const qint64 due = started ? batch->startedAt[i] + perCallTimeoutMs : qint64(queueTimeoutMs);
			if (now >= due) {
				batch->results[i] = onFailure(started ? QStringLiteral("timed out")
													  : QStringLiteral("not started (pool busy)"));
				batch->done[i] = true;
				--batch->remaining;
				++(started ? timedOut : notStarted);
				continue;
			}
			if (nextDue < 0 || due < nextDue) nextDue = due;
		}
		if (batch->remaining == 0) break;
		batch->cv.wait(&batch->mtx, QDeadlineTimer(nextDue - now, Qt::PreciseTimer));
	}
	// 대기열에 남은 작업은 시작하지 않고 빠진다
	batch->abandoned = true;

	if (timedOut || notStarted) {
		qWarning() << "[FanOut]" << timedOut << "timed out," << notStarted << "never started, of" << n << "tasks";
	}
	return std::move(batch->results);
}

} // namespace FanOut
