#include <gtest/gtest.h>
#include <QAtomicInt>
#include <QElapsedTimer>
#include <QThread>
#include <QThreadPool>
#include <stdexcept>

#include "services/FanOut.hpp"

namespace {
QString failTag(const QString& why) { return QStringLiteral("fail:") + why; }
}

TEST(FanOut, KeepsInputOrder)
{
	QThreadPool pool;
	pool.setMaxThreadCount(4);

	std::vector<std::function<QString()>> tasks;
	for (int i = 0; i < 8; ++i) {
		tasks.push_back([i]() {
			QThread::msleep(static_cast<unsigned long>((8 - i) * 5));
			return QString::number(i);
		});
	}
	const auto out = FanOut::run<QString>(&pool, std::move(tasks), 2000, failTag);

	ASSERT_EQ(out.size(), 8u);
	for (int i = 0; i < 8; ++i) EXPECT_EQ(out[i], QString::number(i));
	pool.waitForDone();
}

TEST(FanOut, ThrowingTaskBecomesFailureValue)
{
	QThreadPool pool;
	std::vector<std::function<QString()>> tasks;
	tasks.push_back([]() { return QStringLiteral("ok"); });
	tasks.push_back([]() -> QString { throw std::runtime_error("boom"); });

	const auto out = FanOut::run<QString>(&pool, std::move(tasks), 2000, failTag);
	EXPECT_EQ(out[0], "ok");
	EXPECT_EQ(out[1], "fail:boom");
	pool.waitForDone();
}

TEST(FanOut, SlowTaskTimesOut)
{
	QThreadPool pool;
	pool.setMaxThreadCount(2);
	std::vector<std::function<QString()>> tasks;
	tasks.push_back([]() { return QStringLiteral("fast"); });
	tasks.push_back([]() { QThread::msleep(1500); return QStringLiteral("slow"); });

	const auto out = FanOut::run<QString>(&pool, std::move(tasks), 100, failTag);
	EXPECT_EQ(out[0], "fast");
	EXPECT_EQ(out[1], "fail:timed out");
	pool.waitForDone();
}

TEST(FanOut, DeadlineStartsWhenTaskStarts)
{
	// 스레드 2개를 다른 배치가 300ms 점유. 뒤 배치는 대기열에서 기다린 시간을 데드라인에 넣지 않는다
	QThreadPool pool;
	pool.setMaxThreadCount(2);

	std::vector<QString> first;
	QThread* other = QThread::create([&pool, &first]() {
		std::vector<std::function<QString()>> tasks;
		for (int i = 0; i < 2; ++i)
			tasks.push_back([]() { QThread::msleep(300); return QStringLiteral("first"); });
		first = FanOut::run<QString>(&pool, std::move(tasks), 500, failTag);
	});
	other->start();

	QElapsedTimer waited;
	waited.start();
	while (pool.activeThreadCount() < 2 && waited.elapsed() < 2000) QThread::msleep(5);
	ASSERT_EQ(pool.activeThreadCount(), 2);

	std::vector<std::function<QString()>> tasks;
	for (int i = 0; i < 2; ++i)
		tasks.push_back([]() { QThread::msleep(300); return QStringLiteral("second"); });
	const auto second = FanOut::run<QString>(&pool, std::move(tasks), 500, failTag);

	ASSERT_TRUE(other->wait(5000));
	delete other;
	pool.waitForDone();

	ASSERT_EQ(first.size(), 2u);
	EXPECT_EQ(first[0], "first");
	EXPECT_EQ(first[1], "first");
	ASSERT_EQ(second.size(), 2u);
	EXPECT_EQ(second[0], "second");
	EXPECT_EQ(second[1], "second");
}

TEST(FanOut, QueuedTaskGivesUpWhenPoolStaysBusy)
{
	QThreadPool pool;
	pool.setMaxThreadCount(1);
	pool.start([]() { QThread::msleep(800); });

	QAtomicInt ran{0};
	std::vector<std::function<QString()>> tasks;
	tasks.push_back([&ran]() { ran.fetchAndAddRelaxed(1); return QStringLiteral("late"); });

	const auto out = FanOut::run<QString>(&pool, std::move(tasks), 100, failTag, 200);
	ASSERT_EQ(out.size(), 1u);
	EXPECT_EQ(out[0], "fail:not started (pool busy)");

	// 포기한 작업은 나중에 스레드가 비어도 실행되지 않는다
	pool.waitForDone();
	EXPECT_EQ(ran.loadRelaxed(), 0);
}

TEST(FanOut, EmptyBatch)
{
	QThreadPool pool;
	EXPECT_TRUE(FanOut::run<QString>(&pool, {}, 100, failTag).empty());
}
