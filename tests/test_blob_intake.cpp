#include <gtest/gtest.h>
#include <QFile>
#include <QTemporaryDir>
#include <QThreadPool>

#include "services/BlobIntake.hpp"
#include "FakeCollaborators.hpp"

namespace {
QString writeFile(const QTemporaryDir& dir, const QString& name, const QByteArray& data)
{
	const QString path = dir.filePath(name);
	QFile f(path);
	if (f.open(QIODevice::WriteOnly)) {
		f.write(data);
		f.close();
	}
	return path;
}
} // namespace

TEST(BlobIntake, DetectsRemoteRefs)
{
	EXPECT_TRUE(BlobIntake::isRemote("http://example.com/a.jpg"));
	EXPECT_TRUE(BlobIntake::isRemote("HTTPS://example.com/a.jpg"));
	EXPECT_FALSE(BlobIntake::isRemote("/tmp/a.jpg"));
	EXPECT_FALSE(BlobIntake::isRemote("ftp://example.com/a.jpg"));
}

TEST(BlobIntake, ReadsLocalFile)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	const QString path = writeFile(dir, "a.jpg", "JPEGDATA");

	BlobIntake intake(BlobIntake::Options{});
	const BlobFetch b = intake.fetch(path);
	ASSERT_TRUE(b.ok) << b.error.toStdString();
	EXPECT_EQ(b.bytes, QByteArray("JPEGDATA"));
}

TEST(BlobIntake, RejectsMissingEmptyAndOversizedFiles)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	const QString empty = writeFile(dir, "empty.jpg", QByteArray());
	const QString big = writeFile(dir, "big.jpg", QByteArray(64, 'x'));

	BlobIntake::Options opt;
	opt.maxBytes = 16;
	BlobIntake intake(opt);

	EXPECT_FALSE(intake.fetch(dir.filePath("missing.jpg")).ok);
	EXPECT_FALSE(intake.fetch(empty).ok);
	EXPECT_FALSE(intake.fetch(big).ok);
	EXPECT_FALSE(intake.fetch("   ").ok);
}

TEST(BlobIntake, FetchAllPreservesOrderAndFailures)
{
	testing_fakes::FakeIntake fake;
	fake.add("one", "1");
	fake.add("three", "3");

	QThreadPool pool;
	const auto out = BlobIntake::fetchAll(fake, {"one", "two", "three"}, &pool, 1000);
	ASSERT_EQ(out.size(), 3u);
	EXPECT_TRUE(out[0].ok);
	EXPECT_EQ(out[0].bytes, QByteArray("1"));
	EXPECT_FALSE(out[1].ok);
	EXPECT_FALSE(out[1].error.isEmpty());
	EXPECT_TRUE(out[2].ok);
	EXPECT_EQ(out[2].bytes, QByteArray("3"));
	pool.waitForDone();
}
