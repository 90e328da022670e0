#include <gtest/gtest.h>
#include <QThreadPool>

#include "services/EnrollmentValidator.hpp"
#include "FakeCollaborators.hpp"

using namespace testing_fakes;

namespace {

class EnrollmentValidatorTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		pool.setMaxThreadCount(3);
		// 같은 사람 3장 (쌍별 거리 <= 0.2)
		extractor.add("kim-1", {vec(0.0f)});
		extractor.add("kim-2", {vec(0.1f)});
		extractor.add("kim-3", {vec(0.2f)});
		// 다른 사람 (kim-1 과 0.75)
		extractor.add("lee-1", {vec(0.75f)});
		extractor.add("blank", {});
		extractor.add("group", {vec(0.05f), vec(3.0f)});
	}

	void TearDown() override { pool.waitForDone(); }

	EnrollRequest request(std::vector<QByteArray> images)
	{
		EnrollRequest r;
		r.identityKey = "S100";
		r.externalKey = "app-100";
		r.displayName = "Kim";
		r.images = std::move(images);
		return r;
	}

	EnrollmentValidator validator(bool singleFace = false)
	{
		EnrollmentValidator::Params p;
		p.matchThreshold = 0.6f;
		p.requireSingleFace = singleFace;
		p.extractTimeoutMs = 5000;
		return EnrollmentValidator(extractor, store, &pool, p);
	}

	QThreadPool pool;
	FakeExtractor extractor;
	FakeStore store;
};

} // namespace

TEST_F(EnrollmentValidatorTest, EnrollsConsistentPhotos)
{
	auto v = validator();
	const EnrollOutcome r = v.validateAndBuild(request({"kim-1", "kim-2", "kim-3"}));

	ASSERT_TRUE(r.ok()) << r.error.toString().toStdString();
	EXPECT_EQ(r.enrolled.identity.identityKey, "S100");
	ASSERT_EQ(r.enrolled.embeddings.size(), 3u);
	EXPECT_NEAR(r.maxPairDistance, 0.2f, 1e-5);

	ASSERT_EQ(store.identities.size(), 1u);
	ASSERT_EQ(store.embeddings.size(), 3u);
	EXPECT_EQ(store.embeddings[0].identityKey, "S100");
	EXPECT_EQ(store.embeddings[2].sourceRef, "upload:app-100/3");
}

TEST_F(EnrollmentValidatorTest, KeepsGivenSourceRefs)
{
	auto v = validator();
	EnrollRequest req = request({"kim-1", "kim-2", "kim-3"});
	req.sourceRefs = QStringList{"/a.jpg", "/b.jpg", "/c.jpg"};
	ASSERT_TRUE(v.validateAndBuild(req).ok());
	EXPECT_EQ(store.embeddings[1].sourceRef, "/b.jpg");
}

TEST_F(EnrollmentValidatorTest, WrongImageCountIsInputError)
{
	auto v = validator();
	const EnrollOutcome r = v.validateAndBuild(request({"kim-1", "kim-2"}));
	EXPECT_EQ(r.error.kind, ErrorKind::Input);
	EXPECT_EQ(extractor.calls.loadRelaxed(), 0);
	EXPECT_EQ(store.createCalls, 0);
}

TEST_F(EnrollmentValidatorTest, MissingKeysAreInputErrors)
{
	auto v = validator();
	EnrollRequest req = request({"kim-1", "kim-2", "kim-3"});
	req.externalKey = "   ";
	EXPECT_EQ(v.validateAndBuild(req).error.kind, ErrorKind::Input);

	req = request({"kim-1", "kim-2", "kim-3"});
	req.identityKey.clear();
	EXPECT_EQ(v.validateAndBuild(req).error.kind, ErrorKind::Input);

	req = request({"kim-1", QByteArray(), "kim-3"});
	const EnrollOutcome r = v.validateAndBuild(req);
	EXPECT_EQ(r.error.kind, ErrorKind::Input);
	EXPECT_EQ(r.error.imageIndex, 1);
}

TEST_F(EnrollmentValidatorTest, NoFaceNamesTheImage)
{
	auto v = validator();
	const EnrollOutcome r = v.validateAndBuild(request({"kim-1", "blank", "kim-3"}));
	EXPECT_EQ(r.error.kind, ErrorKind::Validation);
	EXPECT_EQ(r.error.imageIndex, 1);
	EXPECT_TRUE(r.error.message.contains("no face"));
	EXPECT_EQ(store.createCalls, 0);
}

TEST_F(EnrollmentValidatorTest, UndecodableImageIsValidationError)
{
	auto v = validator();
	const EnrollOutcome r = v.validateAndBuild(request({"kim-1", "kim-2", "corrupt"}));
	EXPECT_EQ(r.error.kind, ErrorKind::Validation);
	EXPECT_EQ(r.error.imageIndex, 2);
	EXPECT_TRUE(store.identities.empty());
}

TEST_F(EnrollmentValidatorTest, DifferentPeopleAreRejected)
{
	auto v = validator();
	const EnrollOutcome r = v.validateAndBuild(request({"kim-1", "kim-2", "lee-1"}));
	EXPECT_EQ(r.error.kind, ErrorKind::Validation);
	EXPECT_TRUE(r.error.message.contains("same person"));
	EXPECT_EQ(r.error.imageIndex, 2);
	EXPECT_NEAR(r.maxPairDistance, 0.75f, 1e-5);
	EXPECT_EQ(store.createCalls, 0);
	EXPECT_TRUE(store.embeddings.empty());
}

TEST_F(EnrollmentValidatorTest, GroupPhotoUsesBestFaceUnlessStrict)
{
	auto lenient = validator(false);
	EXPECT_TRUE(lenient.validateAndBuild(request({"kim-1", "group", "kim-3"})).ok());

	FakeStore other;
	EnrollmentValidator::Params p;
	p.requireSingleFace = true;
	EnrollmentValidator strict(extractor, other, &pool, p);
	const EnrollOutcome r = strict.validateAndBuild(request({"kim-1", "group", "kim-3"}));
	EXPECT_EQ(r.error.kind, ErrorKind::Validation);
	EXPECT_TRUE(r.error.message.contains("multiple faces"));
	EXPECT_EQ(r.error.imageIndex, 1);
	EXPECT_EQ(other.createCalls, 0);
}

TEST_F(EnrollmentValidatorTest, ResubmissionIsConflict)
{
	auto v = validator();
	ASSERT_TRUE(v.validateAndBuild(request({"kim-1", "kim-2", "kim-3"})).ok());

	const int callsBefore = extractor.calls.loadRelaxed();
	const EnrollOutcome r = v.validateAndBuild(request({"kim-1", "kim-2", "kim-3"}));
	EXPECT_EQ(r.error.kind, ErrorKind::Conflict);
	EXPECT_EQ(extractor.calls.loadRelaxed(), callsBefore);
	EXPECT_EQ(store.identities.size(), 1u);
}

TEST_F(EnrollmentValidatorTest, StoreLevelConflictAndFailure)
{
	auto v = validator();
	store.conflictOnCreate = true;
	EXPECT_EQ(v.validateAndBuild(request({"kim-1", "kim-2", "kim-3"})).error.kind, ErrorKind::Conflict);

	store.conflictOnCreate = false;
	store.failCreate = true;
	EXPECT_EQ(v.validateAndBuild(request({"kim-1", "kim-2", "kim-3"})).error.kind, ErrorKind::Store);

	store.failCreate = false;
	store.failExists = true;
	EXPECT_EQ(v.validateAndBuild(request({"kim-1", "kim-2", "kim-3"})).error.kind, ErrorKind::Store);
}

TEST_F(EnrollmentValidatorTest, NotReadyExtractor)
{
	extractor.ready = false;
	auto v = validator();
	EXPECT_EQ(v.validateAndBuild(request({"kim-1", "kim-2", "kim-3"})).error.kind, ErrorKind::NotReady);
}
