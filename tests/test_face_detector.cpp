#include <gtest/gtest.h>
#include <vector>

#include "detect/FaceDetector.hpp"

namespace {

FaceDet box(int x, int y, int w, int h)
{
	FaceDet d;
	d.box = cv::Rect(x, y, w, h);
	d.score = 0.9f;
	return d;
}

const cv::Size kFrame(640, 480);

} // namespace

TEST(FaceDetectorPickBest, EmptyListHasNoBest)
{
	EXPECT_EQ(FaceDetector::pickBest({}, kFrame), nullptr);
}

TEST(FaceDetectorPickBest, CentredFaceBeatsSlightlyLargerCornerFace)
{
	// 중앙 100x100 (10000) vs 구석 104x104 (10816 x 0.857)
	const std::vector<FaceDet> faces = {box(0, 0, 104, 104), box(270, 190, 100, 100)};
	const FaceDet* best = FaceDetector::pickBest(faces, kFrame);
	ASSERT_NE(best, nullptr);
	EXPECT_EQ(best, &faces[1]);
}

TEST(FaceDetectorPickBest, MuchLargerFaceWinsOffCentre)
{
	const std::vector<FaceDet> faces = {box(290, 210, 60, 60), box(0, 0, 200, 200)};
	const FaceDet* best = FaceDetector::pickBest(faces, kFrame);
	ASSERT_NE(best, nullptr);
	EXPECT_EQ(best->box, cv::Rect(0, 0, 200, 200));
}

TEST(FaceDetectorPickBest, SingleFaceIsReturned)
{
	const std::vector<FaceDet> faces = {box(10, 10, 20, 20)};
	EXPECT_EQ(FaceDetector::pickBest(faces, kFrame), &faces[0]);
}
