#include <gtest/gtest.h>
#include <QFile>
#include <cmath>

#include "ai/DnnEmbeddingExtractor.hpp"

namespace {

DnnEmbeddingExtractor::Options missingModels()
{
	DnnEmbeddingExtractor::Options o;
	o.detectorModel = QStringLiteral("/nonexistent/face_detection_yunet.onnx");
	o.recognizerModel = QStringLiteral("/nonexistent/face_recognition_sface.onnx");
	return o;
}

double l2(const FaceEmbedding& v)
{
	double s = 0.0;
	for (float x : v) s += double(x) * x;
	return std::sqrt(s);
}

} // namespace

TEST(DnnEmbeddingExtractor, NotReadyWithoutModels)
{
	const DnnEmbeddingExtractor ex(missingModels());
	EXPECT_FALSE(ex.isReady());
	EXPECT_EQ(ex.dimension(), 0u);

	const ExtractResult r = ex.extract(QByteArray("anything"), ExtractMode::AllFaces);
	EXPECT_FALSE(r.ok);
	EXPECT_EQ(r.error, "extractor not initialized");
	EXPECT_TRUE(r.faces.empty());
}

// 실제 모델 + 여러 명이 찍힌 사진이 있을 때만 돈다
// FA_TEST_DETECTOR_MODEL, FA_TEST_RECOGNIZER_MODEL, FA_TEST_GROUP_IMAGE
TEST(DnnEmbeddingExtractor, BestFaceAndAllFacesOnRealModels)
{
	const QString det = qEnvironmentVariable("FA_TEST_DETECTOR_MODEL");
	const QString rec = qEnvironmentVariable("FA_TEST_RECOGNIZER_MODEL");
	const QString img = qEnvironmentVariable("FA_TEST_GROUP_IMAGE");
	if (det.isEmpty() || rec.isEmpty() || img.isEmpty())
		GTEST_SKIP() << "model/image env vars not set";

	DnnEmbeddingExtractor::Options o;
	o.detectorModel = det;
	o.recognizerModel = rec;
	const DnnEmbeddingExtractor ex(o);
	ASSERT_TRUE(ex.isReady());
	ASSERT_GT(ex.dimension(), 0u);

	QFile f(img);
	ASSERT_TRUE(f.open(QIODevice::ReadOnly));
	const QByteArray bytes = f.readAll();

	const ExtractResult all = ex.extract(bytes, ExtractMode::AllFaces);
	ASSERT_TRUE(all.ok) << all.error.toStdString();
	ASSERT_GE(all.detectedCount, 2);
	EXPECT_LE(static_cast<int>(all.faces.size()), all.detectedCount);
	for (const auto& face : all.faces) {
		EXPECT_EQ(face.embedding.size(), ex.dimension());
		EXPECT_NEAR(l2(face.embedding), 1.0, 1e-3);
	}

	// BestFace 는 얼굴 1개만 돌려주지만 검출 총수는 그대로
	const ExtractResult best = ex.extract(bytes, ExtractMode::BestFace);
	ASSERT_TRUE(best.ok);
	EXPECT_EQ(best.faces.size(), 1u);
	EXPECT_EQ(best.detectedCount, all.detectedCount);

	const ExtractResult junk = ex.extract(QByteArray("not an image"), ExtractMode::AllFaces);
	EXPECT_FALSE(junk.ok);
	EXPECT_EQ(junk.error, "image could not be decoded");
}
