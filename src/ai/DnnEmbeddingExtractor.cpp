#include "ai/DnnEmbeddingExtractor.hpp"
#include "detect/LandmarkAligner.hpp"
#include "include/recog_params.hpp"
#include "log/LogCategories.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <QFileInfo>
#include <QDebug>
#include <algorithm>
#include <vector>

DnnEmbeddingExtractor::DnnEmbeddingExtractor(const Options& opt) : opt_(opt)
{
	const QFileInfo det(opt_.detectorModel);
	if (!det.exists() || !det.isReadable()) {
		qCCritical(lcExtract) << "[Extractor] detector model not readable:" << opt_.detectorModel;
	}
	else {
		detector_.init(opt_.detectorModel.toStdString(), 320, 240,
					   opt_.scoreThr, opt_.nmsThr, opt_.topK);
	}

	Embedder::Options eo;
	eo.modelPath	= opt_.recognizerModel;
	eo.inputSize	= recog::ALIGNED_SIZE;
	eo.useRGB		= true;
	embedder_ = std::make_unique<Embedder>(eo);

	if (!isReady()) {
		qCCritical(lcExtract) << "[Extractor] not ready detector=" << detector_.isReady()
							  << "embedder=" << embedder_->isReady();
	}
}

bool DnnEmbeddingExtractor::isReady() const
{
	return detector_.isReady() && embedder_ && embedder_->isReady();
}

size_t DnnEmbeddingExtractor::dimension() const
{
	return embedder_ ? static_cast<size_t>(std::max(embedder_->dimension(), 0)) : 0;
}

cv::Mat DnnEmbeddingExtractor::decode(const QByteArray& bytes) const
{
	if (bytes.isEmpty()) return cv::Mat();

	std::vector<uchar> buf(bytes.begin(), bytes.end());
	cv::Mat img;
	try {
		img = cv::imdecode(buf, cv::IMREAD_COLOR);
	} catch (const cv::Exception& e) {
		qCWarning(lcExtract) << "[Extractor] imdecode threw:" << e.what();
		return cv::Mat();
	}
	if (img.empty()) return img;

	// 큰 사진은 축소 (검출 속도)
	if (opt_.maxWidth > 0 && img.cols > opt_.maxWidth) {
		const double s = double(opt_.maxWidth) / img.cols;
		cv::Mat small;
		cv::resize(img, small, cv::Size(), s, s, cv::INTER_AREA);
		return small;
	}
	return img;
}

bool DnnEmbeddingExtractor::embedFace(const cv::Mat& bgr, const FaceDet& det, DetectedFace* out) const
{
	cv::Mat aligned = LandmarkAligner::align(bgr, det.lmk, recog::ALIGNED_SIZE);
	if (aligned.empty()) {
		qCWarning(lcExtract) << "[Extractor] alignment failed box=" << det.box.x << det.box.y
							 << det.box.width << det.box.height;
		return false;
	}

	FaceEmbedding emb;
	if (!embedder_->extract(aligned, emb) || emb.empty()) return false;

	out->embedding	= std::move(emb);
	out->box		= det.box;
	out->lmk		= det.lmk;
	out->score		= det.score;
	return true;
}

ExtractResult DnnEmbeddingExtractor::extract(const QByteArray& imageBytes, ExtractMode mode) const
{
	if (!isReady()) return ExtractResult::failure(QStringLiteral("extractor not initialized"));

	const cv::Mat bgr = decode(imageBytes);
	if (bgr.empty()) return ExtractResult::failure(QStringLiteral("image could not be decoded"));

	const std::vector<FaceDet> dets = detector_.detectAll(bgr);

	ExtractResult r;
	r.ok = true;
	r.detectedCount = static_cast<int>(dets.size());
	if (dets.empty()) return r;

	try {
		if (mode == ExtractMode::BestFace) {
			const FaceDet* best = FaceDetector::pickBest(dets, bgr.size());
			DetectedFace f;
			if (!embedFace(bgr, *best, &f))
				return ExtractResult::failure(QStringLiteral("embedding failed"));
			r.faces.push_back(std::move(f));
			return r;
		}

		for (const auto& d : dets) {
			DetectedFace f;
			if (!embedFace(bgr, d, &f)) {
				qCWarning(lcExtract) << "[Extractor] face skipped (embedding failed)";
				continue;
			}
			r.faces.push_back(std::move(f));
		}
	} catch (const cv::Exception& e) {
		return ExtractResult::failure(QStringLiteral("opencv error: %1").arg(QString::fromUtf8(e.what())));
	}

	qCDebug(lcExtract) << "[Extractor] detected=" << r.detectedCount << "embedded=" << r.faces.size();
	return r;
}
