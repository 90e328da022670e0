#pragma once
#include <memory>
#include <QString>
#include <opencv2/core.hpp>

#include "ai/EmbeddingExtractor.hpp"
#include "ai/Embedder.hpp"
#include "detect/FaceDetector.hpp"

// YuNet 검출 -> 5점 정렬 -> ONNX 임베딩
class DnnEmbeddingExtractor : public IEmbeddingExtractor {
public:
	struct Options {
		QString detectorModel;
		QString recognizerModel;
		int		maxWidth = 512;			// 이보다 넓으면 축소 후 검출
		float	scoreThr = 0.6f;
		float	nmsThr = 0.3f;
		int		topK = 500;
	};

	explicit DnnEmbeddingExtractor(const Options& opt);

	bool isReady() const override;
	size_t dimension() const override;
	ExtractResult extract(const QByteArray& imageBytes, ExtractMode mode) const override;

private:
	Options opt_;
	FaceDetector detector_;
	std::unique_ptr<Embedder> embedder_;

	cv::Mat decode(const QByteArray& bytes) const;
	bool embedFace(const cv::Mat& bgr, const FaceDet& det, DetectedFace* out) const;
};
