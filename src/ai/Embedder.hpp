#pragma once
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <QString>
#include <vector>
#include <mutex>

// ONNX 얼굴 임베딩 네트워크 (SFace/MobileFaceNet 계열, 정렬된 112x112 입력)
class Embedder {
public:
		struct Options {
				QString modelPath;
				int inputSize = 112;		// 112x112 입력
				bool useRGB = true;			// 모델이 RGB 입력 모델
		};

		explicit Embedder(const Options& opt);
		bool isReady() const;

		// 정렬된 BGR 얼굴에서 L2 정규화된 임베딩 추출 (flip TTA 평균)
		bool extract(const cv::Mat& alignedBgr, std::vector<float>& out) const;

		// 로드 직후 더미 추론으로 정해진다. 로드 실패면 0
		int dimension() const { return dim_; }

private:
		Options opt_;
		mutable std::mutex mtx_;
		mutable cv::dnn::Net net_;
		bool ready_ = false;
		int dim_ = 0;

		cv::Mat preprocess(const cv::Mat& src) const;
		cv::Mat forwardOnce(const cv::Mat& bgr) const;
		static void l2normalize(cv::Mat& row);
};
