#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>  // cv::FaceDetectorYN
#include "include/types.hpp"			// FaceDet

// YuNet 래퍼. detect 계열은 내부 뮤텍스로 직렬화된다
class FaceDetector {
	public:
		FaceDetector() = default;
		~FaceDetector() = default;

		// YuNet 초기화 (modelPath 필수)
		bool init(const std::string& modelPath,
							int inputW = 320, int inputH = 240,
							float scoreThr = 0.6f, float nmsThr = 0.3f, int topK = 500,
							int backend = cv::dnn::DNN_BACKEND_OPENCV,
							int target  = cv::dnn::DNN_TARGET_CPU);

		bool isReady() const { return ready_; }

		// 프레임에서 전체 후보 반환 (원본 좌표계)
		std::vector<FaceDet> detectAll(const cv::Mat& bgr) const;

		// 중앙+큰 얼굴 선호 규칙으로 대표 얼굴 1개 선택
		static const FaceDet* pickBest(const std::vector<FaceDet>& faces, const cv::Size& frame);

	private:
		// YuNet 출력 파서 (score는 14, lmk는 4~13)
		static std::vector<FaceDet> parseYuNet(const cv::Mat& dets, float scoreThresh);

	private:
		bool ready_ = false;
		float scoreThr_ = 0.6f;

		cv::Ptr<cv::FaceDetectorYN> yunet_;		// Yunet 핸들
		mutable std::mutex mtx_;
		mutable cv::Size yunet_InputSize_{0, 0};  // setInputSize cache
};
