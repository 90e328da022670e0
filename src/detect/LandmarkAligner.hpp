#pragma once
#include <array>
#include <opencv2/core.hpp>

// 5점 랜드마크 -> ArcFace 112x112 템플릿 정렬
class LandmarkAligner {
	public:
		// lmk 순서: [LE, RE, Nose, LM, RM] (YuNet 출력과 동일). 실패 시 빈 Mat
		static cv::Mat align(const cv::Mat& srcBgr,
							 const std::array<cv::Point2f,5>& lmk,
							 int outSize = 112);

	private:
		static const std::array<cv::Point2f,5> kTemplate112;
};
