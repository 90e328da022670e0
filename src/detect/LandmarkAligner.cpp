#include "LandmarkAligner.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/calib3d.hpp>
#include <vector>

const std::array<cv::Point2f, 5> LandmarkAligner::kTemplate112 = {{
	{38.2946f, 51.6963f},			// LE
	{73.5318f, 50.5014f},			// RE
	{56.0252f, 71.7366f},			// Nose
	{41.5493f, 92.3655f},			// LM
	{70.7299f, 92.2041f}			// RM
}};

cv::Mat LandmarkAligner::align(const cv::Mat& srcBgr,
							   const std::array<cv::Point2f,5>& lmk,
							   int outSize)
{
	if (srcBgr.empty() || outSize <= 0) return cv::Mat();

	// 좌우가 뒤집혀 들어온 경우 보정
	std::array<cv::Point2f, 5> s = lmk;
	if (s[0].x > s[1].x) std::swap(s[0], s[1]);
	if (s[3].x > s[4].x) std::swap(s[3], s[4]);

	const float k = static_cast<float>(outSize) / 112.0f;
	std::vector<cv::Point2f> src(s.begin(), s.end());
	std::vector<cv::Point2f> dst;
	dst.reserve(5);
	for (const auto& p : kTemplate112) dst.emplace_back(p.x * k, p.y * k);

	cv::Mat M = cv::estimateAffinePartial2D(src, dst, cv::noArray(), cv::LMEDS);
	if (M.empty()) return cv::Mat();

	cv::Mat aligned;
	cv::warpAffine(srcBgr, aligned, M, cv::Size(outSize, outSize),
				   cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar(127, 127, 127));
	return aligned;
}
