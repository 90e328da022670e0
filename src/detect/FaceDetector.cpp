#include "detect/FaceDetector.hpp"
#include "log/LogCategories.hpp"
#include <QtCore/QDebug>
#include <algorithm>
#include <cmath>


bool FaceDetector::init(const std::string& modelPath,
						int inputW, int inputH,
						float scoreThr, float nmsThr, int topK,
						int backend, int target)
{
	scoreThr_ = scoreThr;

	try {
		yunet_ = cv::FaceDetectorYN::create(
				modelPath, /*config=*/"", cv::Size(inputW, inputH),
				scoreThr, nmsThr, topK, backend, target);
	} catch (const cv::Exception& e) {
		qCWarning(lcExtract) << "[FaceDetector] YuNet create failed:" << e.what();
		ready_ = false;
		return false;
	}

	ready_ = (yunet_ != nullptr);
	yunet_InputSize_ = cv::Size(0,0);			// 첫 프레임에서 갱신
	if (!ready_) {
		qCWarning(lcExtract) << "[FaceDetector] YuNet not ready";
		return false;
	}

	qCInfo(lcExtract) << "[FaceDetector] YuNet init Ok"
					  << "model=" << QString::fromStdString(modelPath)
					  << "thr="   << scoreThr << "/" << nmsThr
					  << "topK="  << topK;
	return true;
}

std::vector<FaceDet> FaceDetector::parseYuNet(const cv::Mat& dets, float scoreThresh)
{
	std::vector<FaceDet> out;
	if (dets.empty() || dets.cols < 15) return out;

	for (int i = 0; i < dets.rows; ++i) {
		const float score = dets.at<float>(i, 14);
		if (score < scoreThresh) continue;

		FaceDet f;
		f.box	= cv::Rect(cv::Point2f(dets.at<float>(i, 0), dets.at<float>(i, 1)),
						   cv::Size(cvRound(dets.at<float>(i, 2)), cvRound(dets.at<float>(i, 3))));
		f.score = score;

		// landmark: [LE, RE, Nose, LM, RM]
		for (int k = 0; k < 5; ++k)
			f.lmk[k] = cv::Point2f(dets.at<float>(i, 4 + 2 * k), dets.at<float>(i, 5 + 2 * k));

		out.push_back(std::move(f));
	}

	return out;
}

std::vector<FaceDet> FaceDetector::detectAll(const cv::Mat& bgr) const
{
	std::vector<FaceDet> out;
	if (!ready_ || bgr.empty()) return out;

	std::lock_guard<std::mutex> lk(mtx_);

	// 입력 크기가 바뀌면 YuNet에도 알려줘야 함
	try {
		const cv::Size cur = bgr.size();
		if (cur != yunet_InputSize_) {
			yunet_->setInputSize(cur);
			yunet_InputSize_ = cur;
		}
	} catch (const cv::Exception& e) {
		qCWarning(lcExtract) << "[FaceDetector] setInputSize failed:" << e.what();
		return out;
	}

	cv::Mat dets;
	try {
		yunet_->detect(bgr, dets);
	} catch (const cv::Exception& e) {
		qCWarning(lcExtract) << "[FaceDetector] detect failed:" << e.what();
		return out;
	}

    out = parseYuNet(dets, scoreThr_);
    qCDebug(lcExtract) << "[FaceDetector] parsed faces=" << (int)out.size();
    return out;
}

const FaceDet* FaceDetector::pickBest(const std::vector<FaceDet>& faces, const cv::Size& frame)
{
	if (faces.empty()) return nullptr;

	// rule: area * (1 - 0.35 * dist_to_center)
	auto rank = [&](const FaceDet& d) {
		const double area = static_cast<double>(d.box.area());
		const cv::Point2f c(d.box.x + d.box.width  * 0.5f,
							d.box.y + d.box.height * 0.5f);
		const cv::Point2f fc(frame.width * 0.5f, frame.height * 0.5f);
		const double dist = cv::norm(c - fc) /
							std::hypot(static_cast<double>(frame.width),
									   static_cast<double>(frame.height));
		return area * (1.0 - 0.35 * dist);
	};

	auto it = std::max_element(faces.begin(), faces.end(),
			[&] (const FaceDet& a, const FaceDet& b) { return rank(a) < rank(b); });
	return &*it;
}
