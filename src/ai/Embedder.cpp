#include "Embedder.hpp"
#include "log/LogCategories.hpp"
#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <cstring>
#include <QDebug>

namespace fs = std::filesystem;

Embedder::Embedder(const Options& opt) : opt_(opt)
{
	const std::string path = opt_.modelPath.toStdString();
	if (!fs::exists(path)) {
		qCCritical(lcExtract) << "[Embedder] model file not found:" << opt_.modelPath;
		return;
	}

	try {
		net_ = cv::dnn::readNetFromONNX(path);
		net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
		net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
		ready_ = !net_.empty();
	} catch (const cv::Exception& e) {
		qCCritical(lcExtract) << "[Embedder] readNetFromONNX failed:" << e.what();
		ready_ = false;
	}

	if (!ready_) return;

	// 더미 입력으로 출력 차원 확인 (저장 임베딩 차원 검증용)
	try {
		const cv::Mat blank = cv::Mat::zeros(opt_.inputSize, opt_.inputSize, CV_8UC3);
		const cv::Mat emb = forwardOnce(blank);
		dim_ = emb.cols;
	} catch (const cv::Exception& e) {
		qCCritical(lcExtract) << "[Embedder] warm-up forward failed:" << e.what();
	}
	if (dim_ <= 0) {
		qCCritical(lcExtract) << "[Embedder] model produced no output:" << opt_.modelPath;
		ready_ = false;
		return;
	}

	qCInfo(lcExtract) << "[Embedder] loaded" << opt_.modelPath << "input=" << opt_.inputSize << "dim=" << dim_;
}

bool Embedder::isReady() const { return ready_; }

cv::Mat Embedder::preprocess(const cv::Mat& src) const
{
    if (src.empty() || src.type() != CV_8UC3) {
        qCWarning(lcExtract) << "[preprocess] invalid src type=" << src.type() << "ch=" << src.channels();
        return cv::Mat();
    }

	// SFace 계열: 원값 RGB 입력 (정규화는 그래프 안에서)
	const int S = opt_.inputSize;
    cv::Mat blob = cv::dnn::blobFromImage(src, 1.0, cv::Size(S, S), cv::Scalar(),
                                          /*swapRB=*/opt_.useRGB, /*crop=*/false, CV_32F);

    // NCHW 1x3xSxS 이외는 거부
    if (blob.dims != 4 || blob.size[0] != 1 || blob.size[1] != 3 ||
        blob.size[2] != S || blob.size[3] != S) {
        qCWarning(lcExtract) << "[preprocess] unexpected blob shape";
        return cv::Mat();
    }
    return blob;
}

void Embedder::l2normalize(cv::Mat& row)
{
		double n = cv::norm(row, cv::NORM_L2);
		if (n > 1e-12) row /= static_cast<float>(n);
}

// 호출측이 mtx_ 잡고 있어야 함
cv::Mat Embedder::forwardOnce(const cv::Mat& bgr) const
{
	cv::Mat blob = preprocess(bgr);
	if (blob.empty()) return cv::Mat();

	net_.setInput(blob);
	cv::Mat emb = net_.forward();
	if (emb.empty() || emb.total() == 0) {
		qCCritical(lcExtract) << "[Embedder] forward returned empty output";
		return cv::Mat();
	}

	emb = emb.reshape(1, 1).clone();
	if (emb.type() != CV_32F) emb.convertTo(emb, CV_32F);
	return emb;
}

bool Embedder::extract(const cv::Mat& alignedBgr, std::vector<float>& out) const
{
    if (!ready_) return false;
    std::lock_guard<std::mutex> lk(mtx_);

    try {
        // 원본 + 좌우반전 두 번 추론
        cv::Mat emb1 = forwardOnce(alignedBgr);
        if (emb1.empty()) return false;

        cv::Mat flipped; cv::flip(alignedBgr, flipped, 1);
        cv::Mat emb2 = forwardOnce(flipped);
        if (emb2.empty()) return false;

        if (emb1.cols != emb2.cols) {
            qCCritical(lcExtract) << "[Embedder] dim mismatch:" << emb1.cols << "vs" << emb2.cols;
            return false;
        }

        // Flip-TTA 평균 후 L2 정규화
        cv::Mat emb = 0.5f * (emb1 + emb2);
        l2normalize(emb);

        out.resize(static_cast<size_t>(emb.cols));
        std::memcpy(out.data(), emb.ptr<float>(0), static_cast<size_t>(emb.cols) * sizeof(float));
        return true;
    }
    catch (const cv::Exception& e) {
        qCCritical(lcExtract) << "[Embedder] cv::Exception" << e.what();
        return false;
    }
}
