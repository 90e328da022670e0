#pragma once
#include <vector>
#include <array>
#include <QString>
#include <QByteArray>
#include <QDateTime>
#include <opencv2/core.hpp>

// 얼굴 임베딩 (모델이 정한 차원, 보통 128)
using FaceEmbedding = std::vector<float>;

struct FaceDet {
	cv::Rect box;
	std::array<cv::Point2f, 5> lmk;				// leftEye, right Eye, nose, mouthL, mouthR
	float score = 0.0f;
};

// 추출기가 돌려주는 얼굴 1개
struct DetectedFace {
	FaceEmbedding	embedding;
	cv::Rect		box;
	std::array<cv::Point2f, 5> lmk;
	float			score = 0.0f;
};

// 등록된 사용자
struct Identity {
	QString identityKey;			// 출석 명단에서 쓰는 키 (unique)
	QString externalKey;			// 앱 쪽 키 (unique)
	QString displayName;
};

// 사용자당 정확히 3개, 등록 시점에 한 번만 기록된다
struct StoredEmbedding {
	QString			identityKey;
	FaceEmbedding	vector;
	QString			sourceRef;		// 원본 이미지 경로/URL
};

// DB에서 읽은 그대로의 descriptor 행 (파싱 전)
struct DescriptorRow {
	QString identityKey;
	QString descriptor;
};

enum class AttendanceStatus { Absent = 0, Present };

inline QString toString(AttendanceStatus s)
{
	return s == AttendanceStatus::Present ? QStringLiteral("Present") : QStringLiteral("Absent");
}

struct AttendanceMark {
	QString				identityKey;
	QString				sessionKey;
	AttendanceStatus	status = AttendanceStatus::Absent;
	QString				displayName;		// 조회 시에만 채움
	QDateTime			updatedAt;
};

// 출석 계산용 입력 이미지 (영속화하지 않음)
struct ProbeImage {
	QString		ref;				// 로그용 출처
	QByteArray	bytes;
	QString		intakeError;		// 다운로드/읽기 실패 시 사유
};

// 매칭 결과
struct MatchResult {
	QString identityKey;			// 비어 있으면 unknown
	float	distance = -1.0f;
	QString runnerUpKey;
	float	runnerUpDistance = -1.0f;

	bool known() const { return !identityKey.isEmpty(); }
};
