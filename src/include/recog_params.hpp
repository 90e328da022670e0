#pragma once

namespace recog {
	inline constexpr int	ENROLL_IMAGES		= 3;		// 등록 사진 수
	inline constexpr double MATCH_THR			= 0.6;		// Euclidean 거리 임계
	inline constexpr float	DETECT_THR			= 0.6f;		// YuNet score
	inline constexpr float	NMS_THR				= 0.3f;
	inline constexpr int	DETECT_TOP_K		= 500;
	inline constexpr int	DETECT_MAX_WIDTH	= 512;
	inline constexpr int	ALIGNED_SIZE		= 112;
	inline constexpr int	EXTRACT_TIMEOUT_MS	= 30000;
	inline constexpr int	DOWNLOAD_TIMEOUT_MS	= 20000;
	inline constexpr int	MAX_IMAGE_BYTES		= 10 * 1024 * 1024;
	inline constexpr int	EXTRACT_THREADS		= 4;
	inline constexpr int	JOB_THREADS			= 2;
}
