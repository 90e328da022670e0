#pragma once
#include <vector>
#include <QByteArray>
#include <QString>
#include "include/types.hpp"

enum class ExtractMode {
	BestFace,		// 등록: 대표 얼굴 1개 (검출 총수는 별도 보고)
	AllFaces		// 출석: 검출된 얼굴 전부
};

struct ExtractResult {
	bool ok = false;					// false: 디코드/추론 실패 (얼굴 0개와 구분)
	QString error;
	std::vector<DetectedFace> faces;
	int detectedCount = 0;				// 모드와 무관한 검출 총수

	static ExtractResult failure(const QString& why)
	{
		ExtractResult r;
		r.ok = false;
		r.error = why;
		return r;
	}
};

// 얼굴 검출 + 임베딩 추출기. extract()는 여러 스레드에서 동시에 불릴 수 있다
class IEmbeddingExtractor {
public:
	virtual ~IEmbeddingExtractor() = default;

	virtual bool isReady() const = 0;
	// 임베딩 차원 (모르면 0)
	virtual size_t dimension() const = 0;
	virtual ExtractResult extract(const QByteArray& imageBytes, ExtractMode mode) const = 0;
};
