#pragma once
#include <QString>

enum class ErrorKind {
	None = 0,
	Input,			// 필수값 누락/형식 오류 (재시도 금지)
	Conflict,		// 중복 identity
	Validation,		// 얼굴 없음/여러 얼굴/동일인 아님
	Extraction,		// 출석 계산 중 이미지 1장 실패 (건너뜀)
	Store,			// 영속화 실패
	NotReady		// 런타임 초기화 전 호출
};

inline const char* errorKindName(ErrorKind k)
{
	switch (k) {
		case ErrorKind::None:		return "None";
		case ErrorKind::Input:		return "InputError";
		case ErrorKind::Conflict:	return "ConflictError";
		case ErrorKind::Validation:	return "ValidationError";
		case ErrorKind::Extraction:	return "ExtractionError";
		case ErrorKind::Store:		return "StoreError";
		case ErrorKind::NotReady:	return "NotReady";
	}
	return "Unknown";
}

struct PipelineError {
	ErrorKind	kind = ErrorKind::None;
	QString		message;
	int			imageIndex = -1;		// 0-based, 해당 없으면 -1

	bool isError() const { return kind != ErrorKind::None; }

	QString toString() const
	{
		QString s = QStringLiteral("%1: %2").arg(QString::fromLatin1(errorKindName(kind)), message);
		if (imageIndex >= 0)
			s += QStringLiteral(" (image %1)").arg(imageIndex + 1);
		return s;
	}

	static PipelineError make(ErrorKind k, const QString& msg, int idx = -1)
	{
		PipelineError e;
		e.kind = k;
		e.message = msg;
		e.imageIndex = idx;
		return e;
	}
};
