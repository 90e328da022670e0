#pragma once
#include <QString>
#include <QStringList>

// 프로세스 설정. 환경변수 -> 기본값 순서로 채운다
struct AppConfig {
	double	matchThreshold		= 0.6;
	QString dbPath;
	QString detectorModel;
	QString recognizerModel;
	bool	requireSingleFace	= false;		// 등록 사진당 얼굴 1개만 허용
	int		extractTimeoutMs	= 30000;
	int		downloadTimeoutMs	= 20000;
	int		maxImageBytes		= 10 * 1024 * 1024;
	int		detectMaxWidth		= 512;
	int		extractThreads		= 4;
	int		jobThreads			= 2;

	static AppConfig defaults();
	static AppConfig fromEnvironment();

	// 잘못된 값이 있으면 false, 사유는 errors에
	bool validate(QStringList* errors = nullptr) const;
	QString summary() const;
};
