#pragma once
#include <vector>
#include <QByteArray>
#include <QString>
#include <QStringList>

class QThreadPool;

struct BlobFetch {
	bool		ok = false;
	QByteArray	bytes;
	QString		error;
};

// 이미지 원본 바이트 공급 (로컬 경로 또는 http/https URL)
class IBlobIntake {
public:
	virtual ~IBlobIntake() = default;
	virtual BlobFetch fetch(const QString& ref) const = 0;
};

class BlobIntake : public IBlobIntake {
public:
	struct Options {
		int timeoutMs = 20000;
		qint64 maxBytes = 10 * 1024 * 1024;
	};

	explicit BlobIntake(const Options& opt) : opt_(opt) {}

	BlobFetch fetch(const QString& ref) const override;

	static bool isRemote(const QString& ref);

	// 병렬 다운로드/읽기, 결과는 입력 순서
	static std::vector<BlobFetch> fetchAll(const IBlobIntake& intake, const QStringList& refs,
										   QThreadPool* pool, int perCallTimeoutMs);

private:
	Options opt_;

	BlobFetch readLocal(const QString& path) const;
	BlobFetch download(const QString& url) const;
};
