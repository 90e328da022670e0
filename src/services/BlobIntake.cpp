#include "services/BlobIntake.hpp"
#include "services/FanOut.hpp"
#include "log/LogCategories.hpp"

#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include <QDebug>

namespace {
BlobFetch failed(const QString& why)
{
	BlobFetch b;
	b.ok = false;
	b.error = why;
	return b;
}
} // namespace

bool BlobIntake::isRemote(const QString& ref)
{
	return ref.startsWith(QLatin1String("http://"), Qt::CaseInsensitive)
		|| ref.startsWith(QLatin1String("https://"), Qt::CaseInsensitive);
}

BlobFetch BlobIntake::fetch(const QString& ref) const
{
	const QString r = ref.trimmed();
	if (r.isEmpty()) return failed(QStringLiteral("empty image reference"));
	return isRemote(r) ? download(r) : readLocal(r);
}

BlobFetch BlobIntake::readLocal(const QString& path) const
{
	const QFileInfo fi(path);
	if (!fi.exists() || !fi.isFile())
		return failed(QStringLiteral("file not found: %1").arg(path));
	if (fi.size() > opt_.maxBytes)
		return failed(QStringLiteral("file too large: %1 (%2 bytes)").arg(path).arg(fi.size()));

	QFile f(path);
	if (!f.open(QIODevice::ReadOnly))
		return failed(QStringLiteral("open failed: %1 (%2)").arg(path, f.errorString()));

	BlobFetch b;
	b.bytes = f.readAll();
	f.close();
	if (b.bytes.isEmpty())
		return failed(QStringLiteral("empty file: %1").arg(path));
	b.ok = true;
	return b;
}

// 호출 스레드에서 로컬 이벤트 루프로 동기 다운로드 (워커 스레드 전용)
BlobFetch BlobIntake::download(const QString& url) const
{
	const QUrl u(url);
	if (!u.isValid())
		return failed(QStringLiteral("invalid url: %1").arg(url));

	QNetworkAccessManager nam;
	QNetworkRequest req(u);
	req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
	req.setTransferTimeout(opt_.timeoutMs);

	QNetworkReply* reply = nam.get(req);
	QEventLoop loop;
	QTimer timer;
	timer.setSingleShot(true);
	QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
	QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
	QObject::connect(reply, &QNetworkReply::downloadProgress, reply,
			[reply, max = opt_.maxBytes](qint64 received, qint64) {
				if (received > max) reply->abort();
			});
	timer.start(opt_.timeoutMs);
	loop.exec();

	BlobFetch b;
	if (!reply->isFinished()) {
		reply->abort();
		b = failed(QStringLiteral("download timed out: %1").arg(url));
	}
	else if (reply->error() != QNetworkReply::NoError) {
		b = failed(QStringLiteral("download failed: %1 (%2)").arg(url, reply->errorString()));
	}
	else {
		b.bytes = reply->readAll();
		if (b.bytes.isEmpty())
			b = failed(QStringLiteral("empty download: %1").arg(url));
		else if (b.bytes.size() > opt_.maxBytes)
			b = failed(QStringLiteral("download too large: %1").arg(url));
		else
			b.ok = true;
	}
	reply->deleteLater();

	if (b.ok) qCDebug(lcIntake) << "[BlobIntake] downloaded" << url << b.bytes.size() << "bytes";
	else      qCWarning(lcIntake) << "[BlobIntake]" << b.error;
	return b;
}

std::vector<BlobFetch> BlobIntake::fetchAll(const IBlobIntake& intake, const QStringList& refs,
											QThreadPool* pool, int perCallTimeoutMs)
{
	std::vector<std::function<BlobFetch()>> tasks;
	tasks.reserve(refs.size());
	for (const QString& ref : refs) {
		const IBlobIntake* src = &intake;
		tasks.push_back([src, ref]() { return src->fetch(ref); });
	}

	return FanOut::run<BlobFetch>(pool, std::move(tasks), perCallTimeoutMs,
			[](const QString& why) { return failed(QStringLiteral("intake: %1").arg(why)); });
}
