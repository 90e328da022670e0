#pragma once
#include <QDir>
#include <QFileInfo>
#include <QString>
#include <QThread>
#include <QCryptographicHash>

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("attendance"); }

	// DB 파일 디렉토리 보장 후 절대경로 반환
    inline QString prepareDbFile(const QString& path)
    {
        const QFileInfo fi(path);
        QDir().mkpath(fi.absolutePath());
        return fi.absoluteFilePath();
    }

	// 같은 스레드라도 DB 파일이 다르면 다른 커넥션
    inline QString connectionNameForCurrentThread(const QString& dbPath)
    {
        const QByteArray h = QCryptographicHash::hash(dbPath.toUtf8(), QCryptographicHash::Md5).toHex().left(8);
        return QString("%1_%2_%3").arg(baseConnName())
                                  .arg(QString::fromLatin1(h))
							      .arg(static_cast<qulonglong>(reinterpret_cast<quintptr>(QThread::currentThreadId())));
    }

	// SQLITE_CONSTRAINT(19), SQLITE_CONSTRAINT_UNIQUE(2067), SQLITE_CONSTRAINT_PRIMARYKEY(1555)
	inline bool isUniqueViolation(const QString& nativeCode)
	{
		return nativeCode == "19" || nativeCode == "2067" || nativeCode == "1555";
	}
} // namespace SqlCommon
