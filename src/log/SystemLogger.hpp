#pragma once
#include <QObject>
#include <QThread>

#include "SystemLogTypes.hpp"

namespace syslog_detail { class SystemLogWriter; }

// system_logs 테이블에 비동기로 기록하는 운영 로그.
// init() 전에 호출된 로그는 버려진다 (qDebug 출력은 호출측 책임)
class SystemLogger final : public QObject {
    Q_OBJECT
public:
    static SystemLogger& instance();
    static void init(const QString& dbPath);      // 앱 시작시 1회
    // 이미 큐에 들어간 항목은 모두 기록한 뒤 멈춘다
    static void shutdown();

    // 어디서든 한 줄로 호출
    static void info (const QString& tag, const QString& msg, const QString& extra = {});
    static void warn (const QString& tag, const QString& msg, const QString& extra = {});
    static void error(const QString& tag, const QString& msg, const QString& extra = {});
    static void critical(const QString& tag, const QString& msg, const QString& extra = {});

signals:
    void appendRequested(const SystemLogEntry& e); // 워커에게 보냄

private:
	QThread* th = nullptr;
	syslog_detail::SystemLogWriter* wr = nullptr;

    explicit SystemLogger(QObject* parent=nullptr);
    ~SystemLogger() override;

    static void post(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra);
};
