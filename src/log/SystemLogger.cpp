#include "SystemLogger.hpp"
#include <QThread>
#include <QMutex>
#include <QDebug>
#include <atomic>
#include "services/QSqliteService.hpp"
#include "log/SystemLogTypes.hpp"

namespace syslog_detail{
class SystemLogWriter : public QObject {
    Q_OBJECT
public:
    explicit SystemLogWriter(const QString& dbPath) : svc(dbPath) {}

public slots:
    void append(const SystemLogEntry& e) {
        const bool ok = svc.insertSystemLog(
            static_cast<int>(e.level),
            e.tag,
            e.message,
            e.ts.isValid() ? e.ts : QDateTime::currentDateTime(),
            e.extra
        );
        if (!ok) {
            qWarning() << "[SystemLogger] drop entry" << e.tag << e.message;
        }
    }

private:
    QSqliteService svc;
};
} // namespace

namespace {
std::atomic<bool> s_running{false};
QMutex s_lifecycleMutex;
}

SystemLogger& SystemLogger::instance() {
    static SystemLogger inst;
    return inst;
}

SystemLogger::SystemLogger(QObject* p) : QObject(p) {}

SystemLogger::~SystemLogger() {}

void SystemLogger::init(const QString& dbPath)
{
    QMutexLocker lk(&s_lifecycleMutex);
    if (s_running.load()) return;

    qRegisterMetaType<SystemLogEntry>("SystemLogEntry");

	auto& inst = instance();
	inst.th = new QThread;
	inst.th->setObjectName(QStringLiteral("SystemLogWriter"));
	inst.wr = new syslog_detail::SystemLogWriter(dbPath);
	inst.wr->moveToThread(inst.th);

    QObject::connect(&inst, &SystemLogger::appendRequested,
                     inst.wr, &syslog_detail::SystemLogWriter::append, Qt::QueuedConnection);
    QObject::connect(inst.th, &QThread::finished, inst.wr, &QObject::deleteLater);
    inst.th->start();
    s_running.store(true);
}

void SystemLogger::shutdown()
{
    QMutexLocker lk(&s_lifecycleMutex);
	auto& inst = instance();
 	if (!inst.th) return;

    s_running.store(false);
    QObject::disconnect(&inst, &SystemLogger::appendRequested, nullptr, nullptr);

    // 큐가 FIFO 라서 빈 호출이 돌아오면 앞선 append 는 모두 처리된 상태
    if (inst.th->isRunning() &&
        !QMetaObject::invokeMethod(inst.wr, [] {}, Qt::BlockingQueuedConnection)) {
        qWarning() << "[SystemLogger] flush failed, pending entries may be lost";
    }
	inst.th->quit();
    if (!inst.th->wait(3000)) {
        qWarning() << "[SystemLogger] writer thread did not stop in time";
        inst.th->terminate();
        inst.th->wait();
    }

    delete inst.th;
    inst.th = nullptr;
	inst.wr = nullptr;
}

void SystemLogger::post(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra)
{
    if (!s_running.load()) return;
    SystemLogEntry e{lv, tag, msg, QDateTime::currentDateTime(), extra};
    emit instance().appendRequested(e);
}

void SystemLogger::info (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Info , tag, msg, extra); }
void SystemLogger::warn (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Warn , tag, msg, extra); }
void SystemLogger::error(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Error, tag, msg, extra); }
void SystemLogger::critical(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Critical, tag, msg, extra); }

#include "SystemLogger.moc"
