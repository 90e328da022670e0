#pragma once
#include <QString>
#include <QDateTime>
#include <QMetaType>

enum class SysLogLevel { Debug=0, Info=1, Warn=2, Error=3, Critical=4 };

struct SystemLogEntry {
    SysLogLevel level = SysLogLevel::Info;
    QString tag;        // 예: "ENROLL", "ATTEND", "JOB", "APP"
    QString message;
    QDateTime ts;
    QString extra;      // 세션키, 카운트 등 부가 정보
};

// system_logs 조회 결과
struct SystemLog {
    int id{};
    int level{};        // 0~4
    QString tag;
    QString message;
    QDateTime timestamp;
    QString extra;
};

Q_DECLARE_METATYPE(SystemLogEntry)
