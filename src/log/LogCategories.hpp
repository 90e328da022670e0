#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcEnroll)
Q_DECLARE_LOGGING_CATEGORY(lcMatch)
Q_DECLARE_LOGGING_CATEGORY(lcReconcile)
Q_DECLARE_LOGGING_CATEGORY(lcJob)
Q_DECLARE_LOGGING_CATEGORY(lcExtract)
Q_DECLARE_LOGGING_CATEGORY(lcIntake)
Q_DECLARE_LOGGING_CATEGORY(lcSql)
