#include "log/LogCategories.hpp"

Q_LOGGING_CATEGORY(lcEnroll,    "attendance.enroll")
Q_LOGGING_CATEGORY(lcMatch,     "attendance.match")
Q_LOGGING_CATEGORY(lcReconcile, "attendance.reconcile")
Q_LOGGING_CATEGORY(lcJob,       "attendance.job")
Q_LOGGING_CATEGORY(lcExtract,   "attendance.extract")
Q_LOGGING_CATEGORY(lcIntake,    "attendance.intake")
Q_LOGGING_CATEGORY(lcSql,       "attendance.sql")
