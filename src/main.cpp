#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QTextStream>
#include <QDebug>
#include <exception>
#include <vector>

#include "config/AppConfig.hpp"
#include "services/AppContext.hpp"
#include "services/QSqliteService.hpp"
#include "services/BlobIntake.hpp"
#include "services/EnrollmentValidator.hpp"
#include "services/AttendanceReconciler.hpp"
#include "services/BackgroundJobRunner.hpp"
#include "log/SystemLogger.hpp"

namespace {

enum ExitCode { Ok = 0, Usage = 1, Rejected = 2, InitFailed = 3 };

QTextStream& out()
{
	static QTextStream ts(stdout);
	return ts;
}

QStringList splitRoster(const QString& csv)
{
	return csv.split(',', Qt::SkipEmptyParts);
}

int runEnroll(const QCommandLineParser& p, const QStringList& images)
{
	auto& ctx = AppContext::instance();
	if (images.size() != 3) {
		qCritical() << "enroll: exactly 3 images required (got" << images.size() << ")";
		return Usage;
	}

	const auto blobs = BlobIntake::fetchAll(ctx.intake(), images, ctx.workerPool(),
											ctx.config().downloadTimeoutMs);
	EnrollRequest req;
	req.identityKey = p.value("identity");
	req.externalKey = p.value("external");
	req.displayName = p.value("name");
	req.sourceRefs  = images;
	for (int i = 0; i < images.size(); ++i) {
		if (!blobs[i].ok) {
			qCritical().noquote() << QStringLiteral("InputError: %1 (image %2)").arg(blobs[i].error).arg(i + 1);
			return Usage;
		}
		req.images.push_back(blobs[i].bytes);
	}

	const EnrollOutcome r = ctx.enrollment().validateAndBuild(req);
	if (!r.ok()) {
		qCritical().noquote() << r.error.toString();
		return r.error.kind == ErrorKind::Input ? Usage : Rejected;
	}
	out() << "Student registered: " << r.enrolled.identity.identityKey
		  << " (" << r.enrolled.identity.displayName << ")" << Qt::endl;
	return Ok;
}

int runAttend(const QCommandLineParser& p, const QStringList& images)
{
	auto& ctx = AppContext::instance();
	const auto blobs = BlobIntake::fetchAll(ctx.intake(), images, ctx.workerPool(),
											ctx.config().downloadTimeoutMs);
	std::vector<ProbeImage> probes;
	for (int i = 0; i < images.size(); ++i) {
		ProbeImage pi;
		pi.ref = images[i];
		if (blobs[i].ok) pi.bytes = blobs[i].bytes;
		else pi.intakeError = blobs[i].error;
		probes.push_back(pi);
	}

	const ReconcileOutcome r = ctx.reconciler().reconcile(p.value("session"), splitRoster(p.value("roster")), probes);
	if (!r.ok()) {
		qCritical().noquote() << r.error.toString();
		return r.error.kind == ErrorKind::Input ? Usage : Rejected;
	}

	for (const PipelineError& e : r.imageErrors)
		qWarning().noquote() << e.toString() << images.value(e.imageIndex);

	out() << "Attendance processed: presentCount=" << r.present.size()
		  << " absentCount=" << r.absent.size() << Qt::endl;
	for (const auto& k : r.present) out() << "  Present " << k << Qt::endl;
	for (const auto& k : r.absent)  out() << "  Absent  " << k << Qt::endl;
	return Ok;
}

int runAttendAsync(const QCommandLineParser& p, const QStringList& images)
{
	auto& ctx = AppContext::instance();
	const SubmitOutcome s = ctx.jobs().submit(p.value("session"), splitRoster(p.value("roster")), images);
	if (!s.ok()) {
		qCritical().noquote() << s.error.toString();
		return Usage;
	}
	out() << "Attendance request received. Processing in background. session=" << s.ack.sessionKey
		  << " studentCount=" << s.ack.rosterCount << " imageCount=" << s.ack.imageCount << Qt::endl;

	// CLI 프로세스가 먼저 끝나지 않도록 대기
	ctx.jobs().waitForIdle();
	return Ok;
}

int runMarks(const QCommandLineParser& p)
{
	auto& ctx = AppContext::instance();
	QVector<AttendanceMark> rows;
	if (!ctx.store().selectMarks(p.value("session"), &rows)) {
		qCritical() << "StoreError: failed to read attendance";
		return Rejected;
	}
	out() << "session " << p.value("session") << ": " << rows.size() << " records" << Qt::endl;
	for (const auto& m : rows) {
		out() << "  " << m.identityKey << "\t" << (m.displayName.isEmpty() ? "-" : m.displayName)
			  << "\t" << toString(m.status) << "\t" << m.updatedAt.toString(Qt::ISODate) << Qt::endl;
	}
	return Ok;
}

const char* levelName(int lv)
{
	static const char* names[] = {"DEBUG", "INFO", "WARN", "ERROR", "CRITICAL"};
	return (lv >= 0 && lv <= 4) ? names[lv] : "?";
}

// "warn" 또는 "2" -> 2. 모르면 -1
int parseLevel(const QString& s)
{
	const QString v = s.trimmed().toLower();
	if (v == "debug")		return int(SysLogLevel::Debug);
	if (v == "info")		return int(SysLogLevel::Info);
	if (v == "warn")		return int(SysLogLevel::Warn);
	if (v == "error")		return int(SysLogLevel::Error);
	if (v == "critical")	return int(SysLogLevel::Critical);
	bool ok = false;
	const int n = v.toInt(&ok);
	return (ok && n >= 0 && n <= 4) ? n : -1;
}

// 모델 없이도 볼 수 있도록 AppContext 를 거치지 않는다
int runLogs(const QCommandLineParser& p, const QString& dbPath)
{
	QSqliteService store(dbPath);
	if (!store.initializeDatabase()) {
		qCritical() << "StoreError: cannot open" << dbPath;
		return InitFailed;
	}

	const int minLevel = p.isSet("level") ? parseLevel(p.value("level")) : int(SysLogLevel::Info);
	if (minLevel < 0) {
		qCritical() << "invalid --level (debug|info|warn|error|critical)";
		return Usage;
	}
	bool ok = true;
	const int limit = p.isSet("limit") ? p.value("limit").toInt(&ok) : 50;
	if (!ok || limit <= 0) {
		qCritical() << "invalid --limit";
		return Usage;
	}

	QVector<SystemLog> rows;
	int total = 0;
	if (!store.selectSystemLogs(0, limit, minLevel, p.value("tag"), &rows, &total)) {
		qCritical() << "StoreError: failed to read system logs";
		return Rejected;
	}
	out() << rows.size() << " of " << total << " log entries" << Qt::endl;
	for (const auto& r : rows) {
		out() << r.timestamp.toString(Qt::ISODate) << "\t" << levelName(r.level) << "\t" << r.tag
			  << "\t" << r.message << (r.extra.isEmpty() ? QString() : "\t" + r.extra) << Qt::endl;
	}
	return Ok;
}

} // namespace

int main(int argc, char *argv[])
{
		try {
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName("face_attendance");

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));
				QLoggingCategory::setFilterRules(
						"attendance.*.debug=false\n"
						"attendance.sql.info=false\n"
				);

				QCommandLineParser parser;
				parser.setApplicationDescription("Face-based attendance: enrollment and roster reconciliation");
				parser.addHelpOption();
				parser.addPositionalArgument("command", "enroll | attend | attend-async | marks | logs");
				parser.addPositionalArgument("images", "image paths or URLs", "[images...]");
				parser.addOptions({
						{"identity",	"identity key (student id)", "key"},
						{"external",	"external key (app id)", "key"},
						{"name",		"display name", "name"},
						{"session",		"session key (timetable id)", "key"},
						{"roster",		"comma separated identity keys", "keys"},
						{"db",			"SQLite database path", "path"},
						{"threshold",	"match threshold (Euclidean)", "value"},
						{"single-face",	"reject enrollment photos with more than one face"},
						{"level",		"logs: minimum level (debug|info|warn|error|critical)", "level"},
						{"tag",			"logs: tag filter (substring)", "tag"},
						{"limit",		"logs: newest N entries (default 50)", "n"},
				});
				parser.process(app);

				const QStringList args = parser.positionalArguments();
				if (args.isEmpty()) parser.showHelp(Usage);
				const QString cmd = args.first();
				const QStringList images = args.mid(1);

				AppConfig cfg = AppConfig::fromEnvironment();
				if (parser.isSet("db"))			cfg.dbPath = parser.value("db");
				if (parser.isSet("single-face"))	cfg.requireSingleFace = true;
				if (parser.isSet("threshold")) {
						bool ok = false;
						cfg.matchThreshold = parser.value("threshold").toDouble(&ok);
						if (!ok) { qCritical() << "invalid --threshold"; return Usage; }
				}

				if (cmd == "logs") return runLogs(parser, cfg.dbPath);

				auto& ctx = AppContext::instance();
				if (!ctx.initialize(cfg)) {
						qCritical() << "Fatal init error";
						SystemLogger::shutdown();
						return InitFailed;
				}
				SystemLogger::info("APP", QStringLiteral("command %1").arg(cmd));

				int rc = Usage;
				if (cmd == "enroll")				rc = runEnroll(parser, images);
				else if (cmd == "attend")			rc = runAttend(parser, images);
				else if (cmd == "attend-async")		rc = runAttendAsync(parser, images);
				else if (cmd == "marks")			rc = runMarks(parser);
				else qCritical() << "unknown command:" << cmd;

				ctx.shutdown();
				SystemLogger::shutdown();
				return rc;
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		}

		return InitFailed;
}
