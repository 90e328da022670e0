#include "config/AppConfig.hpp"
#include <QtGlobal>
#include <QDebug>
#include <cmath>

#include "include/common_path.hpp"
#include "include/recog_params.hpp"

namespace {

QString envString(const char* name, const QString& fallback)
{
	const QString v = qEnvironmentVariable(name).trimmed();
	return v.isEmpty() ? fallback : v;
}

int envInt(const char* name, int fallback)
{
	if (!qEnvironmentVariableIsSet(name)) return fallback;
	bool ok = false;
	const int v = qEnvironmentVariable(name).trimmed().toInt(&ok);
	if (!ok) {
		qWarning() << "[AppConfig] ignoring non-integer" << name << "=" << qEnvironmentVariable(name);
		return fallback;
	}
	return v;
}

double envDouble(const char* name, double fallback)
{
	if (!qEnvironmentVariableIsSet(name)) return fallback;
	bool ok = false;
	const double v = qEnvironmentVariable(name).trimmed().toDouble(&ok);
	if (!ok) {
		qWarning() << "[AppConfig] ignoring non-numeric" << name << "=" << qEnvironmentVariable(name);
		return fallback;
	}
	return v;
}

bool envBool(const char* name, bool fallback)
{
	if (!qEnvironmentVariableIsSet(name)) return fallback;
	const QString v = qEnvironmentVariable(name).trimmed().toLower();
	if (v == "1" || v == "true" || v == "yes" || v == "on")  return true;
	if (v == "0" || v == "false" || v == "no" || v == "off") return false;
	qWarning() << "[AppConfig] ignoring non-boolean" << name << "=" << v;
	return fallback;
}

} // namespace

AppConfig AppConfig::defaults()
{
	AppConfig c;
	c.matchThreshold	= recog::MATCH_THR;
	c.dbPath			= QStringLiteral(DB_PATH) + QStringLiteral(DB);
	c.detectorModel		= QStringLiteral(YNMODEL_PATH) + QStringLiteral(YNMODEL);
	c.recognizerModel	= QStringLiteral(SFACE_RECOGNIZER_PATH) + QStringLiteral(SFACE_RECOGNIZER);
	c.extractTimeoutMs	= recog::EXTRACT_TIMEOUT_MS;
	c.downloadTimeoutMs	= recog::DOWNLOAD_TIMEOUT_MS;
	c.maxImageBytes		= recog::MAX_IMAGE_BYTES;
	c.detectMaxWidth	= recog::DETECT_MAX_WIDTH;
	c.extractThreads	= recog::EXTRACT_THREADS;
	c.jobThreads		= recog::JOB_THREADS;
	return c;
}

AppConfig AppConfig::fromEnvironment()
{
	AppConfig c = defaults();
	c.matchThreshold	= envDouble("FACE_MATCHER_THRESHOLD", c.matchThreshold);
	c.dbPath			= envString("FA_DB_PATH", c.dbPath);
	c.detectorModel		= envString("FA_DETECTOR_MODEL", c.detectorModel);
	c.recognizerModel	= envString("FA_RECOGNIZER_MODEL", c.recognizerModel);
	c.requireSingleFace	= envBool("FA_ENROLL_SINGLE_FACE", c.requireSingleFace);
	c.extractTimeoutMs	= envInt("FA_EXTRACT_TIMEOUT_MS", c.extractTimeoutMs);
	c.downloadTimeoutMs	= envInt("FA_DOWNLOAD_TIMEOUT_MS", c.downloadTimeoutMs);
	c.maxImageBytes		= envInt("FA_MAX_IMAGE_BYTES", c.maxImageBytes);
	c.detectMaxWidth	= envInt("FA_DETECT_MAX_WIDTH", c.detectMaxWidth);
	c.extractThreads	= envInt("FA_EXTRACT_THREADS", c.extractThreads);
	c.jobThreads		= envInt("FA_JOB_THREADS", c.jobThreads);
	return c;
}

bool AppConfig::validate(QStringList* errors) const
{
	QStringList errs;
	if (!std::isfinite(matchThreshold) || matchThreshold <= 0.0)
		errs << QStringLiteral("match threshold must be > 0 (got %1)").arg(matchThreshold);
	if (dbPath.isEmpty())
		errs << QStringLiteral("database path is empty");
	if (extractTimeoutMs <= 0)	errs << QStringLiteral("extract timeout must be > 0");
	if (downloadTimeoutMs <= 0)	errs << QStringLiteral("download timeout must be > 0");
	if (maxImageBytes <= 0)		errs << QStringLiteral("max image bytes must be > 0");
	if (detectMaxWidth <= 0)	errs << QStringLiteral("detect max width must be > 0");
	if (extractThreads <= 0)	errs << QStringLiteral("extract threads must be > 0");
	if (jobThreads <= 0)		errs << QStringLiteral("job threads must be > 0");

	if (errors) *errors = errs;
	return errs.isEmpty();
}

QString AppConfig::summary() const
{
	return QStringLiteral("threshold=%1 db=%2 singleFace=%3 extractTimeout=%4ms threads=%5/%6")
		.arg(matchThreshold)
		.arg(dbPath)
		.arg(requireSingleFace ? "on" : "off")
		.arg(extractTimeoutMs)
		.arg(extractThreads)
		.arg(jobThreads);
}
