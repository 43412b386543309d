#include "Settings.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QtGlobal>

#include "include/common_path.hpp"
#include "logger.hpp"

QString Settings::registryPath() const     { return QDir(configDir).filePath(QStringLiteral(BOARDS_FILE)); }
QString Settings::statusLogPath() const    { return QDir(configDir).filePath(QStringLiteral(STATUS_LOG_FILE)); }
QString Settings::settingsFilePath() const { return QDir(configDir).filePath(QStringLiteral(SETTINGS_FILE)); }

Settings Settings::defaults()
{
		Settings s;
		s.ddnsHost  = QStringLiteral(DEFAULT_DDNS_HOST);
		s.configDir = QStringLiteral(CONFIG_PATH);
		s.dbFile    = QStringLiteral(DB_PATH DB);
		s.logDir    = QStringLiteral(LOG_DIR);
		return s;
}

Settings Settings::load(const QString& configDirOverride)
{
		Settings s = defaults();

		if (!configDirOverride.isEmpty()) {
				s.configDir = configDirOverride;
		} else if (qEnvironmentVariableIsSet("FLASHER_CONFIG_DIR")) {
				s.configDir = qEnvironmentVariable("FLASHER_CONFIG_DIR");
		}

		if (QFileInfo::exists(s.settingsFilePath())) {
				if (!s.applyFile(s.settingsFilePath()))
						qWarning() << "[Settings] ignoring unreadable" << s.settingsFilePath();
		}
		s.applyEnvironment();

		LOG_DEBUG(QString("config=%1 ddns=%2").arg(s.configDir, s.ddnsHost));
		return s;
}

bool Settings::applyFile(const QString& path)
{
		QSettings ini(path, QSettings::IniFormat);
		if (ini.status() != QSettings::NoError)
				return false;

		auto str = [&](const char* key, QString& field) {
				if (ini.contains(key)) field = ini.value(key).toString();
		};
		auto num = [&](const char* key, int& field) {
				if (!ini.contains(key)) return;
				bool ok = false;
				const int v = ini.value(key).toInt(&ok);
				if (ok) field = v;
				else qWarning() << "[Settings]" << key << "is not a number, keeping" << field;
		};

		str("general/ddns_host", ddnsHost);
		str("general/db_file",   dbFile);
		str("general/log_dir",   logDir);
		if (ini.contains("general/hostname_prefixes"))
				hostnamePrefixes = ini.value("general/hostname_prefixes").toStringList();

		num("ports/web_base", ports.webBase);
		num("ports/ota_base", ports.otaBase);
		num("ports/api_base", ports.apiBase);

		num("scan/probe_timeout_ms",    probeTimeoutMs);
		num("scan/retry_delay_ms",      probeRetryDelayMs);
		num("scan/metadata_timeout_ms", metadataTimeoutMs);
		num("scan/interval_sec",        scanIntervalSec);
		if (ini.contains("scan/metadata_enabled"))
				metadataEnabled = ini.value("scan/metadata_enabled").toBool();

		num("discovery/timeout_ms", discoveryTimeoutMs);
		num("discovery/batch_size", discoveryBatchSize);
		num("discovery/first_port", discoveryFirstPort);
		num("discovery/last_port",  discoveryLastPort);

		num("flash/timeout_ms", flashTimeoutMs);
		num("flash/chunk_size", flashChunkSize);

		num("stores/status_log_max_entries",    statusLogMaxEntries);
		num("stores/operation_max_entries",     operationMaxEntries);
		num("stores/operation_max_age_sec",     operationMaxAgeSec);
		num("stores/system_log_retention_days", systemLogRetentionDays);

		if (discoveryBatchSize < 1) discoveryBatchSize = 1;
		if (flashChunkSize < 512) flashChunkSize = 512;
		return true;
}

void Settings::applyEnvironment()
{
		if (qEnvironmentVariableIsSet("DDNS_HOST"))
				ddnsHost = qEnvironmentVariable("DDNS_HOST");

		if (qEnvironmentVariableIsSet("FLASHER_SCAN_INTERVAL")) {
				bool ok = false;
				const int v = qEnvironmentVariableIntValue("FLASHER_SCAN_INTERVAL", &ok);
				if (ok && v > 0) scanIntervalSec = v;
				else qWarning() << "[Settings] FLASHER_SCAN_INTERVAL ignored";
		}
}
