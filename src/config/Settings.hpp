#pragma once
#include <QString>
#include <QStringList>

#include "include/flasher_params.hpp"

struct PortLayout {
		int webBase = flasher::WEB_PORT_BASE;
		int otaBase = flasher::OTA_PORT_BASE;
		int apiBase = flasher::API_PORT_BASE;
};

// Runtime configuration.
// Compiled defaults < <configDir>/flasher.ini < environment (DDNS_HOST, FLASHER_CONFIG_DIR, FLASHER_SCAN_INTERVAL)
struct Settings {
		QString ddnsHost;
		QString configDir;
		QString dbFile;
		QString logDir;

		PortLayout ports;
		QStringList hostnamePrefixes { QStringLiteral("cactus-"), QStringLiteral("esp32-"), QStringLiteral("esp-") };

		int probeTimeoutMs      = flasher::PROBE_TIMEOUT_MS;
		int probeRetryDelayMs   = flasher::PROBE_RETRY_DELAY_MS;
		int metadataTimeoutMs   = flasher::METADATA_TIMEOUT_MS;
		bool metadataEnabled    = true;

		int discoveryTimeoutMs  = flasher::DISCOVERY_TIMEOUT_MS;
		int discoveryBatchSize  = flasher::DISCOVERY_BATCH_SIZE;
		int discoveryFirstPort  = flasher::DISCOVERY_FIRST_PORT;
		int discoveryLastPort   = flasher::DISCOVERY_LAST_PORT;

		int flashTimeoutMs      = flasher::FLASH_TIMEOUT_MS;
		int flashChunkSize      = flasher::FLASH_CHUNK_SIZE;

		int statusLogMaxEntries = flasher::STATUS_LOG_MAX_ENTRIES;
		int operationMaxEntries = flasher::OPERATION_MAX_ENTRIES;
		int operationMaxAgeSec  = flasher::OPERATION_MAX_AGE_SEC;
		int systemLogRetentionDays = 30;

		int scanIntervalSec     = flasher::SCAN_INTERVAL_SEC;

		QString registryPath() const;
		QString statusLogPath() const;
		QString settingsFilePath() const;

		static Settings defaults();
		// configDirOverride wins over FLASHER_CONFIG_DIR when non-empty
		static Settings load(const QString& configDirOverride = QString());

		// Reads the INI file in configDir on top of the current values
		bool applyFile(const QString& path);
		void applyEnvironment();
};
