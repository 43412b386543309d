#pragma once
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>

#include "include/states.hpp"

// One entity reading scraped from a board's web UI
struct SensorInfo {
		QString id;
		QString name;
		QString state;
		QString unit;

		bool operator==(const SensorInfo& o) const {
				return id == o.id && name == o.name && state == o.state && unit == o.unit;
		}
		bool operator!=(const SensorInfo& o) const { return !(*this == o); }
};

// Registered board (registry key = name)
struct Device {
		QString				name;
		int						id = 0;
		QString				type = QStringLiteral("esp32");
		QString				host;					// empty -> DDNS host
		QString				hostname;			// empty -> derived
		QString				apiKey;
		QString				webUsername;
		QString				webPassword;
		QString				macAddress;
		QList<SensorInfo>	sensors;
		QJsonObject		deviceInfo;
		QDateTime			lastSeen;

		bool hasWebCredentials() const { return !webUsername.isEmpty() && !webPassword.isEmpty(); }
};

struct DeviceAddress {
		QString host;
		QString hostname;
		int webPort = 0;
		int otaPort = 0;
		int apiPort = 0;
};

// Result of one device in one scan cycle
struct ScanResult {
		QString				name;
		int						id = 0;
		QString				type;
		DeviceAddress	address;

		bool online    = false;		// ota || web
		bool otaOnline = false;
		bool webOnline = false;
		bool apiOnline = false;

		QString				macAddress;
		QList<SensorInfo>	sensors;

		bool		metadataAttempted = false;
		QString	metadataError;				// empty when the fetch succeeded or was skipped
		QString	error;								// probe pipeline fault

		States::DeviceEvent event() const {
				return online ? States::DeviceEvent::Online : States::DeviceEvent::Offline;
		}

		QString details() const {
				auto ok = [](bool b) { return b ? QStringLiteral("OK") : QStringLiteral("FAIL"); };
				return QStringLiteral("OTA:%1 WEB:%2 API:%3").arg(ok(otaOnline), ok(webOnline), ok(apiOnline));
		}
};

struct DiscoveredDevice {
		int			id = 0;
		QString	host;
		int			otaPort = 0;
		int			webPort = 0;
		int			apiPort = 0;
		bool		isNew = false;
};

struct StatusLogEntry {
		QString							timestamp;		// UTC ISO-8601
		QString							deviceName;
		States::DeviceEvent	event = States::DeviceEvent::Offline;
		QString							details;
};

// Build or flash operation tracked in memory
struct Operation {
		QString									id;
		States::OperationKind		kind = States::OperationKind::Flash;
		States::OperationStatus	status = States::OperationStatus::Pending;
		int											progress = 0;
		QString									message;
		QString									deviceName;
		QString									firmwarePath;
		QString									logs;
		QDateTime								createdAt;
		QDateTime								updatedAt;
};

Q_DECLARE_METATYPE(ScanResult)
Q_DECLARE_METATYPE(DiscoveredDevice)
Q_DECLARE_METATYPE(Operation)
