#include "JsonViews.hpp"

namespace JsonViews {

QJsonObject toJson(const DeviceAddress& a)
{
	return QJsonObject{
		{"host", a.host},
		{"hostname", a.hostname},
		{"web_port", a.webPort},
		{"ota_port", a.otaPort},
		{"api_port", a.apiPort},
	};
}

QJsonArray toJson(const QList<SensorInfo>& sensors)
{
	QJsonArray arr;
	for (const SensorInfo& s : sensors)
		arr.append(QJsonObject{ {"id", s.id}, {"name", s.name}, {"state", s.state}, {"unit", s.unit} });
	return arr;
}

QJsonObject toJson(const ScanResult& r)
{
	QJsonObject o;
	o["name"]       = r.name;
	o["id"]         = r.id;
	o["type"]       = r.type;
	o["address"]    = toJson(r.address);
	o["status"]     = States::toString(r.event());
	o["ota_online"] = r.otaOnline;
	o["web_online"] = r.webOnline;
	o["api_online"] = r.apiOnline;
	o["details"]    = r.details();
	if (!r.macAddress.isEmpty())    o["mac_address"]    = r.macAddress;
	if (!r.sensors.isEmpty())       o["sensors"]        = toJson(r.sensors);
	if (!r.metadataError.isEmpty()) o["metadata_error"] = r.metadataError;
	if (!r.error.isEmpty())         o["error"]          = r.error;
	return o;
}

QJsonObject toJson(const DiscoveredDevice& d)
{
	return QJsonObject{
		{"id", d.id},
		{"host", d.host},
		{"ota_port", d.otaPort},
		{"web_port", d.webPort},
		{"api_port", d.apiPort},
		{"is_new", d.isNew},
	};
}

QJsonObject toJson(const StatusLogEntry& e)
{
	return QJsonObject{
		{"timestamp", e.timestamp},
		{"board_name", e.deviceName},
		{"event", States::toString(e.event)},
		{"details", e.details},
	};
}

QJsonObject toJson(const Operation& op)
{
	QJsonObject o;
	o["id"]          = op.id;
	o["kind"]        = States::toString(op.kind);
	o["status"]      = States::toString(op.status);
	o["progress"]    = op.progress;
	o["message"]     = op.message;
	o["board_name"]  = op.deviceName;
	o["created_at"]  = op.createdAt.toString(Qt::ISODateWithMs);
	o["updated_at"]  = op.updatedAt.toString(Qt::ISODateWithMs);
	if (!op.firmwarePath.isEmpty()) o["firmware_path"] = op.firmwarePath;
	if (!op.logs.isEmpty())         o["logs"]          = op.logs;
	return o;
}

}		// namespace JsonViews
