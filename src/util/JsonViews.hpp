#pragma once
#include <QJsonArray>
#include <QJsonObject>
#include <QList>

#include "include/types.hpp"

// JSON renderings used by the command-line front end
namespace JsonViews {
	QJsonObject toJson(const DeviceAddress& a);
	QJsonObject toJson(const ScanResult& r);
	QJsonObject toJson(const DiscoveredDevice& d);
	QJsonObject toJson(const StatusLogEntry& e);
	QJsonObject toJson(const Operation& op);
	QJsonArray  toJson(const QList<SensorInfo>& sensors);

	template <typename T>
	QJsonArray toJsonArray(const QList<T>& items)
	{
		QJsonArray arr;
		for (const T& item : items)
			arr.append(toJson(item));
		return arr;
	}
}
