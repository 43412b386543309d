#pragma once
#include <optional>

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QSet>
#include <QString>
#include <QStringList>

#include "include/types.hpp"

// Board registry persisted as {"boards": {name: {...}}}.
// Names and ids are unique; ids are in [1, 99].
class DeviceRegistry {
public:
		explicit DeviceRegistry(QString filePath);

		// A missing file is an empty registry, not an error
		bool load();
		bool save() const;

		const QMap<QString, Device>& devices() const { return devices_; }
		std::optional<Device> find(const QString& name) const;
		QSet<int> knownIds() const;

		bool addDevice(const Device& device, QString* error = nullptr);
		// updated.name may differ from name (rename)
		bool updateDevice(const QString& name, const Device& updated, QString* error = nullptr);
		bool removeDevice(const QString& name);

		// Folds MAC / sensors / last-seen of scan results into the registry.
		// Returns true when at least one device changed; the caller saves.
		bool applyScanResults(const QList<ScanResult>& results,
							  const QDateTime& now = QDateTime::currentDateTimeUtc());

		// Registers each new discovery as "board-NN"; returns the added names
		QStringList autoRegister(const QList<DiscoveredDevice>& discovered);

		static Device fromJson(const QString& name, const QJsonObject& o);
		static QJsonObject toJson(const Device& d);

		const QString& filePath() const { return path_; }

private:
		bool validate_(const Device& d, const QString& ignoreName, QString* error) const;

		QString path_;
		QMap<QString, Device> devices_;
};
