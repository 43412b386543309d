#pragma once
#include <stdexcept>
#include <QString>
#include <QStringList>

#include "config/Settings.hpp"
#include "include/types.hpp"

// Thrown for a device id outside [1, 99]
class InvalidIdentifier : public std::out_of_range {
public:
		explicit InvalidIdentifier(int id);
		int id() const { return id_; }

private:
		int id_;
};

// Maps a device id (plus overrides) to its host, hostname and ports. No I/O.
class AddressResolver {
public:
		explicit AddressResolver(QString baseHost,
								 PortLayout layout = PortLayout{},
								 QStringList prefixes = defaultPrefixes());
		explicit AddressResolver(const Settings& settings);

		DeviceAddress resolve(int id, const QString& displayName,
							  const QString& explicitHost = QString(),
							  const QString& explicitHostname = QString()) const;
		DeviceAddress resolve(const Device& device) const;

		QString hostnameFor(const QString& displayName, int id,
							const QString& explicitHostname = QString()) const;

		int webPort(int id) const;
		int otaPort(int id) const;
		int apiPort(int id) const;

		// Inverse of otaPort(); the result is not range checked
		int idFromPort(int otaPort) const { return otaPort - layout_.otaBase; }

		const QString& baseHost() const { return baseHost_; }
		const PortLayout& layout() const { return layout_; }

		static bool isValidId(int id);
		static QStringList defaultPrefixes();

private:
		static void requireValidId(int id);

		QString baseHost_;
		PortLayout layout_;
		QStringList prefixes_;
};
