#include "AddressResolver.hpp"

#include <string>

InvalidIdentifier::InvalidIdentifier(int id)
		: std::out_of_range("invalid device id " + std::to_string(id) + ", expected "
							+ std::to_string(flasher::MIN_DEVICE_ID) + ".."
							+ std::to_string(flasher::MAX_DEVICE_ID))
		, id_(id)
{
}

AddressResolver::AddressResolver(QString baseHost, PortLayout layout, QStringList prefixes)
		: baseHost_(std::move(baseHost)), layout_(layout), prefixes_(std::move(prefixes))
{
}

AddressResolver::AddressResolver(const Settings& settings)
		: AddressResolver(settings.ddnsHost, settings.ports, settings.hostnamePrefixes)
{
}

QStringList AddressResolver::defaultPrefixes()
{
		return { QStringLiteral("cactus-"), QStringLiteral("esp32-"), QStringLiteral("esp-") };
}

bool AddressResolver::isValidId(int id)
{
		return id >= flasher::MIN_DEVICE_ID && id <= flasher::MAX_DEVICE_ID;
}

void AddressResolver::requireValidId(int id)
{
		if (!isValidId(id))
				throw InvalidIdentifier(id);
}

int AddressResolver::webPort(int id) const { requireValidId(id); return layout_.webBase + id; }
int AddressResolver::otaPort(int id) const { requireValidId(id); return layout_.otaBase + id; }
int AddressResolver::apiPort(int id) const { requireValidId(id); return layout_.apiBase + id; }

QString AddressResolver::hostnameFor(const QString& displayName, int id, const QString& explicitHostname) const
{
		requireValidId(id);
		if (!explicitHostname.isEmpty())
				return explicitHostname;

		// only the first matching prefix is stripped
		QString shortName = displayName;
		for (const QString& prefix : prefixes_) {
				if (shortName.startsWith(prefix)) {
						shortName = shortName.mid(prefix.size());
						break;
				}
		}
		return QStringLiteral("%1-%2.%3").arg(shortName).arg(id, 2, 10, QLatin1Char('0')).arg(baseHost_);
}

DeviceAddress AddressResolver::resolve(int id, const QString& displayName,
									   const QString& explicitHost, const QString& explicitHostname) const
{
		requireValidId(id);

		DeviceAddress a;
		a.host     = explicitHost.isEmpty() ? baseHost_ : explicitHost;
		a.hostname = hostnameFor(displayName, id, explicitHostname);
		a.webPort  = layout_.webBase + id;
		a.otaPort  = layout_.otaBase + id;
		a.apiPort  = layout_.apiBase + id;
		return a;
}

DeviceAddress AddressResolver::resolve(const Device& device) const
{
		return resolve(device.id, device.name, device.host, device.hostname);
}
