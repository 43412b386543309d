#include "DeviceRegistry.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

#include "log/flasher_logging.hpp"
#include "net/AddressResolver.hpp"

DeviceRegistry::DeviceRegistry(QString filePath) : path_(std::move(filePath)) {}

static QString optString(const QJsonObject& o, const char* key)
{
		const QJsonValue v = o.value(QLatin1String(key));
		return v.isString() ? v.toString() : QString();
}

Device DeviceRegistry::fromJson(const QString& name, const QJsonObject& o)
{
		Device d;
		d.name        = name;
		d.id          = o.value(QStringLiteral("id")).toInt();
		d.type        = o.value(QStringLiteral("type")).toString(QStringLiteral("esp32"));
		d.host        = optString(o, "host");
		d.hostname    = optString(o, "hostname");
		d.apiKey      = optString(o, "api_key");
		d.webUsername = optString(o, "web_username");
		d.webPassword = optString(o, "web_password");
		d.macAddress  = optString(o, "mac_address");
		d.deviceInfo  = o.value(QStringLiteral("device_info")).toObject();

		const QString seen = optString(o, "last_seen");
		if (!seen.isEmpty())
				d.lastSeen = QDateTime::fromString(seen, Qt::ISODateWithMs);

		const QJsonArray sensors = o.value(QStringLiteral("sensors")).toArray();
		for (const QJsonValue& v : sensors) {
				const QJsonObject so = v.toObject();
				SensorInfo s;
				s.id    = so.value(QStringLiteral("id")).toString();
				s.name  = so.value(QStringLiteral("name")).toString();
				s.state = so.value(QStringLiteral("state")).toString();
				s.unit  = so.value(QStringLiteral("unit")).toString();
				d.sensors.append(s);
		}
		return d;
}

QJsonObject DeviceRegistry::toJson(const Device& d)
{
		QJsonObject o;
		o["id"]       = d.id;
		o["type"]     = d.type;
		o["host"]     = d.host.isEmpty() ? QJsonValue() : QJsonValue(d.host);
		o["hostname"] = d.hostname.isEmpty() ? QJsonValue() : QJsonValue(d.hostname);
		if (!d.apiKey.isEmpty())      o["api_key"]      = d.apiKey;
		if (!d.webUsername.isEmpty()) o["web_username"] = d.webUsername;
		if (!d.webPassword.isEmpty()) o["web_password"] = d.webPassword;
		if (!d.macAddress.isEmpty())  o["mac_address"]  = d.macAddress;
		if (!d.deviceInfo.isEmpty())  o["device_info"]  = d.deviceInfo;
		if (d.lastSeen.isValid())     o["last_seen"]    = d.lastSeen.toString(Qt::ISODateWithMs);

		if (!d.sensors.isEmpty()) {
				QJsonArray arr;
				for (const SensorInfo& s : d.sensors) {
						arr.append(QJsonObject{
								{"id", s.id}, {"name", s.name}, {"state", s.state}, {"unit", s.unit}
						});
				}
				o["sensors"] = arr;
		}
		return o;
}

bool DeviceRegistry::load()
{
		devices_.clear();

		QFile f(path_);
		if (!f.exists()) {
				qCInfo(LC_STORE) << "[DeviceRegistry] no registry at" << path_ << ", starting empty";
				return true;
		}
		if (!f.open(QIODevice::ReadOnly)) {
				qCWarning(LC_STORE) << "[DeviceRegistry] open failed:" << path_ << f.errorString();
				return false;
		}

		QJsonParseError perr;
		const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
		if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
				qCWarning(LC_STORE) << "[DeviceRegistry] JSON parse error:" << perr.errorString();
				return false;
		}

		const QJsonObject boards = doc.object().value(QStringLiteral("boards")).toObject();
		for (auto it = boards.begin(); it != boards.end(); ++it) {
				const Device d = fromJson(it.key(), it.value().toObject());
				if (!AddressResolver::isValidId(d.id))
						qCWarning(LC_STORE) << "[DeviceRegistry]" << d.name << "has invalid id" << d.id;
				devices_.insert(d.name, d);
		}
		return true;
}

bool DeviceRegistry::save() const
{
		QJsonObject boards;
		for (auto it = devices_.cbegin(); it != devices_.cend(); ++it)
				boards.insert(it.key(), toJson(it.value()));

		QJsonObject root;
		root.insert(QStringLiteral("boards"), boards);

		QDir().mkpath(QFileInfo(path_).absolutePath());
		QSaveFile sf(path_);
		if (!sf.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
				qCWarning(LC_STORE) << "[DeviceRegistry] cannot write" << path_ << sf.errorString();
				return false;
		}
		sf.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
		if (!sf.commit()) {
				qCWarning(LC_STORE) << "[DeviceRegistry] commit failed" << path_ << sf.errorString();
				return false;
		}
		return true;
}

std::optional<Device> DeviceRegistry::find(const QString& name) const
{
		auto it = devices_.constFind(name);
		if (it == devices_.cend())
				return std::nullopt;
		return it.value();
}

QSet<int> DeviceRegistry::knownIds() const
{
		QSet<int> ids;
		for (const Device& d : devices_)
				ids.insert(d.id);
		return ids;
}

bool DeviceRegistry::validate_(const Device& d, const QString& ignoreName, QString* error) const
{
		auto fail = [error](const QString& msg) {
				if (error) *error = msg;
				return false;
		};

		if (d.name.trimmed().isEmpty())
				return fail(QStringLiteral("Board name must not be empty"));
		if (!AddressResolver::isValidId(d.id))
				return fail(QStringLiteral("Board ID %1 is out of range 1-99").arg(d.id));
		if (d.name != ignoreName && devices_.contains(d.name))
				return fail(QStringLiteral("Board '%1' already exists").arg(d.name));

		for (const Device& other : devices_) {
				if (other.name == ignoreName)
						continue;
				if (other.id == d.id)
						return fail(QStringLiteral("Board ID %1 is already used by '%2'").arg(d.id).arg(other.name));
		}
		return true;
}

bool DeviceRegistry::addDevice(const Device& device, QString* error)
{
		if (!validate_(device, QString(), error))
				return false;
		devices_.insert(device.name, device);
		return true;
}

bool DeviceRegistry::updateDevice(const QString& name, const Device& updated, QString* error)
{
		if (!devices_.contains(name)) {
				if (error) *error = QStringLiteral("Board '%1' not found").arg(name);
				return false;
		}
		if (!validate_(updated, name, error))
				return false;

		devices_.remove(name);
		devices_.insert(updated.name, updated);
		return true;
}

bool DeviceRegistry::removeDevice(const QString& name)
{
		return devices_.remove(name) > 0;
}

bool DeviceRegistry::applyScanResults(const QList<ScanResult>& results, const QDateTime& now)
{
		bool changed = false;
		for (const ScanResult& r : results) {
				auto it = devices_.find(r.name);
				if (it == devices_.end())
						continue;
				Device& d = it.value();

				if (!r.macAddress.isEmpty() && d.macAddress.isEmpty()) {
						d.macAddress = r.macAddress;
						changed = true;
				}
				if (r.online) {
						d.lastSeen = now;
						changed = true;
				}
				if (!r.sensors.isEmpty() && r.sensors != d.sensors) {
						d.sensors = r.sensors;
						changed = true;
				}
		}
		return changed;
}

QStringList DeviceRegistry::autoRegister(const QList<DiscoveredDevice>& discovered)
{
		QStringList added;
		for (const DiscoveredDevice& dd : discovered) {
				if (!dd.isNew)
						continue;

				Device d;
				d.name = QStringLiteral("board-%1").arg(dd.id, 2, 10, QLatin1Char('0'));
				d.id   = dd.id;

				QString err;
				if (!addDevice(d, &err)) {
						qCWarning(LC_STORE) << "[autoRegister] skipped" << d.name << ":" << err;
						continue;
				}
				added.append(d.name);
		}
		return added;
}
