#include "StatusTransitionLog.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

#include "log/flasher_logging.hpp"

StatusTransitionLog::StatusTransitionLog(QString filePath, int maxEntries)
		: path_(std::move(filePath)), maxEntries_(qMax(1, maxEntries))
{
}

static States::DeviceEvent eventFromString(const QString& s)
{
		return s == QLatin1String("online") ? States::DeviceEvent::Online : States::DeviceEvent::Offline;
}

std::optional<StatusTransitionLog::Document> StatusTransitionLog::load_() const
{
		Document doc;

		QFile f(path_);
		if (!f.exists())
				return doc;
		if (!f.open(QIODevice::ReadOnly)) {
				qCWarning(LC_STORE) << "[StatusTransitionLog] open failed:" << path_ << f.errorString();
				return std::nullopt;
		}

		const QByteArray raw = f.readAll();
		if (raw.trimmed().isEmpty())
				return doc;

		QJsonParseError perr;
		const QJsonDocument json = QJsonDocument::fromJson(raw, &perr);
		if (perr.error != QJsonParseError::NoError || !json.isObject()) {
				qCWarning(LC_STORE) << "[StatusTransitionLog] unreadable, leaving it untouched:" << path_
									<< (perr.error != QJsonParseError::NoError ? perr.errorString()
																				 : QStringLiteral("not an object"));
				return std::nullopt;
		}

		const QJsonObject root = json.object();
		const QJsonObject last = root.value(QStringLiteral("last_status")).toObject();
		for (auto it = last.begin(); it != last.end(); ++it)
				doc.lastStatus.insert(it.key(), it.value().toString());

		const QJsonArray logs = root.value(QStringLiteral("logs")).toArray();
		for (const QJsonValue& v : logs) {
				const QJsonObject o = v.toObject();
				StatusLogEntry e;
				e.timestamp  = o.value(QStringLiteral("timestamp")).toString();
				e.deviceName = o.value(QStringLiteral("board_name")).toString();
				e.event      = eventFromString(o.value(QStringLiteral("event")).toString());
				e.details    = o.value(QStringLiteral("details")).toString();
				doc.logs.append(e);
		}
		return doc;
}

bool StatusTransitionLog::save_(const Document& doc) const
{
		QJsonObject last;
		for (auto it = doc.lastStatus.cbegin(); it != doc.lastStatus.cend(); ++it)
				last.insert(it.key(), it.value());

		QJsonArray logs;
		for (const StatusLogEntry& e : doc.logs) {
				logs.append(QJsonObject{
						{QStringLiteral("timestamp"),  e.timestamp},
						{QStringLiteral("board_name"), e.deviceName},
						{QStringLiteral("event"),      States::toString(e.event)},
						{QStringLiteral("details"),    e.details},
				});
		}

		QJsonObject root;
		root.insert(QStringLiteral("last_status"), last);
		root.insert(QStringLiteral("logs"), logs);

		QDir().mkpath(QFileInfo(path_).absolutePath());
		QSaveFile sf(path_);
		if (!sf.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
				qCWarning(LC_STORE) << "[StatusTransitionLog] cannot write" << path_ << sf.errorString();
				return false;
		}
		sf.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
		if (!sf.commit()) {
				qCWarning(LC_STORE) << "[StatusTransitionLog] commit failed" << path_ << sf.errorString();
				return false;
		}
		return true;
}

bool StatusTransitionLog::recordIfChanged(const QString& deviceName, States::DeviceEvent event,
										  const QString& details, bool* persisted)
{
		QMutexLocker locker(&mutex_);
		if (persisted) *persisted = true;

		std::optional<Document> loaded = load_();
		if (!loaded) {
				if (persisted) *persisted = false;
				qCWarning(LC_STORE) << "[recordIfChanged] status log unreadable, not recording" << deviceName;
				return false;
		}
		Document& doc = *loaded;
		const QString next = States::toString(event);
		const QString prev = doc.lastStatus.value(deviceName, QStringLiteral("unknown"));
		if (prev == next)
				return false;

		StatusLogEntry e;
		e.timestamp  = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
		e.deviceName = deviceName;
		e.event      = event;
		e.details    = details;
		doc.logs.append(e);
		doc.lastStatus.insert(deviceName, next);

		// oldest entries go first
		if (doc.logs.size() > maxEntries_)
				doc.logs.erase(doc.logs.begin(), doc.logs.begin() + (doc.logs.size() - maxEntries_));

		const bool ok = save_(doc);
		if (persisted) *persisted = ok;

		qCDebug(LC_STORE) << "[recordIfChanged]" << deviceName << prev << "->" << next << details
						  << "saved=" << ok;
		return true;
}

QList<StatusLogEntry> StatusTransitionLog::query(int limit, const QString& deviceName) const
{
		QMutexLocker locker(&mutex_);
		QList<StatusLogEntry> out;
		const std::optional<Document> doc = load_();
		if (!doc) {
				qCWarning(LC_STORE) << "[query] status log unreadable:" << path_;
				return out;
		}
		if (limit <= 0)
				return out;

		for (auto it = doc->logs.crbegin(); it != doc->logs.crend() && out.size() < limit; ++it) {
				if (!deviceName.isEmpty() && it->deviceName != deviceName)
						continue;
				out.append(*it);
		}
		return out;
}

QMap<QString, QString> StatusTransitionLog::lastStatuses() const
{
		QMutexLocker locker(&mutex_);
		const std::optional<Document> doc = load_();
		if (!doc) {
				qCWarning(LC_STORE) << "[lastStatuses] status log unreadable:" << path_;
				return {};
		}
		return doc->lastStatus;
}
