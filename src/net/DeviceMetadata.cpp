#include "DeviceMetadata.hpp"

#include <memory>

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QRegularExpression>
#include <QSet>
#include <QTimer>
#include <QUrl>

#include "log/flasher_logging.hpp"

namespace DeviceMetadata {

QString parseMacAddress(const QString& html)
{
		static const QRegularExpression re(
				QStringLiteral("([0-9A-Fa-f]{2}:[0-9A-Fa-f]{2}:[0-9A-Fa-f]{2}:"
							   "[0-9A-Fa-f]{2}:[0-9A-Fa-f]{2}:[0-9A-Fa-f]{2})"));
		const QRegularExpressionMatch m = re.match(html);
		return m.hasMatch() ? m.captured(1).toUpper() : QString();
}

QString titleFromId(const QString& entityId)
{
		QString spaced = entityId;
		spaced.replace(QLatin1Char('-'), QLatin1Char(' ')).replace(QLatin1Char('_'), QLatin1Char(' '));

		QStringList words = spaced.split(QLatin1Char(' '), Qt::SkipEmptyParts);
		for (QString& w : words)
				w = w.left(1).toUpper() + w.mid(1).toLower();
		return words.join(QLatin1Char(' '));
}

QPair<QString, QString> splitStateUnit(const QString& stateText)
{
		const QString text = stateText.trimmed();
		if (text.isEmpty())
				return {QString(), QString()};

		// order matters: the generic number+unit pattern is the last resort
		static const QList<QRegularExpression> patterns = {
				QRegularExpression(QStringLiteral("^([\\d.,-]+)\\s*(%)\\s*$")),
				QRegularExpression(QStringLiteral("^([\\d.,-]+)\\s*(°[CcFf])\\s*$")),
				QRegularExpression(QStringLiteral("^([\\d.,-]+)\\s*(C|F|K)\\s*$")),
				QRegularExpression(QStringLiteral("^([\\d.,-]+)\\s*(hPa|Pa|mbar|bar)\\s*$")),
				QRegularExpression(QStringLiteral("^([\\d.,-]+)\\s*(lx|lux)\\s*$")),
				QRegularExpression(QStringLiteral("^([\\d.,-]+)\\s*(dB|dBm)\\s*$")),
				QRegularExpression(QStringLiteral("^([\\d.,-]+)\\s*(V|mV|A|mA|W|kW|kWh|Wh)\\s*$")),
				QRegularExpression(QStringLiteral("^([\\d.,-]+)\\s*(ppm|ppb|ug/m3|mg/m3)\\s*$")),
				QRegularExpression(QStringLiteral("^([\\d.,-]+)\\s*(mm|cm|m|km|in|ft)\\s*$")),
				QRegularExpression(QStringLiteral("^([\\d.,-]+)\\s*(s|ms|min|h)\\s*$")),
				QRegularExpression(QStringLiteral("^([\\d.,-]+)\\s*([a-zA-Z/]+)\\s*$")),
		};

		for (const QRegularExpression& re : patterns) {
				const QRegularExpressionMatch m = re.match(text);
				if (m.hasMatch())
						return {m.captured(1), m.captured(2)};
		}
		return {text, QString()};
}

static SensorInfo makeSensor(const QString& id, const QString& name, const QString& stateText)
{
		const auto su = splitStateUnit(stateText);
		SensorInfo s;
		s.id    = id;
		s.name  = name;
		s.state = su.first;
		s.unit  = su.second;
		return s;
}

QList<SensorInfo> parseSensorsFromPage(const QString& html)
{
		QList<SensorInfo> sensors;
		QSet<QString> seen;

		static const QList<QRegularExpression> entityPatterns = {
				QRegularExpression(
						QStringLiteral("id=[\"'](?:sensor|number|text_sensor|binary_sensor)-([^\"']+)[\"'][^>]*>([^<]*)<"),
						QRegularExpression::CaseInsensitiveOption),
				QRegularExpression(
						QStringLiteral("<(?:span|td|div)[^>]*class=[\"'][^\"']*state[^\"']*[\"'][^>]*id=[\"']([^\"']+)[\"'][^>]*>([^<]*)<"),
						QRegularExpression::CaseInsensitiveOption),
		};

		for (const QRegularExpression& re : entityPatterns) {
				auto it = re.globalMatch(html);
				while (it.hasNext()) {
						const auto m = it.next();
						const QString id    = m.captured(1).trimmed();
						const QString state = m.captured(2).trimmed();
						if (id.isEmpty() || state.isEmpty() || seen.contains(id))
								continue;
						seen.insert(id);
						sensors.append(makeSensor(id, titleFromId(id), state));
				}
		}

		// web_server v3 embeds state objects in the page
		static const QRegularExpression jsonRe(
				QStringLiteral("\"id\"\\s*:\\s*\"([^\"]+)\"\\s*,\\s*\"state\"\\s*:\\s*\"([^\"]*)\""));
		auto jit = jsonRe.globalMatch(html);
		while (jit.hasNext()) {
				const auto m = jit.next();
				const QString id = m.captured(1).trimmed();
				if (id.isEmpty() || seen.contains(id))
						continue;
				seen.insert(id);
				sensors.append(makeSensor(id, titleFromId(id), m.captured(2).trimmed()));
		}

		// older firmware renders <tr><td>Name</td><td>Value</td></tr>
		static const QRegularExpression rowRe(
				QStringLiteral("<tr[^>]*>\\s*<td[^>]*>([^<]+)</td>\\s*<td[^>]*>([^<]+)</td>"),
				QRegularExpression::CaseInsensitiveOption);
		static const QSet<QString> headerWords = {
				QStringLiteral("name"), QStringLiteral("entity"), QStringLiteral("sensor"),
				QStringLiteral("state"), QStringLiteral("value"), QStringLiteral("type"),
		};
		auto rit = rowRe.globalMatch(html);
		while (rit.hasNext()) {
				const auto m = rit.next();
				const QString name = m.captured(1).trimmed();
				if (headerWords.contains(name.toLower()))
						continue;

				const QString id = name.toLower().replace(QLatin1Char(' '), QLatin1Char('_'));
				if (seen.contains(id))
						continue;

				SensorInfo s = makeSensor(id, name, m.captured(2).trimmed());
				if (s.state.isEmpty() || s.state.compare(QLatin1String("n/a"), Qt::CaseInsensitive) == 0
						|| s.state == QLatin1String("-"))
						continue;
				seen.insert(id);
				sensors.append(s);
		}

		return sensors;
}

QList<SensorInfo> parseEventStream(const QString& text)
{
		QList<SensorInfo> sensors;
		const QStringList lines = text.split(QLatin1Char('\n'));
		for (const QString& raw : lines) {
				const QString line = raw.trimmed();
				if (!line.startsWith(QLatin1String("data:")))
						continue;

				QJsonParseError perr;
				const QJsonDocument doc = QJsonDocument::fromJson(line.mid(5).trimmed().toUtf8(), &perr);
				if (perr.error != QJsonParseError::NoError || !doc.isObject())
						continue;

				const QJsonObject o = doc.object();
				if (!o.contains(QStringLiteral("id")))
						continue;

				const QString id = o.value(QStringLiteral("id")).toString();
				QJsonValue v = o.value(QStringLiteral("state"));
				if (v.isUndefined()) v = o.value(QStringLiteral("value"));
				const QString state = v.isString() ? v.toString() : v.toVariant().toString();

				sensors.append(makeSensor(id, titleFromId(id), state));
		}
		return sensors;
}

}		// namespace DeviceMetadata


MetadataFetcher::MetadataFetcher(QObject* parent) : QObject(parent) {}

void MetadataFetcher::applyAuth_(QNetworkRequest& req, const MetadataRequest& request)
{
		if (request.username.isEmpty() || request.password.isEmpty())
				return;
		const QByteArray token = (request.username + QLatin1Char(':') + request.password).toUtf8().toBase64();
		req.setRawHeader("Authorization", "Basic " + token);
}

void MetadataFetcher::fetch(const MetadataRequest& request, Callback cb)
{
		QNetworkRequest req{QUrl(QStringLiteral("http://%1:%2/").arg(request.host).arg(request.webPort))};
		req.setTransferTimeout(request.timeoutMs);
		applyAuth_(req, request);

		QNetworkReply* reply = nam_.get(req);
		connect(reply, &QNetworkReply::finished, this, [this, reply, request, cb] {
				reply->deleteLater();

				MetadataResult result;
				const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
				if (status == 200) {
						const QString html = QString::fromUtf8(reply->readAll());
						result.ok         = true;
						result.macAddress = DeviceMetadata::parseMacAddress(html);
						result.sensors    = DeviceMetadata::parseSensorsFromPage(html);
				} else if (status > 0) {
						result.error = QStringLiteral("web page returned HTTP %1").arg(status);
				} else {
						result.error = QStringLiteral("web page unreachable: %1").arg(reply->errorString());
				}

				qCDebug(LC_SCAN) << "[metadata]" << request.host << request.webPort
								 << "mac=" << result.macAddress << "sensors=" << result.sensors.size()
								 << "error=" << result.error;

				if (result.sensors.isEmpty()) {
						fetchEvents_(request, result, cb);
						return;
				}
				if (cb) cb(result);
		});
}

void MetadataFetcher::fetchEvents_(const MetadataRequest& request, MetadataResult partial, Callback cb)
{
		QNetworkRequest req{QUrl(QStringLiteral("http://%1:%2/events").arg(request.host).arg(request.webPort))};
		req.setRawHeader("Accept", "text/event-stream");
		applyAuth_(req, request);

		QNetworkReply* reply = nam_.get(req);
		auto buffer = std::make_shared<QByteArray>();
		auto done   = std::make_shared<bool>(false);
		auto* timer = new QTimer(reply);
		timer->setSingleShot(true);

		// The stream never ends on its own: stop at the size limit or the timeout
		auto finish = [reply, buffer, done, partial, cb]() mutable {
				if (*done) return;
				*done = true;

				const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
				if (status == 200)
						partial.sensors = DeviceMetadata::parseEventStream(QString::fromUtf8(*buffer));
				else if (partial.error.isEmpty() && !partial.ok)
						partial.error = QStringLiteral("/events unavailable: %1").arg(reply->errorString());

				reply->abort();
				reply->deleteLater();
				if (cb) cb(partial);
		};

		connect(reply, &QNetworkReply::readyRead, this, [reply, buffer, finish]() mutable {
				buffer->append(reply->readAll());
				if (buffer->size() >= flasher::EVENTS_READ_LIMIT) {
						buffer->truncate(flasher::EVENTS_READ_LIMIT);
						finish();
				}
		});
		connect(reply, &QNetworkReply::finished, this, [finish]() mutable { finish(); });
		connect(timer, &QTimer::timeout, this, [finish]() mutable { finish(); });
		timer->start(request.timeoutMs);
}
