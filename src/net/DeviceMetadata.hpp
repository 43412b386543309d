#pragma once
#include <functional>

#include <QList>
#include <QNetworkAccessManager>
#include <QObject>
#include <QPair>
#include <QString>

#include "include/flasher_params.hpp"
#include "include/types.hpp"

// Scrapers for the ESPHome web_server page and its /events stream
namespace DeviceMetadata {
	// First aa:bb:cc:dd:ee:ff in the page, upper-cased; empty if none
	QString parseMacAddress(const QString& html);

	// Entity ids (sensor-/number-/text_sensor-/binary_sensor-), state spans,
	// embedded {"id":..,"state":..} objects and two-column table rows
	QList<SensorInfo> parseSensorsFromPage(const QString& html);

	// "data: {json}" lines of a server-sent-events chunk
	QList<SensorInfo> parseEventStream(const QString& text);

	// "22.5 °C" -> ("22.5", "°C"), "on" -> ("on", "")
	QPair<QString, QString> splitStateUnit(const QString& stateText);

	// "living_room-temp" -> "Living Room Temp"
	QString titleFromId(const QString& entityId);
}

struct MetadataRequest {
		QString host;
		int     webPort = 0;
		QString username;
		QString password;
		int     timeoutMs = flasher::METADATA_TIMEOUT_MS;
};

struct MetadataResult {
		bool              ok = false;		// main page fetched
		QString           error;
		QString           macAddress;
		QList<SensorInfo> sensors;
};

// Best-effort metadata fetch. Never fails the caller: transport or parse
// problems are reported in MetadataResult::error.
class MetadataFetcher : public QObject {
		Q_OBJECT
public:
		using Callback = std::function<void(const MetadataResult&)>;

		explicit MetadataFetcher(QObject* parent = nullptr);

		void fetch(const MetadataRequest& request, Callback cb);

private:
		void fetchEvents_(const MetadataRequest& request, MetadataResult partial, Callback cb);
		static void applyAuth_(QNetworkRequest& req, const MetadataRequest& request);

		QNetworkAccessManager nam_;
};
