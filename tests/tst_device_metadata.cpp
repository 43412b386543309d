#include <QtTest>

#include "net/DeviceMetadata.hpp"

using namespace DeviceMetadata;

class TestDeviceMetadata : public QObject {
		Q_OBJECT
private slots:
		void macAddressIsUpperCased();
		void splitsStateAndUnit_data();
		void splitsStateAndUnit();
		void titleFromEntityId();
		void sensorsFromEntityIds();
		void sensorsFromTableRows();
		void sensorsAreDeduplicated();
		void eventStream();
};

void TestDeviceMetadata::macAddressIsUpperCased()
{
		QCOMPARE(parseMacAddress(QStringLiteral("<td>MAC</td><td>a4:cf:12:0b:9e:01</td>")),
				 QStringLiteral("A4:CF:12:0B:9E:01"));
		QVERIFY(parseMacAddress(QStringLiteral("<html>no mac</html>")).isEmpty());
}

void TestDeviceMetadata::splitsStateAndUnit_data()
{
		QTest::addColumn<QString>("text");
		QTest::addColumn<QString>("state");
		QTest::addColumn<QString>("unit");

		QTest::newRow("celsius")  << QString::fromUtf8("22.5 °C") << "22.5" << QString::fromUtf8("°C");
		QTest::newRow("percent")  << "48%"      << "48"    << "%";
		QTest::newRow("pressure") << "1013 hPa" << "1013"  << "hPa";
		QTest::newRow("signal")   << "-67 dBm"  << "-67"   << "dBm";
		QTest::newRow("word")     << "on"       << "on"    << "";
		QTest::newRow("empty")    << ""         << ""      << "";
}

void TestDeviceMetadata::splitsStateAndUnit()
{
		QFETCH(QString, text);
		QFETCH(QString, state);
		QFETCH(QString, unit);
		const auto su = splitStateUnit(text);
		QCOMPARE(su.first, state);
		QCOMPARE(su.second, unit);
}

void TestDeviceMetadata::titleFromEntityId()
{
		QCOMPARE(titleFromId(QStringLiteral("living_room-temp")), QStringLiteral("Living Room Temp"));
		QCOMPARE(titleFromId(QStringLiteral("wifi_signal")), QStringLiteral("Wifi Signal"));
}

void TestDeviceMetadata::sensorsFromEntityIds()
{
		const QString html = QString::fromUtf8(
				"<span id=\"sensor-temperature\">21.0 °C</span>"
				"<span id=\"binary_sensor-door\">OFF</span>");
		const QList<SensorInfo> s = parseSensorsFromPage(html);
		QCOMPARE(s.size(), 2);
		QCOMPARE(s.at(0).id, QStringLiteral("temperature"));
		QCOMPARE(s.at(0).name, QStringLiteral("Temperature"));
		QCOMPARE(s.at(0).state, QStringLiteral("21.0"));
		QCOMPARE(s.at(0).unit, QString::fromUtf8("°C"));
		QCOMPARE(s.at(1).id, QStringLiteral("door"));
		QCOMPARE(s.at(1).state, QStringLiteral("OFF"));
}

void TestDeviceMetadata::sensorsFromTableRows()
{
		const QString html = QStringLiteral(
				"<table><tr><th>Name</th><th>State</th></tr>"
				"<tr><td>Name</td><td>Value</td></tr>"
				"<tr><td>Soil Moisture</td><td>37 %</td></tr>"
				"<tr><td>Battery</td><td>n/a</td></tr></table>");
		const QList<SensorInfo> s = parseSensorsFromPage(html);
		QCOMPARE(s.size(), 1);
		QCOMPARE(s.first().id, QStringLiteral("soil_moisture"));
		QCOMPARE(s.first().name, QStringLiteral("Soil Moisture"));
		QCOMPARE(s.first().state, QStringLiteral("37"));
		QCOMPARE(s.first().unit, QStringLiteral("%"));
}

void TestDeviceMetadata::sensorsAreDeduplicated()
{
		const QString html = QStringLiteral(
				"<span id=\"sensor-humidity\">40%</span>"
				"<script>var s = {\"id\":\"humidity\",\"state\":\"41%\"};"
				"var t = {\"id\":\"uptime\",\"state\":\"120 s\"};</script>");
		const QList<SensorInfo> s = parseSensorsFromPage(html);
		QCOMPARE(s.size(), 2);
		QCOMPARE(s.at(0).state, QStringLiteral("40"));
		QCOMPARE(s.at(1).id, QStringLiteral("uptime"));
		QCOMPARE(s.at(1).unit, QStringLiteral("s"));
}

void TestDeviceMetadata::eventStream()
{
		const QString text = QStringLiteral(
				"event: state\n"
				"data: {\"id\":\"sensor-temp\",\"value\":21.5,\"state\":\"21.5 C\"}\n\n"
				"event: ping\n"
				"data: {\"title\":\"cactus\"}\n\n"
				"data: not json\n");
		const QList<SensorInfo> s = parseEventStream(text);
		QCOMPARE(s.size(), 1);
		QCOMPARE(s.first().id, QStringLiteral("sensor-temp"));
		QCOMPARE(s.first().state, QStringLiteral("21.5"));
		QCOMPARE(s.first().unit, QStringLiteral("C"));
}

QTEST_APPLESS_MAIN(TestDeviceMetadata)
#include "tst_device_metadata.moc"
