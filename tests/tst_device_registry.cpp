#include <QtTest>

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "store/DeviceRegistry.hpp"

class TestDeviceRegistry : public QObject {
		Q_OBJECT
private slots:
		void missingFileIsEmpty();
		void saveAndReload();
		void rejectsDuplicatesAndBadIds();
		void renameKeepsIdUnique();
		void scanResultsFoldIn();
		void autoRegisterNamesBoards();
		void corruptFileFailsLoad();

private:
		static Device board(const QString& name, int id)
		{
				Device d;
				d.name = name;
				d.id   = id;
				return d;
		}
};

void TestDeviceRegistry::missingFileIsEmpty()
{
		QTemporaryDir dir;
		DeviceRegistry reg(dir.filePath(QStringLiteral("boards.json")));
		QVERIFY(reg.load());
		QVERIFY(reg.devices().isEmpty());
}

void TestDeviceRegistry::saveAndReload()
{
		QTemporaryDir dir;
		const QString path = dir.filePath(QStringLiteral("sub/boards.json"));

		DeviceRegistry reg(path);
		Device d = board(QStringLiteral("cactus-kitchen"), 7);
		d.type        = QStringLiteral("esp32s3");
		d.webUsername = QStringLiteral("admin");
		d.webPassword = QStringLiteral("secret");
		d.sensors     = { SensorInfo{QStringLiteral("temp"), QStringLiteral("Temp"), QStringLiteral("21"), QStringLiteral("°C")} };
		QVERIFY(reg.addDevice(d));
		QVERIFY(reg.save());

		QFile f(path);
		QVERIFY(f.open(QIODevice::ReadOnly));
		const QJsonObject entry = QJsonDocument::fromJson(f.readAll()).object()
										  .value("boards").toObject().value("cactus-kitchen").toObject();
		QCOMPARE(entry.value("id").toInt(), 7);
		QCOMPARE(entry.value("web_username").toString(), QStringLiteral("admin"));
		QVERIFY(entry.value("host").isNull());

		DeviceRegistry again(path);
		QVERIFY(again.load());
		const std::optional<Device> back = again.find(QStringLiteral("cactus-kitchen"));
		QVERIFY(back.has_value());
		QCOMPARE(back->type, QStringLiteral("esp32s3"));
		QVERIFY(back->hasWebCredentials());
		QCOMPARE(back->sensors.size(), 1);
		QCOMPARE(again.knownIds(), QSet<int>{7});
}

void TestDeviceRegistry::rejectsDuplicatesAndBadIds()
{
		DeviceRegistry reg(QStringLiteral("/nonexistent/boards.json"));
		QString err;
		QVERIFY(reg.addDevice(board(QStringLiteral("a"), 1), &err));
		QVERIFY(!reg.addDevice(board(QStringLiteral("a"), 2), &err));
		QVERIFY(err.contains(QStringLiteral("already exists")));
		QVERIFY(!reg.addDevice(board(QStringLiteral("b"), 1), &err));
		QCOMPARE(err, QStringLiteral("Board ID 1 is already used by 'a'"));
		QVERIFY(!reg.addDevice(board(QStringLiteral("c"), 100), &err));
		QVERIFY(!reg.addDevice(board(QStringLiteral(" "), 5), &err));
		QCOMPARE(reg.devices().size(), 1);
}

void TestDeviceRegistry::renameKeepsIdUnique()
{
		DeviceRegistry reg(QStringLiteral("/nonexistent/boards.json"));
		QVERIFY(reg.addDevice(board(QStringLiteral("a"), 1)));
		QVERIFY(reg.addDevice(board(QStringLiteral("b"), 2)));

		QVERIFY(reg.updateDevice(QStringLiteral("a"), board(QStringLiteral("renamed"), 1)));
		QVERIFY(!reg.find(QStringLiteral("a")));
		QVERIFY(reg.find(QStringLiteral("renamed")));

		QString err;
		QVERIFY(!reg.updateDevice(QStringLiteral("renamed"), board(QStringLiteral("renamed"), 2), &err));
		QVERIFY(!reg.updateDevice(QStringLiteral("missing"), board(QStringLiteral("x"), 3), &err));
		QVERIFY(reg.removeDevice(QStringLiteral("b")));
		QVERIFY(!reg.removeDevice(QStringLiteral("b")));
}

void TestDeviceRegistry::scanResultsFoldIn()
{
		DeviceRegistry reg(QStringLiteral("/nonexistent/boards.json"));
		Device withMac = board(QStringLiteral("a"), 1);
		withMac.macAddress = QStringLiteral("AA:AA:AA:AA:AA:AA");
		QVERIFY(reg.addDevice(withMac));
		QVERIFY(reg.addDevice(board(QStringLiteral("b"), 2)));

		ScanResult ra;
		ra.name       = QStringLiteral("a");
		ra.macAddress = QStringLiteral("BB:BB:BB:BB:BB:BB");
		ScanResult rb;
		rb.name       = QStringLiteral("b");
		rb.online     = true;
		rb.macAddress = QStringLiteral("CC:CC:CC:CC:CC:CC");

		QVERIFY(!reg.applyScanResults({ra}));
		QCOMPARE(reg.find(QStringLiteral("a"))->macAddress, QStringLiteral("AA:AA:AA:AA:AA:AA"));

		const QDateTime now = QDateTime::currentDateTimeUtc();
		QVERIFY(reg.applyScanResults({ra, rb}, now));
		QCOMPARE(reg.find(QStringLiteral("b"))->macAddress, QStringLiteral("CC:CC:CC:CC:CC:CC"));
		QCOMPARE(reg.find(QStringLiteral("b"))->lastSeen, now);
		QVERIFY(!reg.find(QStringLiteral("a"))->lastSeen.isValid());
}

void TestDeviceRegistry::autoRegisterNamesBoards()
{
		DeviceRegistry reg(QStringLiteral("/nonexistent/boards.json"));
		QVERIFY(reg.addDevice(board(QStringLiteral("board-03"), 5)));

		DiscoveredDevice known;  known.id = 5;  known.isNew = false;
		DiscoveredDevice fresh;  fresh.id = 4;  fresh.isNew = true;
		DiscoveredDevice clash;  clash.id = 3;  clash.isNew = true;

		const QStringList added = reg.autoRegister({known, fresh, clash});
		QCOMPARE(added, QStringList{QStringLiteral("board-04")});
		QCOMPARE(reg.find(QStringLiteral("board-04"))->id, 4);
}

void TestDeviceRegistry::corruptFileFailsLoad()
{
		QTemporaryDir dir;
		const QString path = dir.filePath(QStringLiteral("boards.json"));
		QFile f(path);
		QVERIFY(f.open(QIODevice::WriteOnly));
		f.write("{ not json");
		f.close();

		DeviceRegistry reg(path);
		QVERIFY(!reg.load());
}

QTEST_APPLESS_MAIN(TestDeviceRegistry)
#include "tst_device_registry.moc"
