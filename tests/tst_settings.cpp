#include <QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "config/Settings.hpp"

class TestSettings : public QObject {
		Q_OBJECT
private slots:
		void init();
		void cleanup();
		void compiledDefaults();
		void fileOverridesDefaults();
		void environmentOverridesFile();
};

void TestSettings::init()
{
		qunsetenv("DDNS_HOST");
		qunsetenv("FLASHER_CONFIG_DIR");
		qunsetenv("FLASHER_SCAN_INTERVAL");
}

void TestSettings::cleanup()
{
		init();
}

void TestSettings::compiledDefaults()
{
		const Settings s = Settings::defaults();
		QCOMPARE(s.ddnsHost, QStringLiteral("esp32gb.ddns.net"));
		QCOMPARE(s.ports.webBase, 8000);
		QCOMPARE(s.ports.otaBase, 8200);
		QCOMPARE(s.ports.apiBase, 6000);
		QCOMPARE(s.discoveryFirstPort, 8201);
		QCOMPARE(s.discoveryLastPort, 8299);
		QCOMPARE(s.statusLogMaxEntries, 500);
		QCOMPARE(s.scanIntervalSec, 60);
		QVERIFY(s.registryPath().endsWith(QStringLiteral("boards.json")));
}

void TestSettings::fileOverridesDefaults()
{
		QTemporaryDir dir;
		QFile f(dir.filePath(QStringLiteral("flasher.ini")));
		QVERIFY(f.open(QIODevice::WriteOnly));
		f.write("[general]\nddns_host=fleet.example.org\n"
				"[ports]\nota_base=9200\n"
				"[scan]\nprobe_timeout_ms=750\ninterval_sec=abc\n"
				"[discovery]\nbatch_size=0\n");
		f.close();

		const Settings s = Settings::load(dir.path());
		QCOMPARE(s.configDir, dir.path());
		QCOMPARE(s.ddnsHost, QStringLiteral("fleet.example.org"));
		QCOMPARE(s.ports.otaBase, 9200);
		QCOMPARE(s.ports.webBase, 8000);
		QCOMPARE(s.probeTimeoutMs, 750);
		QCOMPARE(s.scanIntervalSec, 60);
		QCOMPARE(s.discoveryBatchSize, 1);
		QCOMPARE(s.statusLogPath(), dir.filePath(QStringLiteral("board_status_log.json")));
}

void TestSettings::environmentOverridesFile()
{
		QTemporaryDir dir;
		QFile f(dir.filePath(QStringLiteral("flasher.ini")));
		QVERIFY(f.open(QIODevice::WriteOnly));
		f.write("[general]\nddns_host=fleet.example.org\n");
		f.close();

		qputenv("FLASHER_CONFIG_DIR", dir.path().toUtf8());
		qputenv("DDNS_HOST", "override.example.com");
		qputenv("FLASHER_SCAN_INTERVAL", "15");

		const Settings s = Settings::load();
		QCOMPARE(s.configDir, dir.path());
		QCOMPARE(s.ddnsHost, QStringLiteral("override.example.com"));
		QCOMPARE(s.scanIntervalSec, 15);
}

QTEST_APPLESS_MAIN(TestSettings)
#include "tst_settings.moc"
