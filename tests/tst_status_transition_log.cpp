#include <QtTest>

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <memory>

#include "store/StatusTransitionLog.hpp"

using States::DeviceEvent;

class TestStatusTransitionLog : public QObject {
		Q_OBJECT
private slots:
		void init();
		void sameEventIsWrittenOnce();
		void firstOfflineIsRecorded();
		void capDropsOldestEntries();
		void queryIsNewestFirstAndFiltered();
		void documentLayout();
		void reportsUnwritableFile();
		void unreadableFileIsLeftUntouched();

private:
		QString path() const { return dir_->filePath(QStringLiteral("board_status_log.json")); }
		std::unique_ptr<QTemporaryDir> dir_;
};

void TestStatusTransitionLog::init()
{
		dir_ = std::make_unique<QTemporaryDir>();
		QVERIFY(dir_->isValid());
}

void TestStatusTransitionLog::sameEventIsWrittenOnce()
{
		StatusTransitionLog log(path());
		QVERIFY(log.recordIfChanged(QStringLiteral("a"), DeviceEvent::Online, QStringLiteral("OTA:OK WEB:OK API:OK")));
		QVERIFY(!log.recordIfChanged(QStringLiteral("a"), DeviceEvent::Online, QStringLiteral("OTA:OK WEB:OK API:OK")));
		QCOMPARE(log.query(100).size(), 1);

		QVERIFY(log.recordIfChanged(QStringLiteral("a"), DeviceEvent::Offline, QStringLiteral("OTA:FAIL WEB:FAIL API:FAIL")));
		QCOMPARE(log.query(100).size(), 2);
		QCOMPARE(log.lastStatuses().value(QStringLiteral("a")), QStringLiteral("offline"));
}

void TestStatusTransitionLog::firstOfflineIsRecorded()
{
		StatusTransitionLog log(path());
		bool persisted = false;
		QVERIFY(log.recordIfChanged(QStringLiteral("new"), DeviceEvent::Offline, QString(), &persisted));
		QVERIFY(persisted);
}

void TestStatusTransitionLog::capDropsOldestEntries()
{
		StatusTransitionLog log(path(), 5);
		for (int i = 0; i < 6; ++i) {
				const DeviceEvent ev = (i % 2 == 0) ? DeviceEvent::Online : DeviceEvent::Offline;
				QVERIFY(log.recordIfChanged(QStringLiteral("a"), ev, QString::number(i)));
		}
		const QList<StatusLogEntry> entries = log.query(100);
		QCOMPARE(entries.size(), 5);
		QCOMPARE(entries.first().details, QStringLiteral("5"));
		QCOMPARE(entries.last().details, QStringLiteral("1"));
}

void TestStatusTransitionLog::queryIsNewestFirstAndFiltered()
{
		StatusTransitionLog log(path());
		log.recordIfChanged(QStringLiteral("a"), DeviceEvent::Online, QStringLiteral("1"));
		log.recordIfChanged(QStringLiteral("b"), DeviceEvent::Online, QStringLiteral("2"));
		log.recordIfChanged(QStringLiteral("a"), DeviceEvent::Offline, QStringLiteral("3"));

		const QList<StatusLogEntry> onlyA = log.query(10, QStringLiteral("a"));
		QCOMPARE(onlyA.size(), 2);
		QCOMPARE(onlyA.at(0).details, QStringLiteral("3"));
		QCOMPARE(onlyA.at(1).details, QStringLiteral("1"));

		QCOMPARE(log.query(1).size(), 1);
		QCOMPARE(log.query(1).first().deviceName, QStringLiteral("a"));
		QVERIFY(log.query(0).isEmpty());
}

void TestStatusTransitionLog::documentLayout()
{
		StatusTransitionLog log(path());
		log.recordIfChanged(QStringLiteral("kitchen"), DeviceEvent::Online, QStringLiteral("OTA:OK WEB:FAIL API:OK"));

		QFile f(path());
		QVERIFY(f.open(QIODevice::ReadOnly));
		const QJsonObject root = QJsonDocument::fromJson(f.readAll()).object();
		QCOMPARE(root.value("last_status").toObject().value("kitchen").toString(), QStringLiteral("online"));

		const QJsonObject entry = root.value("logs").toArray().first().toObject();
		QCOMPARE(entry.value("board_name").toString(), QStringLiteral("kitchen"));
		QCOMPARE(entry.value("event").toString(), QStringLiteral("online"));
		QCOMPARE(entry.value("details").toString(), QStringLiteral("OTA:OK WEB:FAIL API:OK"));
		QVERIFY(QDateTime::fromString(entry.value("timestamp").toString(), Qt::ISODateWithMs).isValid());
}

void TestStatusTransitionLog::reportsUnwritableFile()
{
		// parent is a regular file, so the log cannot be created
		const QString blocker = dir_->filePath(QStringLiteral("blocker"));
		QFile f(blocker);
		QVERIFY(f.open(QIODevice::WriteOnly));
		f.close();

		StatusTransitionLog log(blocker + QStringLiteral("/log.json"));
		bool persisted = true;
		QVERIFY(log.recordIfChanged(QStringLiteral("a"), DeviceEvent::Online, QString(), &persisted));
		QVERIFY(!persisted);
}

void TestStatusTransitionLog::unreadableFileIsLeftUntouched()
{
		const QByteArray garbage("{\"last_status\": {\"a\": \"online\"}, \"logs\": [{garbage");
		QFile f(path());
		QVERIFY(f.open(QIODevice::WriteOnly));
		f.write(garbage);
		f.close();

		StatusTransitionLog log(path());
		bool persisted = true;
		QVERIFY(!log.recordIfChanged(QStringLiteral("a"), DeviceEvent::Offline, QString(), &persisted));
		QVERIFY(!persisted);
		QVERIFY(log.query(10).isEmpty());
		QVERIFY(log.lastStatuses().isEmpty());

		QVERIFY(f.open(QIODevice::ReadOnly));
		QCOMPARE(f.readAll(), garbage);
}

QTEST_APPLESS_MAIN(TestStatusTransitionLog)
#include "tst_status_transition_log.moc"
