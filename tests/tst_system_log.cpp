#include <QtTest>

#include <QTemporaryDir>

#include "log/SystemLogger.hpp"
#include "services/QSqliteService.hpp"
#include "services/SqlCommon.hpp"

class TestSystemLog : public QObject {
		Q_OBJECT
private slots:
		void initTestCase();
		void insertAndFilter();
		void purgeDropsOldRows();
		void loggerWritesThroughWorkerThread();

private:
		QTemporaryDir dir_;
};

void TestSystemLog::initTestCase()
{
		QVERIFY(dir_.isValid());
		SqlCommon::setDbFilePath(dir_.filePath(QStringLiteral("db/test.db")));
		QSqliteService svc;
		QVERIFY(svc.initializeDatabase());
}

void TestSystemLog::insertAndFilter()
{
		QSqliteService svc;
		const QDateTime now = QDateTime::currentDateTime();
		QVERIFY(svc.insertSystemLog(1, QStringLiteral("SCAN"), QStringLiteral("kitchen is online"), now));
		QVERIFY(svc.insertSystemLog(3, QStringLiteral("OTA"), QStringLiteral("Flash of porch failed"), now,
									QStringLiteral("timeout")));

		QVector<SystemLogRow> rows;
		int total = 0;
		QVERIFY(svc.selectSystemLogs(0, 50, 2, QString(), QString(), &rows, &total));
		QCOMPARE(total, 1);
		QCOMPARE(rows.size(), 1);
		QCOMPARE(rows.first().tag, QStringLiteral("OTA"));
		QCOMPARE(rows.first().extra, QStringLiteral("timeout"));
		QCOMPARE(rows.first().toJson().value("level").toInt(), 3);

		QVERIFY(svc.selectSystemLogs(0, 50, 0, QStringLiteral("SCA"), QString(), &rows, &total));
		QCOMPARE(rows.size(), 1);
		QCOMPARE(rows.first().message, QStringLiteral("kitchen is online"));
}

void TestSystemLog::purgeDropsOldRows()
{
		QSqliteService svc;
		QVERIFY(svc.insertSystemLog(1, QStringLiteral("OLD"), QStringLiteral("stale"),
									QDateTime::currentDateTime().addDays(-40)));

		QCOMPARE(svc.purgeSystemLogsBefore(QDateTime::currentDateTime().addDays(-30)), 1);

		QVector<SystemLogRow> rows;
		int total = 0;
		QVERIFY(svc.selectSystemLogs(0, 50, 0, QStringLiteral("OLD"), QString(), &rows, &total));
		QCOMPARE(total, 0);
}

void TestSystemLog::loggerWritesThroughWorkerThread()
{
		QVERIFY(!SystemLogger::isRunning());
		SystemLogger::init();
		QVERIFY(SystemLogger::isRunning());
		SystemLogger::warn(QStringLiteral("DISCOVER"), QStringLiteral("Found 2 board(s), 1 new"), QStringLiteral("board-07"));

		QSqliteService svc;
		QVector<SystemLogRow> rows;
		int total = 0;
		QTRY_VERIFY((svc.selectSystemLogs(0, 10, 0, QStringLiteral("DISCOVER"), QString(), &rows, &total), total == 1));
		QCOMPARE(rows.first().level, static_cast<int>(SysLogLevel::Warn));
		QCOMPARE(rows.first().extra, QStringLiteral("board-07"));

		SystemLogger::shutdown();
		QVERIFY(!SystemLogger::isRunning());
}

QTEST_GUILESS_MAIN(TestSystemLog)
#include "tst_system_log.moc"
