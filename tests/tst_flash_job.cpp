#include <QtTest>

#include <QSignalSpy>
#include <QTemporaryDir>

#include "HttpFixture.hpp"
#include "logger.hpp"
#include "ops/FlashJob.hpp"
#include "ops/OperationTracker.hpp"

using States::OperationKind;
using States::OperationStatus;

class TestFlashJob : public QObject {
		Q_OBJECT
private slots:
		void initTestCase();
		void successfulFlashCompletesOperation();
		void rejectedFlashFailsOperation();
		void jobStartsOnlyOnce();

private:
		QString writeImage(const QByteArray& data);
		QTemporaryDir dir_;
};

void TestFlashJob::initTestCase()
{
		QVERIFY(dir_.isValid());
		Logger::setDirectory(dir_.filePath(QStringLiteral("log")).toStdString());
}

QString TestFlashJob::writeImage(const QByteArray& data)
{
		const QString path = dir_.filePath(QStringLiteral("firmware.bin"));
		QFile f(path);
		if (f.open(QIODevice::WriteOnly | QIODevice::Truncate))
				f.write(data);
		return path;
}

void TestFlashJob::successfulFlashCompletesOperation()
{
		HttpFixture ota;
		QVERIFY(ota.start());
		ota.setDefaultReply(200, "OK");

		OperationTracker tracker;
		OtaUploader uploader;
		const Operation op = tracker.create(OperationKind::Flash, QStringLiteral("kitchen"));

		FlashJobParams p;
		p.operationId  = op.id;
		p.deviceName   = QStringLiteral("kitchen");
		p.firmwarePath = writeImage(QByteArray(8192, 'f'));
		p.host         = QStringLiteral("127.0.0.1");
		p.otaPort      = ota.serverPort();
		p.timeoutMs    = 5000;

		FlashJob job(p, tracker, uploader);
		QSignalSpy finished(&job, &FlashJob::finished);
		job.start();
		QCOMPARE(tracker.get(op.id)->status, OperationStatus::Running);

		QTRY_COMPARE_WITH_TIMEOUT(finished.count(), 1, 10000);
		QCOMPARE(finished.first().at(0).toString(), op.id);
		QVERIFY(finished.first().at(1).toBool());

		const Operation done = *tracker.get(op.id);
		QCOMPARE(done.status, OperationStatus::Success);
		QCOMPARE(done.progress, 100);
		QCOMPARE(done.firmwarePath, p.firmwarePath);
		QVERIFY(done.logs.contains(QStringLiteral("Preparing upload...")));
		QVERIFY(done.logs.contains(QStringLiteral("Firmware flashed successfully")));
		QVERIFY(QFile::exists(dir_.filePath(QStringLiteral("log/flasher.log"))));
}

void TestFlashJob::rejectedFlashFailsOperation()
{
		HttpFixture ota;
		QVERIFY(ota.start());
		ota.setDefaultReply(500, "boom");

		OperationTracker tracker;
		OtaUploader uploader;
		const Operation op = tracker.create(OperationKind::Flash, QStringLiteral("porch"));

		FlashJobParams p;
		p.operationId  = op.id;
		p.deviceName   = QStringLiteral("porch");
		p.firmwarePath = writeImage(QByteArray(1024, 'f'));
		p.host         = QStringLiteral("127.0.0.1");
		p.otaPort      = ota.serverPort();
		p.timeoutMs    = 5000;

		FlashJob job(p, tracker, uploader);
		QSignalSpy finished(&job, &FlashJob::finished);
		job.start();
		QTRY_COMPARE_WITH_TIMEOUT(finished.count(), 1, 10000);
		QVERIFY(!finished.first().at(1).toBool());

		const Operation done = *tracker.get(op.id);
		QCOMPARE(done.status, OperationStatus::Failed);
		QVERIFY(done.message.contains(QStringLiteral("500")));
		QVERIFY(done.progress < 100);
}

void TestFlashJob::jobStartsOnlyOnce()
{
		OperationTracker tracker;
		OtaUploader uploader;
		const Operation op = tracker.create(OperationKind::Flash, QStringLiteral("x"));

		FlashJobParams p;
		p.operationId  = op.id;
		p.deviceName   = QStringLiteral("x");
		p.firmwarePath = dir_.filePath(QStringLiteral("absent.bin"));
		p.host         = QStringLiteral("127.0.0.1");
		p.otaPort      = 1;

		FlashJob job(p, tracker, uploader);
		QSignalSpy finished(&job, &FlashJob::finished);
		job.start();
		job.start();
		QTRY_COMPARE(finished.count(), 1);
		QCOMPARE(tracker.get(op.id)->status, OperationStatus::Failed);
		QVERIFY(tracker.get(op.id)->message.contains(QStringLiteral("not found")));
}

QTEST_GUILESS_MAIN(TestFlashJob)
#include "tst_flash_job.moc"
