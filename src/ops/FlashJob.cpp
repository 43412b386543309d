#include "FlashJob.hpp"

#include <QDateTime>

#include "log/SystemLogger.hpp"
#include "logger.hpp"
#include "ops/OperationTracker.hpp"

using States::OperationStatus;

FlashJob::FlashJob(FlashJobParams params, OperationTracker& tracker, OtaUploader& uploader, QObject* parent)
		: QObject(parent), params_(std::move(params)), tracker_(tracker), uploader_(uploader)
{
}

void FlashJob::appendLog_(const QString& line)
{
		const QString stamped = QStringLiteral("[%1] %2")
									.arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss")), line);
		tracker_.update(params_.operationId, [&](Operation& op) {
				if (!op.logs.isEmpty()) op.logs += QLatin1Char('\n');
				op.logs += stamped;
		});
}

void FlashJob::start()
{
		if (started_) {
				LOG_WARN(QString("flash job %1 already started").arg(params_.operationId));
				return;
		}
		started_ = true;

		const bool ok = tracker_.update(params_.operationId, [this](Operation& op) {
				op.status       = OperationStatus::Running;
				op.deviceName   = params_.deviceName;
				op.firmwarePath = params_.firmwarePath;
				op.message      = QStringLiteral("Starting flash");
		});
		if (!ok) {
				LOG_WARN(QString("flash job %1: operation not startable").arg(params_.operationId));
				emit finished(params_.operationId, false);
				return;
		}

		LOG_INFO(QString("flash %1 -> %2:%3 (%4)")
				 .arg(params_.deviceName, params_.host)
				 .arg(params_.otaPort)
				 .arg(params_.streamed ? QStringLiteral("streamed") : QStringLiteral("multipart")));
		appendLog_(QStringLiteral("Flashing %1 to %2").arg(params_.firmwarePath, params_.deviceName));

		auto progress = [this](const FlashProgress& p) { onProgress_(p); };
		auto done     = [this](const FlashResult& r) { onDone_(r); };

		if (params_.streamed) {
				uploader_.flashStreamed(params_.firmwarePath, params_.host, params_.otaPort,
										progress, done, params_.chunkSize, params_.timeoutMs);
		} else {
				uploader_.flashFile(params_.firmwarePath, params_.host, params_.otaPort, params_.fallback,
									progress, done, params_.timeoutMs);
		}
}

void FlashJob::onProgress_(const FlashProgress& p)
{
		const bool newMessage = p.message != lastMessage_;
		lastMessage_ = p.message;

		tracker_.update(params_.operationId, [&p](Operation& op) {
				op.progress = p.percent;
				op.message  = p.message;
		});
		if (newMessage && !p.message.isEmpty())
				appendLog_(p.message);
}

void FlashJob::onDone_(const FlashResult& r)
{
		appendLog_(r.message);
		tracker_.update(params_.operationId, [&r](Operation& op) {
				op.status  = r.success ? OperationStatus::Success : OperationStatus::Failed;
				op.message = r.message;
				if (r.success) op.progress = 100;
		});

		const QString line = QStringLiteral("flash %1 %2: %3")
								 .arg(params_.deviceName,
							  r.success ? QStringLiteral("ok") : QStringLiteral("failed"), r.message);
		Logger::write(line.toStdString());
		if (r.success)
				SystemLogger::info("OTA", QStringLiteral("Flashed %1").arg(params_.deviceName), r.message);
		else
				SystemLogger::error("OTA", QStringLiteral("Flash of %1 failed").arg(params_.deviceName),
									QStringLiteral("%1: %2").arg(toString(r.error), r.message));

		emit finished(params_.operationId, r.success);
}
