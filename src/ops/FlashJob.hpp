#pragma once
#include <optional>

#include <QObject>
#include <QString>

#include "include/flasher_params.hpp"
#include "ota/OtaUploader.hpp"

class OperationTracker;

struct FlashJobParams {
		QString operationId;
		QString deviceName;
		QString firmwarePath;
		QString host;
		int otaPort = 0;
		std::optional<FallbackTarget> fallback;
		bool streamed = false;
		int chunkSize = flasher::FLASH_CHUNK_SIZE;
		int timeoutMs = flasher::FLASH_TIMEOUT_MS;
};

// Runs one flash operation to completion. The job is the only writer of
// its operation record: running on start, progress while uploading, then
// success or failed.
class FlashJob : public QObject {
		Q_OBJECT
public:
		FlashJob(FlashJobParams params, OperationTracker& tracker, OtaUploader& uploader,
				 QObject* parent = nullptr);

		void start();

		const QString& operationId() const { return params_.operationId; }

signals:
		void finished(const QString& operationId, bool success);

private:
		void onProgress_(const FlashProgress& p);
		void onDone_(const FlashResult& r);
		void appendLog_(const QString& line);

		FlashJobParams params_;
		OperationTracker& tracker_;
		OtaUploader& uploader_;
		bool started_ = false;
		QString lastMessage_;
};
