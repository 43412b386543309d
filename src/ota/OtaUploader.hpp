#pragma once
#include <functional>
#include <memory>
#include <optional>

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QObject>
#include <QString>

#include "include/flasher_params.hpp"

class QNetworkReply;

struct FlashProgress {
		int     percent = 0;
		qint64  bytesSent = 0;
		qint64  totalBytes = 0;
		QString message;
};

enum class FlashError { None, FileNotFound, ConnectionFailed, Timeout, HttpStatus, Transport };

struct FlashResult {
		bool       success = false;
		QString    message;
		FlashError error = FlashError::None;
};

// Secondary path: the web_server's /update with HTTP Basic auth
struct FallbackTarget {
		int     webPort = 0;
		QString username;
		QString password;

		bool isUsable() const { return webPort > 0 && !username.isEmpty() && !password.isEmpty(); }
};

struct FlashRequest {
		QByteArray firmware;
		QString    fileName = QStringLiteral("firmware.bin");
		QString    host;
		int        otaPort = 0;
		int        timeoutMs = flasher::FLASH_TIMEOUT_MS;
		std::optional<FallbackTarget> fallback;
};

QString toString(FlashError e);

// HTTP OTA delivery. POST multipart "firmware" to http://host:otaPort/update
// with an X-MD5 header; on any failure optionally repeats the upload against
// the web_server port with Basic auth. Never throws: every outcome is a
// FlashResult. Progress handed to the callback never goes backwards.
class OtaUploader : public QObject {
		Q_OBJECT
public:
		using ProgressCallback = std::function<void(const FlashProgress&)>;
		using ResultCallback   = std::function<void(const FlashResult&)>;

		explicit OtaUploader(QObject* parent = nullptr);

		void flash(const FlashRequest& request, ProgressCallback onProgress, ResultCallback onDone);

		// Same as flash(), image read from disk
		void flashFile(const QString& path, const QString& host, int otaPort,
					   const std::optional<FallbackTarget>& fallback,
					   ProgressCallback onProgress, ResultCallback onDone,
					   int timeoutMs = flasher::FLASH_TIMEOUT_MS);

		// Raw octet-stream body pulled from the file chunkSize bytes at a time.
		// Progress is proportional to bytes handed to the socket. No fallback.
		void flashStreamed(const QString& path, const QString& host, int otaPort,
						   ProgressCallback onProgress, ResultCallback onDone,
						   int chunkSize = flasher::FLASH_CHUNK_SIZE,
						   int timeoutMs = flasher::FLASH_TIMEOUT_MS);

		static QString md5Hex(const QByteArray& data);
		static QString md5HexOfFile(const QString& path, bool* ok = nullptr);

private:
		class ProgressReporter;
		struct Attempt {
				QString url;
				QString label;
				QByteArray authorization;
		};

		void upload_(const FlashRequest& request, const QString& md5, const Attempt& attempt,
					 const std::shared_ptr<ProgressReporter>& progress, ResultCallback onDone);
		static FlashResult classify_(QNetworkReply* reply, const QString& label);
		static QByteArray basicAuth_(const QString& user, const QString& password);

		QNetworkAccessManager nam_;
};
