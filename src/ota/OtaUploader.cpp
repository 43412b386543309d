#include "OtaUploader.hpp"

#include <QCryptographicHash>
#include <QFile>
#include <QFileInfo>
#include <QHttpMultiPart>
#include <QHttpPart>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include "ChunkedFileDevice.hpp"
#include "log/flasher_logging.hpp"

QString toString(FlashError e)
{
		switch (e) {
			case FlashError::None:             return QStringLiteral("none");
			case FlashError::FileNotFound:     return QStringLiteral("file_not_found");
			case FlashError::ConnectionFailed: return QStringLiteral("connection_failed");
			case FlashError::Timeout:          return QStringLiteral("timeout");
			case FlashError::HttpStatus:       return QStringLiteral("http_status");
			case FlashError::Transport:        return QStringLiteral("transport");
		}
		return QStringLiteral("unknown");
}

// Forwards progress to the caller, holding the percentage at its high-water mark
class OtaUploader::ProgressReporter {
public:
		explicit ProgressReporter(ProgressCallback cb) : cb_(std::move(cb)) {}

		void report(int percent, const QString& message, qint64 sent = 0, qint64 total = 0)
		{
				last_.percent = qBound(last_.percent, percent, 100);
				if (!message.isEmpty())
						last_.message = message;
				if (total > 0) {
						last_.bytesSent  = sent;
						last_.totalBytes = total;
				}
				if (cb_) cb_(last_);
		}

		int percent() const { return last_.percent; }

private:
		ProgressCallback cb_;
		FlashProgress last_;
};

OtaUploader::OtaUploader(QObject* parent) : QObject(parent) {}

QString OtaUploader::md5Hex(const QByteArray& data)
{
		return QString::fromLatin1(QCryptographicHash::hash(data, QCryptographicHash::Md5).toHex());
}

QString OtaUploader::md5HexOfFile(const QString& path, bool* ok)
{
		QFile f(path);
		QCryptographicHash hash(QCryptographicHash::Md5);
		const bool good = f.open(QIODevice::ReadOnly) && hash.addData(&f);
		if (ok) *ok = good;
		return good ? QString::fromLatin1(hash.result().toHex()) : QString();
}

QByteArray OtaUploader::basicAuth_(const QString& user, const QString& password)
{
		return "Basic " + QStringLiteral("%1:%2").arg(user, password).toUtf8().toBase64();
}

FlashResult OtaUploader::classify_(QNetworkReply* reply, const QString& label)
{
		FlashResult r;
		const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);

		if (status.isValid()) {
				const int code = status.toInt();
				if (code == 200) {
						r.success = true;
						r.message = QStringLiteral("Firmware flashed successfully");
						return r;
				}
				r.error   = FlashError::HttpStatus;
				r.message = QStringLiteral("Flash failed: HTTP %1 - %2")
								.arg(code)
								.arg(QString::fromUtf8(reply->readAll().left(200)).trimmed());
				return r;
		}

		switch (reply->error()) {
			case QNetworkReply::OperationCanceledError:
			case QNetworkReply::TimeoutError:
					r.error   = FlashError::Timeout;
					r.message = QStringLiteral("Flash timed out (%1)").arg(label);
					break;
			case QNetworkReply::ConnectionRefusedError:
			case QNetworkReply::RemoteHostClosedError:
			case QNetworkReply::HostNotFoundError:
			case QNetworkReply::NetworkSessionFailedError:
			case QNetworkReply::TemporaryNetworkFailureError:
					r.error   = FlashError::ConnectionFailed;
					r.message = QStringLiteral("Connection failed (%1): %2").arg(label, reply->errorString());
					break;
			default:
					r.error   = FlashError::Transport;
					r.message = QStringLiteral("Upload error (%1): %2").arg(label, reply->errorString());
					break;
		}
		return r;
}

void OtaUploader::upload_(const FlashRequest& request, const QString& md5, const Attempt& attempt,
						  const std::shared_ptr<ProgressReporter>& progress, ResultCallback onDone)
{
		progress->report(10, QStringLiteral("Connecting to board (%1)...").arg(attempt.label));

		auto* multipart = new QHttpMultiPart(QHttpMultiPart::FormDataType);
		QHttpPart part;
		part.setHeader(QNetworkRequest::ContentDispositionHeader,
					   QStringLiteral("form-data; name=\"firmware\"; filename=\"%1\"").arg(request.fileName));
		part.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/octet-stream"));
		part.setBody(request.firmware);
		multipart->append(part);

		QNetworkRequest req{QUrl(attempt.url)};
		req.setRawHeader("X-MD5", md5.toLatin1());
		if (!attempt.authorization.isEmpty())
				req.setRawHeader("Authorization", attempt.authorization);
		req.setTransferTimeout(request.timeoutMs);

		qCInfo(LC_OTA) << "[upload]" << attempt.url << "bytes=" << request.firmware.size() << "md5=" << md5;

		QNetworkReply* reply = nam_.post(req, multipart);
		multipart->setParent(reply);

		const QString label = attempt.label;
		auto uploading = std::make_shared<bool>(false);
		connect(reply, &QNetworkReply::uploadProgress, this,
				[progress, label, uploading](qint64 sent, qint64 total) {
						if (total <= 0) return;
						if (!*uploading) {
								*uploading = true;
								progress->report(50, QStringLiteral("Uploading firmware (%1)...").arg(label), sent, total);
						}
						progress->report(50 + static_cast<int>(sent * 45 / total), QString(), sent, total);
				});

		connect(reply, &QNetworkReply::finished, this, [reply, label, onDone] {
				reply->deleteLater();
				const FlashResult r = classify_(reply, label);
				qCInfo(LC_OTA) << "[upload]" << label << (r.success ? "ok" : "failed") << r.message;
				if (onDone) onDone(r);
		});
}

void OtaUploader::flash(const FlashRequest& request, ProgressCallback onProgress, ResultCallback onDone)
{
		auto progress = std::make_shared<ProgressReporter>(std::move(onProgress));
		const QString md5 = md5Hex(request.firmware);
		progress->report(0, QStringLiteral("Preparing upload..."));

		Attempt primary;
		primary.url   = QStringLiteral("http://%1:%2/update").arg(request.host).arg(request.otaPort);
		primary.label = QStringLiteral("OTA port %1").arg(request.otaPort);

		upload_(request, md5, primary, progress,
				[this, request, md5, progress, onDone](const FlashResult& first) {
						if (first.success) {
								progress->report(100, QStringLiteral("Flash successful! Board is rebooting..."));
								if (onDone) onDone(first);
								return;
						}
						if (!request.fallback || !request.fallback->isUsable()) {
								if (onDone) onDone(first);
								return;
						}

						const FallbackTarget fb = *request.fallback;
						qCWarning(LC_OTA) << "[flash] OTA port failed:" << first.message
										  << "- falling back to web_server port" << fb.webPort;
						progress->report(progress->percent(),
										 QStringLiteral("OTA port failed, trying web_server port %1...").arg(fb.webPort));

						Attempt secondary;
						secondary.url           = QStringLiteral("http://%1:%2/update").arg(request.host).arg(fb.webPort);
						secondary.label         = QStringLiteral("web_server port %1").arg(fb.webPort);
						secondary.authorization = basicAuth_(fb.username, fb.password);

						upload_(request, md5, secondary, progress,
								[progress, first, fb, onDone](const FlashResult& second) {
										FlashResult r = second;
										if (second.success) {
												r.message = QStringLiteral("%1 (via web_server fallback on port %2)")
																.arg(second.message)
																.arg(fb.webPort);
												progress->report(100, QStringLiteral("Flash successful! Board is rebooting..."));
										} else {
												r.message = QStringLiteral("OTA failed: %1 | Web fallback failed: %2")
																.arg(first.message, second.message);
										}
										if (onDone) onDone(r);
								});
				});
}

void OtaUploader::flashFile(const QString& path, const QString& host, int otaPort,
							const std::optional<FallbackTarget>& fallback,
							ProgressCallback onProgress, ResultCallback onDone, int timeoutMs)
{
		QFile f(path);
		if (!f.exists() || !f.open(QIODevice::ReadOnly)) {
				FlashResult r;
				r.error   = FlashError::FileNotFound;
				r.message = QStringLiteral("Firmware file not found: %1").arg(path);
				qCWarning(LC_OTA) << "[flashFile]" << r.message;
				QTimer::singleShot(0, this, [r, onDone] { if (onDone) onDone(r); });
				return;
		}

		FlashRequest req;
		req.firmware  = f.readAll();
		req.fileName  = QFileInfo(path).fileName();
		req.host      = host;
		req.otaPort   = otaPort;
		req.timeoutMs = timeoutMs;
		req.fallback  = fallback;
		flash(req, std::move(onProgress), std::move(onDone));
}

void OtaUploader::flashStreamed(const QString& path, const QString& host, int otaPort,
								ProgressCallback onProgress, ResultCallback onDone,
								int chunkSize, int timeoutMs)
{
		auto progress = std::make_shared<ProgressReporter>(std::move(onProgress));

		bool hashed = false;
		const QString md5 = md5HexOfFile(path, &hashed);
		auto* body = new ChunkedFileDevice(path, chunkSize);
		if (!hashed || !body->open(QIODevice::ReadOnly)) {
				FlashResult r;
				if (!QFileInfo::exists(path)) {
						r.error   = FlashError::FileNotFound;
						r.message = QStringLiteral("Firmware file not found: %1").arg(path);
				} else {
						r.error   = FlashError::Transport;
						r.message = QStringLiteral("Cannot read firmware %1: %2").arg(path, body->errorText());
				}
				delete body;
				qCWarning(LC_OTA) << "[flashStreamed]" << r.message;
				QTimer::singleShot(0, this, [r, onDone] { if (onDone) onDone(r); });
				return;
		}

		progress->report(0, QStringLiteral("Preparing upload..."));

		const QString label = QStringLiteral("OTA port %1").arg(otaPort);
		const QString url   = QStringLiteral("http://%1:%2/update").arg(host).arg(otaPort);

		QNetworkRequest req{QUrl(url)};
		req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/octet-stream"));
		req.setHeader(QNetworkRequest::ContentLengthHeader, body->size());
		req.setRawHeader("X-MD5", md5.toLatin1());
		req.setTransferTimeout(timeoutMs);

		progress->report(10, QStringLiteral("Connecting to board (%1)...").arg(label));
		qCInfo(LC_OTA) << "[stream]" << url << "bytes=" << body->size() << "chunk=" << chunkSize;

		QNetworkReply* reply = nam_.post(req, body);
		body->setParent(reply);

		connect(body, &ChunkedFileDevice::chunkRead, this, [progress, label](qint64 read, qint64 total) {
				if (total <= 0) return;
				const int pct = qMin(99, static_cast<int>(read * 100 / total));
				progress->report(pct, QStringLiteral("Uploading firmware (%1)...").arg(label), read, total);
		});

		connect(reply, &QNetworkReply::finished, this, [reply, label, progress, onDone] {
				reply->deleteLater();
				const FlashResult r = classify_(reply, label);
				qCInfo(LC_OTA) << "[stream]" << label << (r.success ? "ok" : "failed") << r.message;
				if (r.success)
						progress->report(100, QStringLiteral("Flash successful! Board is rebooting..."));
				if (onDone) onDone(r);
		});
}
