#include "LivenessProber.hpp"

#include <memory>

#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTcpSocket>
#include <QTimer>
#include <QUrl>

#include "log/flasher_logging.hpp"

LivenessProber::LivenessProber(ProbeOptions options, QObject* parent)
		: QObject(parent), options_(options)
{
		if (options_.attempts < 1) options_.attempts = 1;
}

void LivenessProber::checkOtaPort(const QString& host, int port, ProbeCallback cb)
{
		tcpAttempt_(host, port, options_.attempts, std::move(cb));
}

void LivenessProber::checkApiPort(const QString& host, int port, ProbeCallback cb)
{
		tcpAttempt_(host, port, options_.attempts, std::move(cb));
}

void LivenessProber::checkWeb(const QString& host, int port, ProbeCallback cb)
{
		const QString url = QStringLiteral("http://%1:%2/").arg(host).arg(port);
		httpAttempt_(url, options_.attempts, [](int) { return true; }, std::move(cb));
}

void LivenessProber::checkOtaEndpoint(const QString& host, int port, ProbeCallback cb)
{
		const QString url = QStringLiteral("http://%1:%2/update").arg(host).arg(port);
		httpAttempt_(url, 1, [](int status) { return status == 200 || status == 405; }, std::move(cb));
}

void LivenessProber::retryOrFinish_(bool ok, int attemptsLeft, std::function<void()> retry, const ProbeCallback& cb)
{
		if (ok || attemptsLeft <= 1) {
				if (cb) cb(ok);
				return;
		}
		QTimer::singleShot(options_.retryDelayMs, this, std::move(retry));
}

void LivenessProber::tcpAttempt_(const QString& host, int port, int attemptsLeft, ProbeCallback cb)
{
		if (port < 1 || port > 65535) {
				QTimer::singleShot(0, this, [cb] { if (cb) cb(false); });
				return;
		}

		auto* sock  = new QTcpSocket(this);
		auto* timer = new QTimer(sock);
		timer->setSingleShot(true);
		auto done = std::make_shared<bool>(false);

		auto finish = [this, sock, timer, done, host, port, attemptsLeft, cb](bool ok) {
				if (*done) return;
				*done = true;
				timer->stop();
				sock->abort();
				sock->deleteLater();

				qCDebug(LC_SCAN) << "[tcp]" << host << port << (ok ? "open" : "closed")
								 << "attemptsLeft=" << attemptsLeft;
				retryOrFinish_(ok, attemptsLeft,
							   [this, host, port, attemptsLeft, cb] { tcpAttempt_(host, port, attemptsLeft - 1, cb); },
							   cb);
		};

		connect(sock, &QTcpSocket::connected, sock, [finish] { finish(true); });
		connect(sock, &QAbstractSocket::errorOccurred, sock,
				[finish](QAbstractSocket::SocketError) { finish(false); });
		connect(timer, &QTimer::timeout, sock, [finish] { finish(false); });

		timer->start(options_.timeoutMs);
		sock->connectToHost(host, static_cast<quint16>(port));
}

void LivenessProber::httpAttempt_(const QString& url, int attemptsLeft,
								  std::function<bool(int status)> accept, ProbeCallback cb)
{
		QNetworkRequest req{QUrl(url)};
		req.setTransferTimeout(options_.timeoutMs);
		req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);

		QNetworkReply* reply = nam_.get(req);
		connect(reply, &QNetworkReply::finished, this, [this, reply, url, attemptsLeft, accept, cb] {
				reply->deleteLater();

				const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
				const bool ok = status.isValid() && accept(status.toInt());

				qCDebug(LC_SCAN) << "[http]" << url << "status=" << status.toInt()
								 << "error=" << reply->errorString() << "ok=" << ok;
				retryOrFinish_(ok, attemptsLeft,
							   [this, url, attemptsLeft, accept, cb] { httpAttempt_(url, attemptsLeft - 1, accept, cb); },
							   cb);
		});
}
