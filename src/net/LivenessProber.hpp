#pragma once
#include <functional>

#include <QNetworkAccessManager>
#include <QObject>
#include <QString>

#include "include/flasher_params.hpp"

struct ProbeOptions {
		int timeoutMs    = flasher::PROBE_TIMEOUT_MS;
		int retryDelayMs = flasher::PROBE_RETRY_DELAY_MS;
		int attempts     = flasher::PROBE_ATTEMPTS;		// first try + retries
};

// Reachability checks against one device. Every outcome is delivered
// asynchronously as a bool; failures never escape as errors.
class LivenessProber : public QObject {
		Q_OBJECT
public:
		using ProbeCallback = std::function<void(bool reachable)>;

		explicit LivenessProber(ProbeOptions options = ProbeOptions{}, QObject* parent = nullptr);

		// Bare TCP connect, no bytes are written. The OTA listener treats any
		// non-protocol byte as a framing error.
		void checkOtaPort(const QString& host, int port, ProbeCallback cb);
		void checkApiPort(const QString& host, int port, ProbeCallback cb);

		// GET http://host:port/ ; any HTTP status counts as reachable
		void checkWeb(const QString& host, int port, ProbeCallback cb);

		// GET /update ; available on 200 or 405
		void checkOtaEndpoint(const QString& host, int port, ProbeCallback cb);

		const ProbeOptions& options() const { return options_; }

private:
		void tcpAttempt_(const QString& host, int port, int attemptsLeft, ProbeCallback cb);
		void httpAttempt_(const QString& url, int attemptsLeft,
						  std::function<bool(int status)> accept, ProbeCallback cb);
		void retryOrFinish_(bool ok, int attemptsLeft, std::function<void()> retry, const ProbeCallback& cb);

		ProbeOptions options_;
		QNetworkAccessManager nam_;
};
