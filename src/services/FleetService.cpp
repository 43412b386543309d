#include "FleetService.hpp"

#include <QFileInfo>

#include "log/SystemLogger.hpp"
#include "log/flasher_logging.hpp"
#include "logger.hpp"
#include "ops/FlashJob.hpp"

static ProbeOptions scanProbeOptions(const Settings& s)
{
		ProbeOptions o;
		o.timeoutMs    = s.probeTimeoutMs;
		o.retryDelayMs = s.probeRetryDelayMs;
		o.attempts     = flasher::PROBE_ATTEMPTS;
		return o;
}

// Same OTA-port check as a scan, with the shorter discovery timeout
static ProbeOptions discoveryProbeOptions(const Settings& s)
{
		ProbeOptions o;
		o.timeoutMs    = s.discoveryTimeoutMs;
		o.retryDelayMs = s.probeRetryDelayMs;
		o.attempts     = flasher::PROBE_ATTEMPTS;
		return o;
}

static OperationTracker::Limits trackerLimits(const Settings& s)
{
		OperationTracker::Limits l;
		l.maxEntries = s.operationMaxEntries;
		l.maxAgeSecs = s.operationMaxAgeSec;
		return l;
}

FleetService::FleetService(const Settings& settings, QObject* parent)
		: QObject(parent),
		  settings_(settings),
		  resolver_(settings_),
		  scanProber_(scanProbeOptions(settings_)),
		  discoveryProber_(discoveryProbeOptions(settings_)),
		  scanner_(resolver_, &scanProber_, &fetcher_),
		  discoverer_(resolver_, &discoveryProber_),
		  registry_(settings_.registryPath()),
		  statusLog_(settings_.statusLogPath(), settings_.statusLogMaxEntries),
		  tracker_(trackerLimits(settings_))
{
		qRegisterMetaType<ScanResult>("ScanResult");
		qRegisterMetaType<ScanCycleReport>("ScanCycleReport");
		qRegisterMetaType<DiscoveryReport>("DiscoveryReport");

		scanner_.setMetadataEnabled(settings_.metadataEnabled);
		scanner_.setMetadataTimeout(settings_.metadataTimeoutMs);

		pollTimer_.setInterval(qMax(1, settings_.scanIntervalSec) * 1000);
		connect(&pollTimer_, &QTimer::timeout, this, &FleetService::runScanCycle);
}

void FleetService::runScanCycle()
{
		if (scanning_) {
				qCInfo(LC_SCAN) << "[runScanCycle] previous cycle still running, skipping";
				ScanCycleReport report;
				report.skipped = true;
				emit scanCycleFinished(report);
				return;
		}
		scanning_ = true;

		registryLoadOk_ = registry_.load();
		if (!registryLoadOk_)
				SystemLogger::error("STORE", "Registry unreadable", registry_.filePath());

		qCInfo(LC_SCAN) << "[runScanCycle] scanning" << registry_.devices().size() << "device(s)";
		scanner_.scanAll(registry_.devices(), [this](const QList<ScanResult>& results) {
				finishScanCycle_(results);
		});
}

void FleetService::finishScanCycle_(const QList<ScanResult>& results)
{
		ScanCycleReport report;
		report.results        = results;
		report.registryLoaded = registryLoadOk_;

		int online = 0;
		for (const ScanResult& r : results) {
				if (r.online) ++online;

				bool persisted = true;
				if (statusLog_.recordIfChanged(r.name, r.event(), r.details(), &persisted)) {
						report.transitions.append(r.name);
						const QString line = QStringLiteral("%1 is %2 (%3)")
												 .arg(r.name, States::toString(r.event()), r.details());
						Logger::write(line.toStdString());
						SystemLogger::info("SCAN", line, r.error);
				}
				if (!persisted) {
						report.logFailures.append(r.name);
						SystemLogger::warn("STORE", QStringLiteral("Status log write failed for %1").arg(r.name),
										   statusLog_.filePath());
				}
				if (!r.metadataError.isEmpty())
						qCDebug(LC_SCAN) << "[finishScanCycle]" << r.name << "metadata:" << r.metadataError;
		}

		// Fold into the registry as it is now; it may have been edited during the scan
		const bool reloaded = registry_.load();
		if (!reloaded)
				SystemLogger::error("STORE", "Registry unreadable after scan", registry_.filePath());
		report.registryLoaded = registryLoadOk_ && reloaded;

		report.registryChanged = registry_.applyScanResults(results);
		if (report.registryChanged) {
				if (!reloaded) {
						// Never overwrite a registry that could not be read
						report.registrySaveFailed = true;
				} else if (!registry_.save()) {
						report.registrySaveFailed = true;
						SystemLogger::error("STORE", "Registry write failed", registry_.filePath());
				}
		}

		LOG_INFO(QString("scan cycle: %1/%2 online, %3 transition(s)")
				 .arg(online).arg(results.size()).arg(report.transitions.size()));

		scanning_ = false;
		emit scanCycleFinished(report);
}

void FleetService::ping(const QString& name, FleetScanner::DeviceCallback cb)
{
		if (!registry_.load())
				qCWarning(LC_STORE) << "[ping] registry unreadable";

		const std::optional<Device> device = registry_.find(name);
		if (!device) {
				ScanResult r;
				r.name  = name;
				r.error = QStringLiteral("Board '%1' not found").arg(name);
				QTimer::singleShot(0, this, [r, cb] { if (cb) cb(r); });
				return;
		}
		scanner_.scanOne(*device, std::move(cb));
}

void FleetService::runDiscovery(bool autoRegister)
{
		const bool loaded = registry_.load();
		if (!loaded)
				qCWarning(LC_DISCOVER) << "[runDiscovery] registry unreadable, all hits reported as new";

		DiscoveryRange range;
		range.firstPort = settings_.discoveryFirstPort;
		range.lastPort  = settings_.discoveryLastPort;
		range.batchSize = settings_.discoveryBatchSize;

		discoverer_.discover(settings_.ddnsHost, range, registry_.knownIds(),
							 [this, autoRegister, loaded](const QList<DiscoveredDevice>& found) {
				DiscoveryReport report;
				report.devices = found;

				if (autoRegister && loaded) {
						report.autoRegistered = registry_.autoRegister(found);
						if (!report.autoRegistered.isEmpty() && !registry_.save())
								report.registrySaveFailed = true;
				}

				int fresh = 0;
				for (const DiscoveredDevice& d : found)
						if (d.isNew) ++fresh;

				Logger::writef("discovery: %d board(s), %d new", static_cast<int>(found.size()), fresh);
				SystemLogger::info("DISCOVER",
								   QStringLiteral("Found %1 board(s), %2 new").arg(found.size()).arg(fresh),
								   report.autoRegistered.join(QLatin1Char(',')));
				emit discoveryFinished(report);
		});
}

QString FleetService::startFlash(const QString& name, const QString& firmwarePath, bool streamed, QString* error)
{
		auto fail = [error](const QString& msg) {
				if (error) *error = msg;
				LOG_WARN(msg);
				return QString();
		};

		if (!registry_.load())
				return fail(QStringLiteral("Registry unreadable: %1").arg(registry_.filePath()));

		const std::optional<Device> device = registry_.find(name);
		if (!device)
				return fail(QStringLiteral("Board '%1' not found").arg(name));
		if (!QFileInfo::exists(firmwarePath))
				return fail(QStringLiteral("Firmware file not found: %1").arg(firmwarePath));

		DeviceAddress addr;
		try {
				addr = resolver_.resolve(*device);
		} catch (const InvalidIdentifier& e) {
				return fail(QString::fromUtf8(e.what()));
		}

		const Operation op = tracker_.create(States::OperationKind::Flash, name);

		FlashJobParams p;
		p.operationId  = op.id;
		p.deviceName   = name;
		p.firmwarePath = firmwarePath;
		p.host         = addr.host;
		p.otaPort      = addr.otaPort;
		p.streamed     = streamed;
		p.chunkSize    = settings_.flashChunkSize;
		p.timeoutMs    = settings_.flashTimeoutMs;
		if (device->hasWebCredentials())
				p.fallback = FallbackTarget{addr.webPort, device->webUsername, device->webPassword};

		auto* job = new FlashJob(p, tracker_, uploader_, this);
		connect(job, &FlashJob::finished, this, [this, job](const QString& id, bool ok) {
				job->deleteLater();
				emit flashFinished(id, ok);
		});
		job->start();
		return op.id;
}

QList<StatusLogEntry> FleetService::statusLog(int limit, const QString& deviceName) const
{
		return statusLog_.query(limit, deviceName);
}

void FleetService::startPolling()
{
		SystemLogger::purgeOlderThan(settings_.systemLogRetentionDays);
		SystemLogger::info("APP", QStringLiteral("Polling every %1 s").arg(settings_.scanIntervalSec));
		pollTimer_.start();
		runScanCycle();
}

void FleetService::stopPolling()
{
		pollTimer_.stop();
}
