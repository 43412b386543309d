#pragma once
#include <functional>
#include <memory>
#include <optional>

#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include "config/Settings.hpp"
#include "include/types.hpp"
#include "net/AddressResolver.hpp"
#include "net/DeviceMetadata.hpp"
#include "net/LivenessProber.hpp"
#include "ops/OperationTracker.hpp"
#include "ota/OtaUploader.hpp"
#include "scan/FleetScanner.hpp"
#include "scan/NetworkDiscoverer.hpp"
#include "store/DeviceRegistry.hpp"
#include "store/StatusTransitionLog.hpp"

struct ScanCycleReport {
		QList<ScanResult> results;
		QStringList transitions;			// devices whose status changed this cycle
		QStringList logFailures;			// transitions that could not be persisted
		bool registryLoaded = true;
		bool registryChanged = false;
		bool registrySaveFailed = false;
		bool skipped = false;				// another cycle was still running
};

struct DiscoveryReport {
		QList<DiscoveredDevice> devices;
		QStringList autoRegistered;
		bool registrySaveFailed = false;
};

// Wires the components together: scan cycles, discovery, single-device
// ping, flash operations and periodic polling.
class FleetService : public QObject {
		Q_OBJECT
public:
		explicit FleetService(const Settings& settings, QObject* parent = nullptr);

		void runScanCycle();
		void runDiscovery(bool autoRegister);
		void ping(const QString& name, FleetScanner::DeviceCallback cb);

		// Returns the operation id, or an empty string with *error set
		QString startFlash(const QString& name, const QString& firmwarePath, bool streamed,
						   QString* error = nullptr);

		QList<StatusLogEntry> statusLog(int limit, const QString& deviceName = QString()) const;
		std::optional<Operation> operation(const QString& id) const { return tracker_.get(id); }
		QList<Operation> operations() const { return tracker_.list(); }

		void startPolling();
		void stopPolling();
		bool isScanning() const { return scanning_; }

		const Settings& settings() const { return settings_; }
		const ProbeOptions& discoveryOptions() const { return discoveryProber_.options(); }

signals:
		void scanCycleFinished(const ScanCycleReport& report);
		void discoveryFinished(const DiscoveryReport& report);
		void flashFinished(const QString& operationId, bool success);

private:
		void finishScanCycle_(const QList<ScanResult>& results);

		Settings settings_;
		AddressResolver resolver_;
		LivenessProber scanProber_;
		LivenessProber discoveryProber_;
		MetadataFetcher fetcher_;
		FleetScanner scanner_;
		NetworkDiscoverer discoverer_;
		DeviceRegistry registry_;
		StatusTransitionLog statusLog_;
		OperationTracker tracker_;
		OtaUploader uploader_;
		QTimer pollTimer_;
		bool scanning_ = false;
		bool registryLoadOk_ = true;
};

Q_DECLARE_METATYPE(ScanCycleReport)
Q_DECLARE_METATYPE(DiscoveryReport)
