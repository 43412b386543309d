#pragma once
#include <functional>
#include <memory>

#include <QList>
#include <QMap>
#include <QObject>
#include <QString>

#include "include/types.hpp"
#include "net/AddressResolver.hpp"

class LivenessProber;
class MetadataFetcher;

// Probes every registered device concurrently. One ScanResult per device is
// always produced; a device whose pipeline faults is reported offline with
// its error text instead of aborting the batch.
class FleetScanner : public QObject {
		Q_OBJECT
public:
		using BatchCallback  = std::function<void(const QList<ScanResult>&)>;
		using DeviceCallback = std::function<void(const ScanResult&)>;

		FleetScanner(const AddressResolver& resolver, LivenessProber* prober,
					 MetadataFetcher* fetcher = nullptr, QObject* parent = nullptr);

		// Results follow the map's key order
		void scanAll(const QMap<QString, Device>& devices, BatchCallback cb);
		void scanOne(const Device& device, DeviceCallback cb);

		void setMetadataEnabled(bool on) { metadataEnabled_ = on; }
		void setMetadataTimeout(int ms) { metadataTimeoutMs_ = ms; }

signals:
		void deviceScanned(const ScanResult& result);

private:
		struct DeviceScan;

		void stepDone_(const std::shared_ptr<DeviceScan>& scan);
		void deliver_(const std::shared_ptr<DeviceScan>& scan);

		AddressResolver resolver_;
		LivenessProber* prober_;
		MetadataFetcher* fetcher_;
		bool metadataEnabled_ = true;
		int metadataTimeoutMs_ = flasher::METADATA_TIMEOUT_MS;
};
