#include "FleetScanner.hpp"

#include <QTimer>

#include "log/flasher_logging.hpp"
#include "net/DeviceMetadata.hpp"
#include "net/LivenessProber.hpp"

struct FleetScanner::DeviceScan {
		Device device;
		ScanResult result;
		int pending = 0;
		DeviceCallback cb;
};

FleetScanner::FleetScanner(const AddressResolver& resolver, LivenessProber* prober,
						   MetadataFetcher* fetcher, QObject* parent)
		: QObject(parent), resolver_(resolver), prober_(prober), fetcher_(fetcher)
{
}

void FleetScanner::scanAll(const QMap<QString, Device>& devices, BatchCallback cb)
{
		if (devices.isEmpty()) {
				QTimer::singleShot(0, this, [cb] { if (cb) cb({}); });
				return;
		}

		struct Batch {
				QList<ScanResult> results;
				int pending = 0;
				BatchCallback cb;
		};
		auto batch = std::make_shared<Batch>();
		batch->results.resize(devices.size());
		batch->pending = devices.size();
		batch->cb = std::move(cb);

		qCDebug(LC_SCAN) << "[scanAll] devices=" << devices.size();

		int index = 0;
		for (auto it = devices.cbegin(); it != devices.cend(); ++it, ++index) {
				Device d = it.value();
				if (d.name.isEmpty()) d.name = it.key();

				scanOne(d, [batch, index](const ScanResult& r) {
						batch->results[index] = r;
						if (--batch->pending == 0 && batch->cb)
								batch->cb(batch->results);
				});
		}
}

void FleetScanner::scanOne(const Device& device, DeviceCallback cb)
{
		auto scan = std::make_shared<DeviceScan>();
		scan->device = device;
		scan->cb = std::move(cb);

		ScanResult& r = scan->result;
		r.name       = device.name;
		r.id         = device.id;
		r.type       = device.type;
		r.macAddress = device.macAddress;
		r.sensors    = device.sensors;

		try {
				r.address = resolver_.resolve(device);
		} catch (const std::exception& e) {
				r.address.host = device.host.isEmpty() ? resolver_.baseHost() : device.host;
				r.error = QString::fromStdString(e.what());
				qCWarning(LC_SCAN) << "[scanOne]" << device.name << "probe pipeline fault:" << r.error;
				QTimer::singleShot(0, this, [this, scan] { deliver_(scan); });
				return;
		}

		const DeviceAddress addr = r.address;
		scan->pending = 2;

		// OTA and web checks run side by side; API only when OTA answered
		prober_->checkOtaPort(addr.host, addr.otaPort, [this, scan, addr](bool ok) {
				scan->result.otaOnline = ok;
				if (ok) {
						++scan->pending;
						prober_->checkApiPort(addr.host, addr.apiPort, [this, scan](bool apiOk) {
								scan->result.apiOnline = apiOk;
								stepDone_(scan);
						});
				}
				stepDone_(scan);
		});

		prober_->checkWeb(addr.host, addr.webPort, [this, scan](bool ok) {
				scan->result.webOnline = ok;
				stepDone_(scan);
		});
}

void FleetScanner::stepDone_(const std::shared_ptr<DeviceScan>& scan)
{
		if (--scan->pending > 0)
				return;

		ScanResult& r = scan->result;
		r.online = r.otaOnline || r.webOnline;

		const bool needMetadata = r.macAddress.isEmpty() || r.sensors.isEmpty();
		if (!r.webOnline || !needMetadata || !metadataEnabled_ || !fetcher_) {
				deliver_(scan);
				return;
		}

		MetadataRequest req;
		req.host      = r.address.host;
		req.webPort   = r.address.webPort;
		req.username  = scan->device.webUsername;
		req.password  = scan->device.webPassword;
		req.timeoutMs = metadataTimeoutMs_;

		r.metadataAttempted = true;
		fetcher_->fetch(req, [this, scan](const MetadataResult& meta) {
				ScanResult& res = scan->result;
				if (res.macAddress.isEmpty() && !meta.macAddress.isEmpty())
						res.macAddress = meta.macAddress;
				if (!meta.sensors.isEmpty())
						res.sensors = meta.sensors;
				if (!meta.ok && meta.sensors.isEmpty())
						res.metadataError = meta.error.isEmpty() ? QStringLiteral("no metadata") : meta.error;
				deliver_(scan);
		});
}

void FleetScanner::deliver_(const std::shared_ptr<DeviceScan>& scan)
{
		const ScanResult& r = scan->result;
		qCDebug(LC_SCAN) << "[deliver]" << r.name << (r.online ? "online" : "offline") << r.details()
						 << (r.error.isEmpty() ? QString() : r.error);
		emit deviceScanned(r);
		if (scan->cb) scan->cb(r);
}
