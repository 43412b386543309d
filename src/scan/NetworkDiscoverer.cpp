#include "NetworkDiscoverer.hpp"

#include <optional>
#include <vector>

#include <QTimer>

#include "log/flasher_logging.hpp"
#include "net/LivenessProber.hpp"

struct NetworkDiscoverer::Sweep {
		QString host;
		DiscoveryRange range;
		QSet<int> knownIds;
		int nextPort = 0;
		QList<DiscoveredDevice> found;
		Callback cb;
};

NetworkDiscoverer::NetworkDiscoverer(const AddressResolver& resolver, LivenessProber* prober, QObject* parent)
		: QObject(parent), resolver_(resolver), prober_(prober)
{
}

void NetworkDiscoverer::discover(const QString& baseHost, const DiscoveryRange& range,
								 const QSet<int>& knownIds, Callback cb)
{
		auto sweep = std::make_shared<Sweep>();
		sweep->host     = baseHost.isEmpty() ? resolver_.baseHost() : baseHost;
		sweep->range    = range;
		sweep->knownIds = knownIds;
		sweep->nextPort = range.firstPort;
		sweep->cb       = std::move(cb);
		if (sweep->range.batchSize < 1) sweep->range.batchSize = 1;

		qCInfo(LC_DISCOVER) << "[discover]" << sweep->host << "ports" << range.firstPort << "-" << range.lastPort
							<< "batch=" << sweep->range.batchSize;

		// keep the callback asynchronous even for an empty range
		QTimer::singleShot(0, this, [this, sweep] { runBatch_(sweep); });
}

void NetworkDiscoverer::runBatch_(const std::shared_ptr<Sweep>& sweep)
{
		if (sweep->nextPort > sweep->range.lastPort) {
				qCInfo(LC_DISCOVER) << "[discover] done, found" << sweep->found.size();
				if (sweep->cb) sweep->cb(sweep->found);
				return;
		}

		const int first = sweep->nextPort;
		const int last  = qMin(first + sweep->range.batchSize - 1, sweep->range.lastPort);
		sweep->nextPort = last + 1;

		struct Batch {
				std::vector<std::optional<DiscoveredDevice>> hits;
				int pending = 0;
		};
		auto batch = std::make_shared<Batch>();
		batch->hits.resize(static_cast<size_t>(last - first + 1));
		batch->pending = last - first + 1;

		for (int port = first; port <= last; ++port) {
				prober_->checkOtaPort(sweep->host, port, [this, sweep, batch, port, first, last](bool open) {
						if (open) {
								const int id = resolver_.idFromPort(port);
								DiscoveredDevice d;
								d.id      = id;
								d.host    = sweep->host;
								d.otaPort = port;
								d.webPort = resolver_.layout().webBase + id;
								d.apiPort = resolver_.layout().apiBase + id;
								d.isNew   = !sweep->knownIds.contains(id);
								batch->hits[static_cast<size_t>(port - first)] = d;
						}
						if (--batch->pending > 0)
								return;

						int found = 0;
						for (const auto& hit : batch->hits) {
								if (!hit) continue;
								sweep->found.append(*hit);
								++found;
						}
						qCDebug(LC_DISCOVER) << "[batch]" << first << "-" << last << "found" << found;
						emit batchFinished(first, last, found);
						runBatch_(sweep);
				});
		}
}
