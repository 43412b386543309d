#pragma once
#include <functional>
#include <memory>

#include <QList>
#include <QObject>
#include <QSet>
#include <QString>

#include "include/types.hpp"
#include "net/AddressResolver.hpp"

class LivenessProber;

struct DiscoveryRange {
		int firstPort = flasher::DISCOVERY_FIRST_PORT;		// inclusive
		int lastPort  = flasher::DISCOVERY_LAST_PORT;		// inclusive
		int batchSize = flasher::DISCOVERY_BATCH_SIZE;
};

// Sweeps OTA ports for boards missing from the registry. Batches run one
// after another, the probes inside a batch run concurrently.
class NetworkDiscoverer : public QObject {
		Q_OBJECT
public:
		using Callback = std::function<void(const QList<DiscoveredDevice>&)>;

		NetworkDiscoverer(const AddressResolver& resolver, LivenessProber* prober, QObject* parent = nullptr);

		// Result is ordered by ascending port
		void discover(const QString& baseHost, const DiscoveryRange& range,
					  const QSet<int>& knownIds, Callback cb);

signals:
		void batchFinished(int firstPort, int lastPort, int found);

private:
		struct Sweep;

		void runBatch_(const std::shared_ptr<Sweep>& sweep);

		AddressResolver resolver_;
		LivenessProber* prober_;
};
