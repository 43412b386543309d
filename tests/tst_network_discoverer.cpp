#include <QtTest>

#include <QHostAddress>
#include <QSignalSpy>
#include <QTcpServer>
#include <optional>

#include "net/LivenessProber.hpp"
#include "scan/NetworkDiscoverer.hpp"

class TestNetworkDiscoverer : public QObject {
		Q_OBJECT
private slots:
		void findsOnlyOpenPort();
		void knownIdIsNotNew();
		void emptyRangeCompletes();
};

// The listening port becomes id 3; the sweep covers ids 1 to 5
struct DiscoveryRig {
		QTcpServer ota;
		PortLayout layout;
		DiscoveryRange range;

		bool start()
		{
				if (!ota.listen(QHostAddress::LocalHost, 0))
						return false;
				layout.otaBase = ota.serverPort() - 3;
				layout.webBase = 8000;
				layout.apiBase = 6000;
				range.firstPort = layout.otaBase + 1;
				range.lastPort  = layout.otaBase + 5;
				range.batchSize = 2;
				return true;
		}
};

void TestNetworkDiscoverer::findsOnlyOpenPort()
{
		DiscoveryRig rig;
		QVERIFY(rig.start());

		AddressResolver resolver(QStringLiteral("127.0.0.1"), rig.layout);
		LivenessProber prober(ProbeOptions{2000, 50, 1});
		NetworkDiscoverer discoverer(resolver, &prober);
		QSignalSpy batches(&discoverer, &NetworkDiscoverer::batchFinished);

		std::optional<QList<DiscoveredDevice>> found;
		discoverer.discover(QStringLiteral("127.0.0.1"), rig.range, {}, [&](const QList<DiscoveredDevice>& d) { found = d; });
		QTRY_VERIFY_WITH_TIMEOUT(found.has_value(), 10000);

		QCOMPARE(found->size(), 1);
		const DiscoveredDevice d = found->first();
		QCOMPARE(d.id, 3);
		QCOMPARE(d.otaPort, static_cast<int>(rig.ota.serverPort()));
		QCOMPARE(d.webPort, 8003);
		QCOMPARE(d.apiPort, 6003);
		QCOMPARE(d.host, QStringLiteral("127.0.0.1"));
		QVERIFY(d.isNew);

		// 5 ports in batches of 2, last port included
		QCOMPARE(batches.count(), 3);
		QCOMPARE(batches.last().at(1).toInt(), rig.range.lastPort);
}

void TestNetworkDiscoverer::knownIdIsNotNew()
{
		DiscoveryRig rig;
		QVERIFY(rig.start());

		AddressResolver resolver(QStringLiteral("127.0.0.1"), rig.layout);
		LivenessProber prober(ProbeOptions{2000, 50, 1});
		NetworkDiscoverer discoverer(resolver, &prober);

		std::optional<QList<DiscoveredDevice>> found;
		discoverer.discover(QString(), rig.range, QSet<int>{3}, [&](const QList<DiscoveredDevice>& d) { found = d; });
		QTRY_VERIFY_WITH_TIMEOUT(found.has_value(), 10000);

		QCOMPARE(found->size(), 1);
		QVERIFY(!found->first().isNew);
}

void TestNetworkDiscoverer::emptyRangeCompletes()
{
		AddressResolver resolver(QStringLiteral("127.0.0.1"));
		LivenessProber prober;
		NetworkDiscoverer discoverer(resolver, &prober);

		DiscoveryRange range;
		range.firstPort = 9000;
		range.lastPort  = 8999;

		std::optional<QList<DiscoveredDevice>> found;
		discoverer.discover(QString(), range, {}, [&](const QList<DiscoveredDevice>& d) { found = d; });
		QVERIFY(!found.has_value());
		QTRY_VERIFY(found.has_value());
		QVERIFY(found->isEmpty());
}

QTEST_GUILESS_MAIN(TestNetworkDiscoverer)
#include "tst_network_discoverer.moc"
