#include <QtTest/QtTest>
#include <QSignalSpy>
#include <dscv/Discovery/AddressResolver.hpp>
#include <dscv/Discovery/ReplayDiscoveryBackend.hpp>

namespace {

dscv::DiscoveredService printer()
{
    dscv::DiscoveredService s;
    s.name = "printer";
    s.type = "_ipp._udp.";
    s.domain = "local.";
    return s;
}

} // namespace

class TestAddressResolver : public QObject {
    Q_OBJECT
private slots:
    void initTestCase()
    {
        qRegisterMetaType<dscv::DiscoveredService>();
        qRegisterMetaType<dscv::SessionError>();
    }

    void testSelectIPv4SkipsIPv6()
    {
        QList<QByteArray> records{
            dscv::ReplayDiscoveryBackend::ipv6Record("fe80::1"),
            dscv::ReplayDiscoveryBackend::ipv4Record("192.168.1.20"),
        };
        QCOMPARE(dscv::AddressResolver::selectIPv4(records), QHostAddress("192.168.1.20"));
    }

    void testSelectIPv4TakesFirstInOrder()
    {
        QList<QByteArray> records{
            dscv::ReplayDiscoveryBackend::ipv4Record("10.0.0.7"),
            dscv::ReplayDiscoveryBackend::ipv6Record("::1"),
            dscv::ReplayDiscoveryBackend::ipv4Record("10.0.0.8"),
        };
        QCOMPARE(dscv::AddressResolver::selectIPv4(records), QHostAddress("10.0.0.7"));
    }

    void testSelectIPv4RejectsShortRecords()
    {
        QList<QByteArray> records{QByteArray(4, '\0')};
        QVERIFY(dscv::AddressResolver::selectIPv4(records).isNull());
        QVERIFY(dscv::AddressResolver::selectIPv4({}).isNull());
    }

    void testResolvedAddress()
    {
        dscv::ReplayDiscoveryBackend backend;
        dscv::AddressResolver resolver(&backend);
        QSignalSpy resolvedSpy(&resolver, &dscv::AddressResolver::resolved);

        quint64 id = resolver.resolve(printer(), 1000);
        QVERIFY(backend.isResolving());
        QCOMPARE(backend.resolvedService().name, QString("printer"));

        backend.simulateResolved(printer(), {
            dscv::ReplayDiscoveryBackend::ipv6Record("fe80::2", 1024),
            dscv::ReplayDiscoveryBackend::ipv4Record("192.168.1.30", 1024),
        });

        QCOMPARE(resolvedSpy.count(), 1);
        QCOMPARE(resolvedSpy[0][0].value<quint64>(), id);
        auto result = resolvedSpy[0][1].value<dscv::DiscoveredService>();
        QCOMPARE(result.address, QHostAddress("192.168.1.30"));
        QVERIFY(result.isResolved());
        QVERIFY(!resolver.isResolving());
    }

    void testIPv6OnlyFails()
    {
        dscv::ReplayDiscoveryBackend backend;
        dscv::AddressResolver resolver(&backend);
        QSignalSpy failedSpy(&resolver, &dscv::AddressResolver::resolveFailed);

        resolver.resolve(printer(), 1000);
        backend.simulateResolved(printer(), {dscv::ReplayDiscoveryBackend::ipv6Record("fe80::2")});

        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy[0][1].value<dscv::SessionError>(), dscv::SessionError::DiscoverResolveFailed);
        QVERIFY(!backend.isResolving());
    }

    void testBackendErrorIsMapped()
    {
        dscv::ReplayDiscoveryBackend backend;
        dscv::AddressResolver resolver(&backend);
        QSignalSpy failedSpy(&resolver, &dscv::AddressResolver::resolveFailed);

        resolver.resolve(printer(), 1000);
        backend.simulateResolveFailed(printer(), dscv::ResolverCode::NOT_FOUND);

        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy[0][1].value<dscv::SessionError>(),
                 dscv::SessionError::DiscoverResolveServiceNotFound);
    }

    void testTimeout()
    {
        dscv::ReplayDiscoveryBackend backend;
        dscv::AddressResolver resolver(&backend);
        QSignalSpy failedSpy(&resolver, &dscv::AddressResolver::resolveFailed);

        resolver.resolve(printer(), 50);

        QTRY_COMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy[0][1].value<dscv::SessionError>(), dscv::SessionError::DiscoverResolveTimeout);
        QVERIFY(!backend.isResolving());

        // A late answer is ignored
        backend.simulateResolved(printer(), {dscv::ReplayDiscoveryBackend::ipv4Record("10.0.0.1")});
        QCOMPARE(failedSpy.count(), 1);
    }

    void testOtherServiceIgnored()
    {
        dscv::ReplayDiscoveryBackend backend;
        dscv::AddressResolver resolver(&backend);
        QSignalSpy resolvedSpy(&resolver, &dscv::AddressResolver::resolved);

        resolver.resolve(printer(), 1000);
        dscv::DiscoveredService other = printer();
        other.name = "scanner";
        backend.simulateResolved(other, {dscv::ReplayDiscoveryBackend::ipv4Record("10.0.0.1")});

        QCOMPARE(resolvedSpy.count(), 0);
        QVERIFY(resolver.isResolving());
    }

    void testCancelSilencesResult()
    {
        dscv::ReplayDiscoveryBackend backend;
        dscv::AddressResolver resolver(&backend);
        QSignalSpy resolvedSpy(&resolver, &dscv::AddressResolver::resolved);
        QSignalSpy failedSpy(&resolver, &dscv::AddressResolver::resolveFailed);

        resolver.resolve(printer(), 50);
        resolver.cancel();
        QVERIFY(!backend.isResolving());

        backend.simulateResolved(printer(), {dscv::ReplayDiscoveryBackend::ipv4Record("10.0.0.1")});
        QTest::qWait(120);
        QCOMPARE(resolvedSpy.count(), 0);
        QCOMPARE(failedSpy.count(), 0);
    }
};

QTEST_MAIN(TestAddressResolver)
#include "test_address_resolver.moc"
