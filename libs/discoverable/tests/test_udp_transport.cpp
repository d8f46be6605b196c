#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QUdpSocket>
#include <QNetworkDatagram>
#include <dscv/Transport/UdpTransport.hpp>
#include <cerrno>

class TestUdpTransport : public QObject {
    Q_OBJECT
private slots:
    void testLoopbackExchange()
    {
        QUdpSocket peer;
        QVERIFY(peer.bind(QHostAddress::LocalHost, 0));

        dscv::UdpTransport transport;
        QSignalSpy readySpy(&transport, &dscv::IDatagramTransport::ready);
        QSignalSpy receivedSpy(&transport, &dscv::IDatagramTransport::datagramReceived);

        transport.open("127.0.0.1", peer.localPort());
        QTRY_COMPARE(readySpy.count(), 1);
        QVERIFY(transport.isReady());

        int result = -1;
        transport.send("dscv_discover:loopback", [&result](int error) { result = error; });
        QCOMPARE(result, -1);
        QTRY_COMPARE(result, 0);

        QTRY_VERIFY(peer.hasPendingDatagrams());
        QNetworkDatagram inbound = peer.receiveDatagram();
        QCOMPARE(inbound.data(), QByteArray("dscv_discover:loopback"));

        peer.writeDatagram("dscv_shake", inbound.senderAddress(), inbound.senderPort());
        QTRY_COMPARE(receivedSpy.count(), 1);
        QCOMPARE(receivedSpy[0][0].toByteArray(), QByteArray("dscv_shake"));
    }

    void testSendBeforeReady()
    {
        dscv::UdpTransport transport;
        int result = -1;
        transport.send("early", [&result](int error) { result = error; });

        QTRY_COMPARE(result, ENOTCONN);
        QVERIFY(!transport.isReady());
    }

    void testCloseStopsDelivery()
    {
        QUdpSocket peer;
        QVERIFY(peer.bind(QHostAddress::LocalHost, 0));

        dscv::UdpTransport transport;
        QSignalSpy readySpy(&transport, &dscv::IDatagramTransport::ready);
        transport.open("127.0.0.1", peer.localPort());
        QTRY_COMPARE(readySpy.count(), 1);

        transport.close();
        QVERIFY(!transport.isReady());
        transport.close();
    }

    void testPosixErrors()
    {
        QCOMPARE(dscv::UdpTransport::posixError(QAbstractSocket::ConnectionRefusedError), ECONNREFUSED);
        QCOMPARE(dscv::UdpTransport::posixError(QAbstractSocket::HostNotFoundError), EHOSTUNREACH);
        QCOMPARE(dscv::UdpTransport::posixError(QAbstractSocket::NetworkError), ENETDOWN);
        QCOMPARE(dscv::UdpTransport::posixError(QAbstractSocket::AddressInUseError), EADDRINUSE);
        QCOMPARE(dscv::UdpTransport::posixError(QAbstractSocket::UnknownSocketError), EIO);
    }
};

QTEST_MAIN(TestUdpTransport)
#include "test_udp_transport.moc"
