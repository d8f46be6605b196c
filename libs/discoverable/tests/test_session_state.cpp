#include <QtTest/QtTest>
#include <dscv/Session/SessionState.hpp>
#include <cerrno>

class TestSessionState : public QObject {
    Q_OBJECT
private slots:
    void testPosixMapping_data()
    {
        QTest::addColumn<int>("code");
        QTest::addColumn<dscv::SessionError>("expected");

        QTest::newRow("addr-in-use") << EADDRINUSE << dscv::SessionError::ConnectAddressUnavailable;
        QTest::newRow("addr-unavail") << EADDRNOTAVAIL << dscv::SessionError::ConnectAddressUnavailable;
        QTest::newRow("access") << EACCES << dscv::SessionError::ConnectPermissionDenied;
        QTest::newRow("perm") << EPERM << dscv::SessionError::ConnectPermissionDenied;
        QTest::newRow("busy") << EBUSY << dscv::SessionError::ConnectDeviceBusy;
        QTest::newRow("canceled") << ECANCELED << dscv::SessionError::ConnectCanceled;
        QTest::newRow("refused") << ECONNREFUSED << dscv::SessionError::ConnectRefused;
        QTest::newRow("host-down") << EHOSTDOWN << dscv::SessionError::ConnectHostDown;
        QTest::newRow("host-unreach") << EHOSTUNREACH << dscv::SessionError::ConnectHostDown;
        QTest::newRow("is-conn") << EISCONN << dscv::SessionError::ConnectAlreadyConnected;
        QTest::newRow("timed-out") << ETIMEDOUT << dscv::SessionError::ConnectTimeout;
        QTest::newRow("net-down") << ENETDOWN << dscv::SessionError::ConnectNetworkDown;
        QTest::newRow("net-unreach") << ENETUNREACH << dscv::SessionError::ConnectNetworkDown;
        QTest::newRow("net-reset") << ENETRESET << dscv::SessionError::ConnectNetworkDown;
        QTest::newRow("unmapped") << EIO << dscv::SessionError::ConnectOther;
    }

    void testPosixMapping()
    {
        QFETCH(int, code);
        QFETCH(dscv::SessionError, expected);

        dscv::ConnectionState state = dscv::stateForPosixError(code);
        QCOMPARE(state.kind, dscv::SessionState::Failed);
        QCOMPARE(state.reason, expected);
    }

    void testNotConnectedIsPlainDisconnect()
    {
        dscv::ConnectionState state = dscv::stateForPosixError(ENOTCONN);
        QVERIFY(state == dscv::ConnectionState::disconnected());
        QVERIFY(!state.isActive());
    }

    void testResolverCodes()
    {
        using dscv::SessionError;
        namespace rc = dscv::ResolverCode;
        QCOMPARE(dscv::resolveErrorFromCode(rc::NOT_FOUND), SessionError::DiscoverResolveServiceNotFound);
        QCOMPARE(dscv::resolveErrorFromCode(rc::ACTIVITY_IN_PROGRESS), SessionError::DiscoverResolveBusy);
        QCOMPARE(dscv::resolveErrorFromCode(rc::BAD_ARGUMENT), SessionError::DiscoverIncorrectConfiguration);
        QCOMPARE(dscv::resolveErrorFromCode(rc::INVALID), SessionError::DiscoverIncorrectConfiguration);
        QCOMPARE(dscv::resolveErrorFromCode(rc::CANCELLED), SessionError::DiscoverResolveCanceled);
        QCOMPARE(dscv::resolveErrorFromCode(rc::TIMEOUT), SessionError::DiscoverResolveTimeout);
        QCOMPARE(dscv::resolveErrorFromCode(rc::UNKNOWN), SessionError::DiscoverResolveUnknown);
        QCOMPARE(dscv::resolveErrorFromCode(12345), SessionError::DiscoverResolveUnknown);
    }

    void testActiveStates()
    {
        QVERIFY(dscv::ConnectionState::connecting().isActive());
        QVERIFY(dscv::ConnectionState::connected().isActive());
        QVERIFY(!dscv::ConnectionState::disconnected().isActive());
        QVERIFY(!dscv::ConnectionState::failed(dscv::SessionError::ConnectRefused).isActive());
    }

    void testEqualityIncludesReason()
    {
        using dscv::ConnectionState;
        QVERIFY(ConnectionState::failed(dscv::SessionError::ConnectRefused)
                != ConnectionState::failed(dscv::SessionError::ConnectTimeout));
        QVERIFY(ConnectionState() == ConnectionState::disconnected());
    }

    void testNames()
    {
        QCOMPARE(QString(dscv::toString(dscv::SessionState::Connected)), QString("connected"));
        QCOMPARE(QString(dscv::toString(dscv::SessionError::ConnectShakeNoResponse)),
                 QString("connectShakeNoResponse"));
        QCOMPARE(QString(dscv::toString(dscv::ConfigError::InvalidPort)), QString("invalidPort"));
    }
};

QTEST_MAIN(TestSessionState)
#include "test_session_state.moc"
