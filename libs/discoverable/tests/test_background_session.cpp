#include <QtTest/QtTest>
#include <QSignalSpy>
#include <dscv/Session/BackgroundSession.hpp>
#include <dscv/Transport/ReplayTransport.hpp>
#include <cerrno>

// Remembers which thread delivered each callback
class ThreadCheckingObserver : public dscv::ISessionObserver {
public:
    void onConnectionState(const dscv::ConnectionState& state) override
    {
        states.append(state);
        threads.append(QThread::currentThread());
    }
    void onConnectionStrength(float percent) override
    {
        strengths.append(percent);
        threads.append(QThread::currentThread());
    }

    QList<dscv::ConnectionState> states;
    QList<float> strengths;
    QList<QThread*> threads;
};

class TestBackgroundSession : public QObject {
    Q_OBJECT

private:
    static dscv::SessionConfig config()
    {
        dscv::SessionConfig c;
        c.deviceName = "worker-test";
        c.ackTimeoutMs = 30;
        return c;
    }

    // Runs fn on the thread that owns `target`, waiting for it.
    template <typename Fn>
    static void onWorker(QObject* target, Fn fn)
    {
        QMetaObject::invokeMethod(target, fn, Qt::BlockingQueuedConnection);
    }

private slots:
    void initTestCase()
    {
        qRegisterMetaType<dscv::ConnectionState>();
    }

    void testValidationIsSynchronous()
    {
        auto transport = std::make_unique<dscv::ReplayTransport>();
        dscv::BackgroundSession session(nullptr, std::move(transport), config());

        QCOMPARE(session.connectToHost("", 1024), dscv::ConfigError::InvalidHost);
        QCOMPARE(session.connectToHost("10.0.0.1", 0), dscv::ConfigError::InvalidPort);
        QCOMPARE(session.discover("_chat._udp"), dscv::ConfigError::InvalidServiceType);
        QCOMPARE(session.discover("_chat._udp."), dscv::ConfigError::DiscoveryUnavailable);
    }

    void testNotificationsOnCallerThread()
    {
        auto transport = std::make_unique<dscv::ReplayTransport>();
        dscv::ReplayTransport* replay = transport.get();
        ThreadCheckingObserver observer;
        dscv::BackgroundSession session(nullptr, std::move(transport), config(), &observer);
        QSignalSpy stateSpy(&session, &dscv::BackgroundSession::stateChanged);
        QSignalSpy messageSpy(&session, &dscv::BackgroundSession::messageReceived);

        QCOMPARE(replay->thread(), session.workerThread());

        QCOMPARE(session.connectToHost("10.0.0.1", 1024), dscv::ConfigError::None);
        QTRY_COMPARE(session.state(), dscv::ConnectionState::connecting());

        onWorker(replay, [replay]() {
            replay->simulateReady();
            replay->feedDatagram("dscv_shake");
            replay->feedDatagram("hello from peer");
        });

        QTRY_COMPARE(session.state(), dscv::ConnectionState::connected());
        QTRY_COMPARE(messageSpy.count(), 1);
        QCOMPARE(messageSpy[0][0].toString(), QString("hello from peer"));
        QCOMPARE(stateSpy.count(), 2);
        QCOMPARE(observer.states.size(), 2);
        QCOMPARE(session.strength(), 100.0f);

        for (QThread* thread : observer.threads)
            QCOMPARE(thread, QThread::currentThread());
    }

    void testSendAndCloseArePosted()
    {
        auto transport = std::make_unique<dscv::ReplayTransport>();
        dscv::ReplayTransport* replay = transport.get();
        dscv::BackgroundSession session(nullptr, std::move(transport), config());
        QSignalSpy rejectedSpy(&session, &dscv::BackgroundSession::sendRejected);

        session.send("nobody listening");
        QTRY_COMPARE(rejectedSpy.count(), 1);

        session.connectToHost("10.0.0.1", 1024);
        QTRY_COMPARE(session.state(), dscv::ConnectionState::connecting());
        onWorker(replay, [replay]() {
            replay->simulateReady();
            replay->feedDatagram("dscv_shake");
        });
        QTRY_COMPARE(session.state(), dscv::ConnectionState::connected());

        session.send("payload");
        session.close();
        QTRY_COMPARE(session.state(), dscv::ConnectionState::disconnected());

        int payloads = 0;
        int disconnects = 0;
        onWorker(replay, [&]() {
            payloads = replay->writtenCount("payload");
            disconnects = replay->writtenCount("dscv_disconnect");
        });
        QCOMPARE(payloads, 1);
        QCOMPARE(disconnects, 1);
    }

    void testFetchStrengthRedispatched()
    {
        auto transport = std::make_unique<dscv::ReplayTransport>();
        ThreadCheckingObserver observer;
        dscv::BackgroundSession session(nullptr, std::move(transport), config(), &observer);
        QSignalSpy strengthSpy(&session, &dscv::BackgroundSession::strengthChanged);

        session.fetchConnectionStrength();
        QTRY_COMPARE(strengthSpy.count(), 1);
        QCOMPARE(strengthSpy[0][0].toFloat(), 0.0f);
        QCOMPARE(observer.threads.size(), 1);
        QCOMPARE(observer.threads[0], QThread::currentThread());
    }

    void testTransportFailureReported()
    {
        auto transport = std::make_unique<dscv::ReplayTransport>();
        dscv::ReplayTransport* replay = transport.get();
        dscv::BackgroundSession session(nullptr, std::move(transport), config());

        session.connectToHost("10.0.0.1", 1024);
        QTRY_COMPARE(session.state(), dscv::ConnectionState::connecting());
        onWorker(replay, [replay]() { replay->simulateFailure(EHOSTUNREACH); });

        QTRY_COMPARE(session.state(),
                     dscv::ConnectionState::failed(dscv::SessionError::ConnectHostDown));
    }
};

QTEST_MAIN(TestBackgroundSession)
#include "test_background_session.moc"
