#include <QtTest/QtTest>
#include <QSignalSpy>
#include <dscv/Transport/ReplayTransport.hpp>
#include <dscv/Transport/SessionTransport.hpp>
#include <cerrno>

// Holds send completions until the test fires them.
class DeferredTransport : public dscv::IDatagramTransport {
    Q_OBJECT
public:
    void open(const QString&, uint16_t) override { ready_ = true; }
    void close() override { ready_ = false; }
    void send(const QByteArray&, SendCompletion completion) override
    {
        pending_.append(completion);
    }
    bool isReady() const override { return ready_; }

    void completeAll(int error)
    {
        QList<SendCompletion> pending;
        pending.swap(pending_);
        for (const auto& completion : pending)
            completion(error);
    }

private:
    bool ready_ = false;
    QList<SendCompletion> pending_;
};

class TestSessionTransport : public QObject {
    Q_OBJECT
private slots:
    void testSendEncodesUtf8()
    {
        dscv::ReplayTransport replay;
        dscv::SessionTransport transport(&replay);
        QSignalSpy sentSpy(&transport, &dscv::SessionTransport::messageSent);

        transport.open("127.0.0.1", 1024);
        replay.simulateReady();
        transport.send(QString::fromUtf8("grüße"));

        QCOMPARE(replay.writtenData().size(), 1);
        QCOMPARE(replay.writtenData().at(0), QString::fromUtf8("grüße").toUtf8());
        QCOMPARE(sentSpy.count(), 1);
        QCOMPARE(sentSpy[0][0].toString(), QString::fromUtf8("grüße"));
    }

    void testReceiveDecodesUtf8()
    {
        dscv::ReplayTransport replay;
        dscv::SessionTransport transport(&replay);
        QSignalSpy receivedSpy(&transport, &dscv::SessionTransport::messageReceived);

        transport.open("127.0.0.1", 1024);
        replay.feedDatagram(QString::fromUtf8("héllo").toUtf8());

        QCOMPARE(receivedSpy.count(), 1);
        QCOMPARE(receivedSpy[0][0].toString(), QString::fromUtf8("héllo"));
    }

    void testClosedDropsEvents()
    {
        dscv::ReplayTransport replay;
        dscv::SessionTransport transport(&replay);
        QSignalSpy readySpy(&transport, &dscv::SessionTransport::ready);
        QSignalSpy receivedSpy(&transport, &dscv::SessionTransport::messageReceived);
        QSignalSpy failedSpy(&transport, &dscv::SessionTransport::failed);

        replay.simulateReady();
        replay.feedDatagram("stray");
        replay.simulateFailure(ECONNREFUSED);
        transport.send("nothing");

        QCOMPARE(readySpy.count(), 0);
        QCOMPARE(receivedSpy.count(), 0);
        QCOMPARE(failedSpy.count(), 0);
        QVERIFY(replay.writtenData().isEmpty());
    }

    void testSendFailureReported()
    {
        dscv::ReplayTransport replay;
        dscv::SessionTransport transport(&replay);
        QSignalSpy sentSpy(&transport, &dscv::SessionTransport::messageSent);
        QSignalSpy failedSpy(&transport, &dscv::SessionTransport::failed);

        transport.open("127.0.0.1", 1024);
        replay.setSendError(EMSGSIZE);
        transport.send("too big");

        QCOMPARE(sentSpy.count(), 0);
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy[0][0].toInt(), EMSGSIZE);
    }

    void testStaleCompletionDropped()
    {
        DeferredTransport deferred;
        dscv::SessionTransport transport(&deferred);
        QSignalSpy sentSpy(&transport, &dscv::SessionTransport::messageSent);
        QSignalSpy failedSpy(&transport, &dscv::SessionTransport::failed);

        transport.open("10.0.0.1", 1024);
        const quint64 first = transport.generation();
        transport.send("from first connection");
        transport.open("10.0.0.2", 1024);
        QVERIFY(transport.generation() > first);

        deferred.completeAll(0);
        QCOMPARE(sentSpy.count(), 0);

        transport.send("from second connection");
        deferred.completeAll(ETIMEDOUT);
        QCOMPARE(failedSpy.count(), 1);
    }

    void testCompletionAfterDestructionIgnored()
    {
        DeferredTransport deferred;
        auto* transport = new dscv::SessionTransport(&deferred);
        transport->open("10.0.0.1", 1024);
        transport->send("orphan");
        delete transport;

        deferred.completeAll(0);
        QVERIFY(!deferred.isReady());
    }

    void testReadyReflectsTransport()
    {
        dscv::ReplayTransport replay;
        dscv::SessionTransport transport(&replay);
        QVERIFY(!transport.isReady());

        transport.open("127.0.0.1", 1024);
        QVERIFY(transport.isOpen());
        QVERIFY(!transport.isReady());

        replay.simulateReady();
        QVERIFY(transport.isReady());

        transport.close();
        QVERIFY(!transport.isOpen());
        QCOMPARE(replay.closeCount(), 1);
    }
};

QTEST_MAIN(TestSessionTransport)
#include "test_session_transport.moc"
