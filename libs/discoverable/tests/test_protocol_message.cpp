#include <QtTest/QtTest>
#include <dscv/Protocol/ProtocolMessage.hpp>

class TestProtocolMessage : public QObject {
    Q_OBJECT
private slots:
    void testDiscoverCarriesDeviceName()
    {
        QCOMPARE(dscv::discoverMessage("kitchen-speaker"),
                 QString("dscv_discover:kitchen-speaker"));
    }

    void testControlTokens()
    {
        QCOMPARE(dscv::controlMessage(dscv::ControlMessage::Handshake), QString("dscv_shake"));
        QCOMPARE(dscv::controlMessage(dscv::ControlMessage::Acknowledge), QString("dscv_ack"));
        QCOMPARE(dscv::controlMessage(dscv::ControlMessage::Disconnect), QString("dscv_disconnect"));
    }

    void testTokensMatchBySubstring()
    {
        QVERIFY(dscv::containsToken("dscv_shake", dscv::ControlMessage::Handshake));
        QVERIFY(dscv::containsToken("server:dscv_shake:v2", dscv::ControlMessage::Handshake));
        QVERIFY(dscv::containsToken("bye dscv_disconnect", dscv::ControlMessage::Disconnect));
        QVERIFY(!dscv::containsToken("dscv_ack", dscv::ControlMessage::Handshake));
    }

    void testApplicationPayloadIsNotControl()
    {
        QVERIFY(!dscv::isControlMessage("hello world"));
        QVERIFY(!dscv::isControlMessage(""));
        QVERIFY(dscv::isControlMessage("dscv_ack"));
        QVERIFY(dscv::isControlMessage(dscv::discoverMessage("x")));
    }
};

QTEST_MAIN(TestProtocolMessage)
#include "test_protocol_message.moc"
