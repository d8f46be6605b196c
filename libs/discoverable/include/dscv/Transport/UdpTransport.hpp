#pragma once

#include <dscv/Transport/IDatagramTransport.hpp>
#include <QAbstractSocket>
#include <QUdpSocket>

namespace dscv {

/// Connected UDP socket: one datagram per send, datagrams from any other
/// peer are dropped by the kernel.
class UdpTransport : public IDatagramTransport {
    Q_OBJECT
public:
    explicit UdpTransport(QObject* parent = nullptr);
    ~UdpTransport() override;

    void open(const QString& host, uint16_t port) override;
    void close() override;
    void send(const QByteArray& datagram, SendCompletion completion) override;
    bool isReady() const override;

    static int posixError(QAbstractSocket::SocketError error);

private:
    void onReadyRead();
    void onSocketError(QAbstractSocket::SocketError error);

    QUdpSocket* socket_ = nullptr;
};

} // namespace dscv
