#pragma once

#include <QObject>
#include <QString>
#include <cstdint>

#include <dscv/Transport/IDatagramTransport.hpp>

namespace dscv {

/// String-message view of an IDatagramTransport for one connection at a
/// time. Each open() starts a new generation: completions and events
/// belonging to an earlier connection are dropped.
class SessionTransport : public QObject {
    Q_OBJECT
public:
    explicit SessionTransport(IDatagramTransport* transport, QObject* parent = nullptr);
    ~SessionTransport() override;

    void open(const QString& host, uint16_t port);
    void close();

    /// UTF-8 encodes the payload into a single datagram.
    void send(const QString& payload);

    bool isOpen() const { return open_; }
    bool isReady() const;
    quint64 generation() const { return generation_; }

signals:
    void ready();
    void messageReceived(const QString& message);
    void messageSent(const QString& message);
    /// POSIX error code from the packet transport.
    void failed(int error);

private:
    void onTransportReady();
    void onTransportFailed(int error);
    void onDatagramReceived(const QByteArray& datagram);

    IDatagramTransport* transport_;
    quint64 generation_ = 0;
    bool open_ = false;
};

} // namespace dscv
