#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>
#include <cstdint>
#include <functional>

namespace dscv {

/// Unreliable datagram connection to a single host:port.
///
/// open() is asynchronous: ready() or failed() follows. Once ready, every
/// inbound datagram is reported through datagramReceived() until close().
/// Errors are POSIX codes (errno values).
class IDatagramTransport : public QObject {
    Q_OBJECT
public:
    /// Called once per send with 0 on success or a POSIX error code.
    using SendCompletion = std::function<void(int error)>;

    using QObject::QObject;
    ~IDatagramTransport() override = default;

    virtual void open(const QString& host, uint16_t port) = 0;
    virtual void close() = 0;
    virtual void send(const QByteArray& datagram, SendCompletion completion) = 0;
    virtual bool isReady() const = 0;

signals:
    void ready();
    void failed(int error);
    void datagramReceived(const QByteArray& datagram);
};

} // namespace dscv
