#include <dscv/Transport/UdpTransport.hpp>
#include <QDebug>
#include <QNetworkDatagram>
#include <QTimer>
#include <cerrno>

namespace dscv {

UdpTransport::UdpTransport(QObject* parent)
    : IDatagramTransport(parent)
{
}

UdpTransport::~UdpTransport()
{
    close();
}

void UdpTransport::open(const QString& host, uint16_t port)
{
    close();

    socket_ = new QUdpSocket(this);
    connect(socket_, &QUdpSocket::connected, this, [this]() {
        qDebug() << "[UdpTransport] Ready, peer" << socket_->peerName() << socket_->peerPort();
        emit ready();
    });
    connect(socket_, &QUdpSocket::readyRead, this, &UdpTransport::onReadyRead);
    connect(socket_, &QAbstractSocket::errorOccurred, this, &UdpTransport::onSocketError);

    qDebug() << "[UdpTransport] Opening" << host << port;
    socket_->connectToHost(host, port);
}

void UdpTransport::close()
{
    if (!socket_) return;

    disconnect(socket_, nullptr, this, nullptr);
    socket_->abort();
    socket_->deleteLater();
    socket_ = nullptr;
}

void UdpTransport::send(const QByteArray& datagram, SendCompletion completion)
{
    int error = 0;
    if (!isReady()) {
        qWarning() << "[UdpTransport] send DROPPED:" << datagram.size()
                   << "bytes (socket state:" << (socket_ ? (int)socket_->state() : -1) << ")";
        error = ENOTCONN;
    } else if (socket_->write(datagram) < 0) {
        error = posixError(socket_->error());
        qWarning() << "[UdpTransport] write failed:" << socket_->errorString();
    }

    if (!completion) return;

    // Completion is always asynchronous, as with a platform send queue.
    QTimer::singleShot(0, this, [completion, error]() { completion(error); });
}

bool UdpTransport::isReady() const
{
    return socket_ && socket_->state() == QAbstractSocket::ConnectedState;
}

int UdpTransport::posixError(QAbstractSocket::SocketError error)
{
    switch (error) {
    case QAbstractSocket::ConnectionRefusedError:          return ECONNREFUSED;
    case QAbstractSocket::RemoteHostClosedError:           return ENOTCONN;
    case QAbstractSocket::HostNotFoundError:               return EHOSTUNREACH;
    case QAbstractSocket::SocketAccessError:               return EACCES;
    case QAbstractSocket::SocketResourceError:             return ENOBUFS;
    case QAbstractSocket::SocketTimeoutError:              return ETIMEDOUT;
    case QAbstractSocket::DatagramTooLargeError:           return EMSGSIZE;
    case QAbstractSocket::NetworkError:                    return ENETDOWN;
    case QAbstractSocket::AddressInUseError:               return EADDRINUSE;
    case QAbstractSocket::SocketAddressNotAvailableError:  return EADDRNOTAVAIL;
    case QAbstractSocket::UnsupportedSocketOperationError: return EOPNOTSUPP;
    case QAbstractSocket::TemporaryError:                  return EAGAIN;
    default:                                               return EIO;
    }
}

void UdpTransport::onReadyRead()
{
    while (socket_ && socket_->hasPendingDatagrams()) {
        QNetworkDatagram datagram = socket_->receiveDatagram();
        if (!datagram.isValid())
            break;
        emit datagramReceived(datagram.data());
    }
}

void UdpTransport::onSocketError(QAbstractSocket::SocketError error)
{
    qWarning() << "[UdpTransport] Socket error:" << socket_->errorString();
    emit failed(posixError(error));
}

} // namespace dscv
