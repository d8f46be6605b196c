#include <dscv/Transport/SessionTransport.hpp>
#include <QDebug>
#include <QPointer>

namespace dscv {

SessionTransport::SessionTransport(IDatagramTransport* transport, QObject* parent)
    : QObject(parent)
    , transport_(transport)
{
    connect(transport_, &IDatagramTransport::ready,
            this, &SessionTransport::onTransportReady);
    connect(transport_, &IDatagramTransport::failed,
            this, &SessionTransport::onTransportFailed);
    connect(transport_, &IDatagramTransport::datagramReceived,
            this, &SessionTransport::onDatagramReceived);
}

SessionTransport::~SessionTransport()
{
    close();
}

void SessionTransport::open(const QString& host, uint16_t port)
{
    close();
    ++generation_;
    open_ = true;
    qDebug() << "[SessionTransport] Connection" << generation_ << "to" << host << port;
    transport_->open(host, port);
}

void SessionTransport::close()
{
    if (!open_) return;
    open_ = false;
    ++generation_;
    transport_->close();
}

void SessionTransport::send(const QString& payload)
{
    if (!open_) {
        qWarning() << "[SessionTransport] send on closed connection dropped:" << payload;
        return;
    }

    const quint64 generation = generation_;
    QPointer<SessionTransport> self(this);
    transport_->send(payload.toUtf8(), [self, generation, payload](int error) {
        if (!self || generation != self->generation_)
            return;
        if (error != 0) {
            qWarning() << "[SessionTransport] send failed, errno" << error;
            emit self->failed(error);
            return;
        }
        qDebug() << "[SessionTransport] Sent:" << payload;
        emit self->messageSent(payload);
    });
}

bool SessionTransport::isReady() const
{
    return open_ && transport_->isReady();
}

void SessionTransport::onTransportReady()
{
    if (!open_) return;
    emit ready();
}

void SessionTransport::onTransportFailed(int error)
{
    if (!open_) return;
    emit failed(error);
}

void SessionTransport::onDatagramReceived(const QByteArray& datagram)
{
    if (!open_) return;
    QString message = QString::fromUtf8(datagram);
    qDebug() << "[SessionTransport] Received:" << message;
    emit messageReceived(message);
}

} // namespace dscv
