#include <dscv/Transport/ReplayTransport.hpp>

namespace dscv {

ReplayTransport::ReplayTransport(QObject* parent)
    : IDatagramTransport(parent)
{
}

ReplayTransport::~ReplayTransport() = default;

void ReplayTransport::open(const QString& host, uint16_t port)
{
    host_ = host;
    port_ = port;
    open_ = true;
    ready_ = false;
    ++openCount_;
}

void ReplayTransport::close()
{
    if (open_)
        ++closeCount_;
    open_ = false;
    ready_ = false;
}

// Completions run synchronously; written_ only records successful sends.
void ReplayTransport::send(const QByteArray& datagram, SendCompletion completion)
{
    if (sendError_ == 0)
        written_.append(datagram);
    if (completion)
        completion(sendError_);
}

bool ReplayTransport::isReady() const
{
    return ready_;
}

void ReplayTransport::simulateReady()
{
    ready_ = true;
    emit ready();
}

void ReplayTransport::simulateFailure(int error)
{
    ready_ = false;
    emit failed(error);
}

void ReplayTransport::feedDatagram(const QByteArray& datagram)
{
    emit datagramReceived(datagram);
}

QList<QByteArray> ReplayTransport::writtenData() const
{
    return written_;
}

int ReplayTransport::writtenCount(const QByteArray& needle) const
{
    int count = 0;
    for (const auto& datagram : written_) {
        if (datagram.contains(needle))
            ++count;
    }
    return count;
}

void ReplayTransport::clearWritten()
{
    written_.clear();
}

} // namespace dscv
