#include <dscv/Discovery/AddressResolver.hpp>
#include <QDebug>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cstring>

namespace dscv {

AddressResolver::AddressResolver(IDiscoveryBackend* backend, QObject* parent)
    : QObject(parent)
    , backend_(backend)
    , timeoutTimer_(this)
{
    timeoutTimer_.setSingleShot(true);
    connect(&timeoutTimer_, &QTimer::timeout, this, &AddressResolver::onTimeout);
    connect(backend_, &IDiscoveryBackend::serviceResolved,
            this, &AddressResolver::onServiceResolved);
    connect(backend_, &IDiscoveryBackend::resolveFailed,
            this, &AddressResolver::onResolveFailed);
}

AddressResolver::~AddressResolver()
{
    cancel();
}

quint64 AddressResolver::resolve(const DiscoveredService& service, int timeoutMs)
{
    cancel();

    ++resolveId_;
    pending_ = service;
    resolving_ = true;

    qDebug() << "[AddressResolver] Resolving" << service.name << "timeout" << timeoutMs << "ms";
    timeoutTimer_.start(timeoutMs);

    if (!backend_->startResolve(service)) {
        qWarning() << "[AddressResolver] Backend refused to resolve" << service.name;
        fail(SessionError::DiscoverIncorrectConfiguration);
    }
    return resolveId_;
}

void AddressResolver::cancel()
{
    if (!resolving_) return;
    resolving_ = false;
    timeoutTimer_.stop();
    backend_->stopResolve();
}

QHostAddress AddressResolver::selectIPv4(const QList<QByteArray>& records)
{
    for (const auto& record : records) {
        if (record.size() < static_cast<int>(sizeof(sockaddr_in)))
            continue;

        sockaddr_in addr;
        std::memcpy(&addr, record.constData(), sizeof(addr));
        if (addr.sin_family != AF_INET)
            continue;

        return QHostAddress(reinterpret_cast<const sockaddr*>(&addr));
    }
    return QHostAddress();
}

void AddressResolver::onServiceResolved(const DiscoveredService& service,
                                        const QList<QByteArray>& addresses)
{
    if (!resolving_ || !service.sameInstance(pending_)) return;

    QHostAddress address = selectIPv4(addresses);
    if (address.isNull()) {
        qWarning() << "[AddressResolver] No IPv4 address among" << addresses.size()
                   << "records for" << service.name;
        fail(SessionError::DiscoverResolveFailed);
        return;
    }

    resolving_ = false;
    timeoutTimer_.stop();

    DiscoveredService result = service;
    result.address = address;
    qDebug() << "[AddressResolver] Resolved" << service.name << "to" << address.toString();
    emit resolved(resolveId_, result);
}

void AddressResolver::onResolveFailed(const DiscoveredService& service, int code)
{
    if (!resolving_ || !service.sameInstance(pending_)) return;

    SessionError error = resolveErrorFromCode(code);
    qWarning() << "[AddressResolver] Resolve failed, code" << code << "->" << toString(error);
    fail(error);
}

void AddressResolver::onTimeout()
{
    if (!resolving_) return;
    qWarning() << "[AddressResolver] Resolve of" << pending_.name << "timed out";
    fail(SessionError::DiscoverResolveTimeout);
}

void AddressResolver::fail(SessionError error)
{
    cancel();
    emit resolveFailed(resolveId_, error);
}

} // namespace dscv
