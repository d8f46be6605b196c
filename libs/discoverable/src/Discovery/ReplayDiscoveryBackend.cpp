#include <dscv/Discovery/ReplayDiscoveryBackend.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cstring>

namespace dscv {

ReplayDiscoveryBackend::ReplayDiscoveryBackend(QObject* parent)
    : IDiscoveryBackend(parent)
{
}

ReplayDiscoveryBackend::~ReplayDiscoveryBackend() = default;

bool ReplayDiscoveryBackend::startBrowse(const QString& type, const QString& domain)
{
    ++browseCount_;
    type_ = type;
    domain_ = domain;
    browsing_ = browseAvailable_;
    return browseAvailable_;
}

void ReplayDiscoveryBackend::stopBrowse()
{
    browsing_ = false;
}

bool ReplayDiscoveryBackend::startResolve(const DiscoveredService& service)
{
    ++resolveCount_;
    resolvingService_ = service;
    resolving_ = true;
    return true;
}

void ReplayDiscoveryBackend::stopResolve()
{
    resolving_ = false;
}

void ReplayDiscoveryBackend::simulateFound(const DiscoveredService& service, bool moreComing)
{
    emit serviceFound(service, moreComing);
}

void ReplayDiscoveryBackend::simulateResolved(const DiscoveredService& service,
                                              const QList<QByteArray>& addresses)
{
    resolving_ = false;
    emit serviceResolved(service, addresses);
}

void ReplayDiscoveryBackend::simulateResolveFailed(const DiscoveredService& service, int code)
{
    resolving_ = false;
    emit resolveFailed(service, code);
}

QByteArray ReplayDiscoveryBackend::ipv4Record(const QString& address, uint16_t port)
{
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, address.toLatin1().constData(), &addr.sin_addr);
    return QByteArray(reinterpret_cast<const char*>(&addr), sizeof(addr));
}

QByteArray ReplayDiscoveryBackend::ipv6Record(const QString& address, uint16_t port)
{
    sockaddr_in6 addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin6_family = AF_INET6;
    addr.sin6_port = htons(port);
    inet_pton(AF_INET6, address.toLatin1().constData(), &addr.sin6_addr);
    return QByteArray(reinterpret_cast<const char*>(&addr), sizeof(addr));
}

} // namespace dscv
