#pragma once

#include <QByteArray>
#include <QList>
#include <QObject>
#include <QString>

#include <dscv/Discovery/DiscoveredService.hpp>

namespace dscv {

/// Platform multicast-DNS browser and resolver.
///
/// Service types take the form "_<name>._udp." / "_<name>._tcp."; an empty
/// domain selects the default browse domains. Resolved addresses are raw
/// socket address records (sockaddr_in / sockaddr_in6 bytes), failures use
/// the ResolverCode table.
class IDiscoveryBackend : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IDiscoveryBackend() override = default;

    virtual bool startBrowse(const QString& type, const QString& domain) = 0;
    virtual void stopBrowse() = 0;
    virtual bool startResolve(const DiscoveredService& service) = 0;
    virtual void stopResolve() = 0;

signals:
    void serviceFound(const dscv::DiscoveredService& service, bool moreComing);
    void serviceResolved(const dscv::DiscoveredService& service,
                         const QList<QByteArray>& addresses);
    void resolveFailed(const dscv::DiscoveredService& service, int code);
};

} // namespace dscv
