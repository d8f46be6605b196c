#pragma once

#include <QByteArray>
#include <QHostAddress>
#include <QList>
#include <QObject>
#include <QTimer>

#include <dscv/Discovery/IDiscoveryBackend.hpp>
#include <dscv/Session/SessionState.hpp>

namespace dscv {

/// Resolves a discovered service to an IPv4 address within a bounded time.
class AddressResolver : public QObject {
    Q_OBJECT
public:
    explicit AddressResolver(IDiscoveryBackend* backend, QObject* parent = nullptr);
    ~AddressResolver() override;

    /// Cancels any pending resolve. Returns the id tagging this attempt's signals.
    quint64 resolve(const DiscoveredService& service, int timeoutMs);
    void cancel();

    bool isResolving() const { return resolving_; }
    quint64 currentResolve() const { return resolveId_; }

    /// First AF_INET record, in order. IPv6 and malformed records are
    /// skipped. Returns a null address when there is none.
    static QHostAddress selectIPv4(const QList<QByteArray>& records);

signals:
    void resolved(quint64 resolveId, const dscv::DiscoveredService& service);
    void resolveFailed(quint64 resolveId, dscv::SessionError error);

private:
    void onServiceResolved(const DiscoveredService& service, const QList<QByteArray>& addresses);
    void onResolveFailed(const DiscoveredService& service, int code);
    void onTimeout();
    void fail(SessionError error);

    IDiscoveryBackend* backend_;
    QTimer timeoutTimer_;
    DiscoveredService pending_;
    quint64 resolveId_ = 0;
    bool resolving_ = false;
};

} // namespace dscv
