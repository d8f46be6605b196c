#pragma once

#include <dscv/Discovery/IDiscoveryBackend.hpp>

namespace dscv {

class ReplayDiscoveryBackend : public IDiscoveryBackend {
    Q_OBJECT
public:
    explicit ReplayDiscoveryBackend(QObject* parent = nullptr);
    ~ReplayDiscoveryBackend() override;

    // IDiscoveryBackend interface
    bool startBrowse(const QString& type, const QString& domain) override;
    void stopBrowse() override;
    bool startResolve(const DiscoveredService& service) override;
    void stopResolve() override;

    // Test API
    void simulateFound(const DiscoveredService& service, bool moreComing = false);
    void simulateResolved(const DiscoveredService& service, const QList<QByteArray>& addresses);
    void simulateResolveFailed(const DiscoveredService& service, int code);
    void setBrowseAvailable(bool available) { browseAvailable_ = available; }

    static QByteArray ipv4Record(const QString& address, uint16_t port = 0);
    static QByteArray ipv6Record(const QString& address, uint16_t port = 0);

    bool isBrowsing() const { return browsing_; }
    bool isResolving() const { return resolving_; }
    QString browsedType() const { return type_; }
    QString browsedDomain() const { return domain_; }
    int browseCount() const { return browseCount_; }
    int resolveCount() const { return resolveCount_; }
    DiscoveredService resolvedService() const { return resolvingService_; }

private:
    bool browseAvailable_ = true;
    bool browsing_ = false;
    bool resolving_ = false;
    QString type_;
    QString domain_;
    int browseCount_ = 0;
    int resolveCount_ = 0;
    DiscoveredService resolvingService_;
};

} // namespace dscv
