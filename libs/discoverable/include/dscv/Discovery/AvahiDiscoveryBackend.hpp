#pragma once

#include <dscv/Discovery/IDiscoveryBackend.hpp>

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/thread-watch.h>

#include <vector>

namespace dscv {

/// Avahi-based mDNS browser/resolver for Linux.
///
/// Avahi runs its own poll thread. Its callbacks are marshalled onto the
/// thread this object lives on before any signal is emitted, and each is
/// tagged with the browse/resolve generation it belongs to so results of a
/// stopped operation are discarded.
class AvahiDiscoveryBackend : public IDiscoveryBackend {
    Q_OBJECT
public:
    explicit AvahiDiscoveryBackend(QObject* parent = nullptr);
    ~AvahiDiscoveryBackend() override;

    bool startBrowse(const QString& type, const QString& domain) override;
    void stopBrowse() override;
    bool startResolve(const DiscoveredService& service) override;
    void stopResolve() override;

    /// Avahi error -> ResolverCode table.
    static int resolverCode(int avahiError);

private:
    bool ensureClient();
    void freeResolvers();

    static void clientCallback(AvahiClient* client, AvahiClientState state, void* userdata);
    static void browseCallback(AvahiServiceBrowser* browser,
                               AvahiIfIndex interface,
                               AvahiProtocol protocol,
                               AvahiBrowserEvent event,
                               const char* name,
                               const char* type,
                               const char* domain,
                               AvahiLookupResultFlags flags,
                               void* userdata);
    static void resolveCallback(AvahiServiceResolver* resolver,
                                AvahiIfIndex interface,
                                AvahiProtocol protocol,
                                AvahiResolverEvent event,
                                const char* name,
                                const char* type,
                                const char* domain,
                                const char* hostName,
                                const AvahiAddress* address,
                                uint16_t port,
                                AvahiStringList* txt,
                                AvahiLookupResultFlags flags,
                                void* userdata);

    AvahiThreadedPoll* threadedPoll_ = nullptr;
    AvahiClient* client_ = nullptr;
    AvahiServiceBrowser* browser_ = nullptr;
    std::vector<AvahiServiceResolver*> resolvers_;

    // Guarded by the threaded poll lock
    quint64 browseGeneration_ = 0;
    quint64 resolveGeneration_ = 0;
    DiscoveredService resolving_;
    QList<QByteArray> addresses_;
    int pendingResolvers_ = 0;
    int lastResolveError_ = 0;
};

} // namespace dscv
