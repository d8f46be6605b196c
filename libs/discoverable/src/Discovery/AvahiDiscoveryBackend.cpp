#include <dscv/Discovery/AvahiDiscoveryBackend.hpp>
#include <dscv/Session/SessionState.hpp>

#include <avahi-common/error.h>

#include <QDebug>
#include <QMetaObject>
#include <QPointer>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <algorithm>
#include <cstring>

namespace dscv {

namespace {

// DNS-SD type strings carry a trailing period ("_name._udp."), Avahi wants none.
QByteArray avahiType(const QString& type)
{
    QString t = type;
    while (t.endsWith(QLatin1Char('.')))
        t.chop(1);
    return t.toUtf8();
}

QByteArray socketAddressRecord(const AvahiAddress* address, uint16_t port)
{
    if (address->proto == AVAHI_PROTO_INET) {
        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = address->data.ipv4.address;
        return QByteArray(reinterpret_cast<const char*>(&addr), sizeof(addr));
    }
    if (address->proto == AVAHI_PROTO_INET6) {
        sockaddr_in6 addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin6_family = AF_INET6;
        addr.sin6_port = htons(port);
        std::memcpy(&addr.sin6_addr, address->data.ipv6.address, sizeof(addr.sin6_addr));
        return QByteArray(reinterpret_cast<const char*>(&addr), sizeof(addr));
    }
    return {};
}

} // namespace

AvahiDiscoveryBackend::AvahiDiscoveryBackend(QObject* parent)
    : IDiscoveryBackend(parent)
{
}

AvahiDiscoveryBackend::~AvahiDiscoveryBackend()
{
    if (threadedPoll_)
        avahi_threaded_poll_stop(threadedPoll_);

    if (browser_)
        avahi_service_browser_free(browser_);
    for (auto* resolver : resolvers_)
        avahi_service_resolver_free(resolver);
    if (client_)
        avahi_client_free(client_);
    if (threadedPoll_)
        avahi_threaded_poll_free(threadedPoll_);
}

bool AvahiDiscoveryBackend::startBrowse(const QString& type, const QString& domain)
{
    if (!ensureClient())
        return false;

    avahi_threaded_poll_lock(threadedPoll_);
    if (browser_) {
        avahi_service_browser_free(browser_);
        browser_ = nullptr;
    }
    ++browseGeneration_;

    QByteArray typeBytes = avahiType(type);
    QByteArray domainBytes = domain.toUtf8();
    browser_ = avahi_service_browser_new(
        client_,
        AVAHI_IF_UNSPEC,
        AVAHI_PROTO_UNSPEC,
        typeBytes.constData(),
        domain.isEmpty() ? nullptr : domainBytes.constData(),
        static_cast<AvahiLookupFlags>(0),
        browseCallback,
        this
    );
    const int error = browser_ ? AVAHI_OK : avahi_client_errno(client_);
    avahi_threaded_poll_unlock(threadedPoll_);

    if (error != AVAHI_OK) {
        qWarning() << "[AvahiBackend] Failed to create service browser:" << avahi_strerror(error);
        return false;
    }
    qDebug() << "[AvahiBackend] Browsing for" << typeBytes;
    return true;
}

void AvahiDiscoveryBackend::stopBrowse()
{
    if (!threadedPoll_) return;

    avahi_threaded_poll_lock(threadedPoll_);
    ++browseGeneration_;
    if (browser_) {
        avahi_service_browser_free(browser_);
        browser_ = nullptr;
    }
    avahi_threaded_poll_unlock(threadedPoll_);
}

bool AvahiDiscoveryBackend::startResolve(const DiscoveredService& service)
{
    if (!ensureClient())
        return false;

    avahi_threaded_poll_lock(threadedPoll_);
    freeResolvers();
    ++resolveGeneration_;
    resolving_ = service;
    addresses_.clear();
    lastResolveError_ = AVAHI_OK;

    QByteArray name = service.name.toUtf8();
    QByteArray type = avahiType(service.type);
    QByteArray domain = service.domain.toUtf8();

    // One resolver per address family, so a service reachable over both
    // yields both records.
    for (AvahiProtocol family : {AVAHI_PROTO_INET, AVAHI_PROTO_INET6}) {
        AvahiServiceResolver* resolver = avahi_service_resolver_new(
            client_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_UNSPEC,
            name.constData(),
            type.constData(),
            domain.isEmpty() ? nullptr : domain.constData(),
            family,
            static_cast<AvahiLookupFlags>(0),
            resolveCallback,
            this
        );
        if (resolver)
            resolvers_.push_back(resolver);
        else
            lastResolveError_ = avahi_client_errno(client_);
    }
    pendingResolvers_ = static_cast<int>(resolvers_.size());
    const bool started = pendingResolvers_ > 0;
    const int error = lastResolveError_;
    avahi_threaded_poll_unlock(threadedPoll_);

    if (!started)
        qWarning() << "[AvahiBackend] Failed to create resolver:" << avahi_strerror(error);
    return started;
}

void AvahiDiscoveryBackend::stopResolve()
{
    if (!threadedPoll_) return;

    avahi_threaded_poll_lock(threadedPoll_);
    ++resolveGeneration_;
    freeResolvers();
    avahi_threaded_poll_unlock(threadedPoll_);
}

int AvahiDiscoveryBackend::resolverCode(int avahiError)
{
    switch (avahiError) {
    case AVAHI_ERR_NOT_FOUND:
        return ResolverCode::NOT_FOUND;
    case AVAHI_ERR_TIMEOUT:
        return ResolverCode::TIMEOUT;
    case AVAHI_ERR_INVALID_ARGUMENT:
    case AVAHI_ERR_INVALID_SERVICE_NAME:
    case AVAHI_ERR_INVALID_SERVICE_TYPE:
    case AVAHI_ERR_INVALID_DOMAIN_NAME:
    case AVAHI_ERR_INVALID_INTERFACE:
    case AVAHI_ERR_INVALID_PROTOCOL:
        return ResolverCode::BAD_ARGUMENT;
    case AVAHI_ERR_BAD_STATE:
        return ResolverCode::INVALID;
    case AVAHI_ERR_TOO_MANY_OBJECTS:
        return ResolverCode::ACTIVITY_IN_PROGRESS;
    default:
        return ResolverCode::UNKNOWN;
    }
}

bool AvahiDiscoveryBackend::ensureClient()
{
    if (client_) return true;

    threadedPoll_ = avahi_threaded_poll_new();
    if (!threadedPoll_) {
        qWarning() << "[AvahiBackend] Failed to create threaded poll";
        return false;
    }

    int error = 0;
    client_ = avahi_client_new(
        avahi_threaded_poll_get(threadedPoll_),
        static_cast<AvahiClientFlags>(0),
        clientCallback,
        this,
        &error
    );

    if (!client_) {
        qWarning() << "[AvahiBackend] Failed to create client:" << avahi_strerror(error);
        avahi_threaded_poll_free(threadedPoll_);
        threadedPoll_ = nullptr;
        return false;
    }

    avahi_threaded_poll_start(threadedPoll_);
    return true;
}

void AvahiDiscoveryBackend::freeResolvers()
{
    for (auto* resolver : resolvers_)
        avahi_service_resolver_free(resolver);
    resolvers_.clear();
    pendingResolvers_ = 0;
}

void AvahiDiscoveryBackend::clientCallback(AvahiClient* client, AvahiClientState state, void*)
{
    switch (state) {
    case AVAHI_CLIENT_FAILURE:
        qWarning() << "[AvahiBackend] Client failure:" << avahi_strerror(avahi_client_errno(client));
        break;
    case AVAHI_CLIENT_S_RUNNING:
    case AVAHI_CLIENT_S_COLLISION:
    case AVAHI_CLIENT_S_REGISTERING:
    case AVAHI_CLIENT_CONNECTING:
        break;
    }
}

void AvahiDiscoveryBackend::browseCallback(AvahiServiceBrowser* browser,
                                           AvahiIfIndex,
                                           AvahiProtocol,
                                           AvahiBrowserEvent event,
                                           const char* name,
                                           const char* type,
                                           const char* domain,
                                           AvahiLookupResultFlags,
                                           void* userdata)
{
    auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

    switch (event) {
    case AVAHI_BROWSER_NEW: {
        DiscoveredService service;
        service.name = QString::fromUtf8(name);
        service.type = QString::fromUtf8(type) + QLatin1Char('.');
        service.domain = QString::fromUtf8(domain);

        const quint64 generation = self->browseGeneration_;
        QPointer<AvahiDiscoveryBackend> guard(self);
        QMetaObject::invokeMethod(self, [guard, service, generation]() {
            if (!guard) return;
            avahi_threaded_poll_lock(guard->threadedPoll_);
            const bool current = generation == guard->browseGeneration_;
            avahi_threaded_poll_unlock(guard->threadedPoll_);
            if (current)
                emit guard->serviceFound(service, false);
        }, Qt::QueuedConnection);
        break;
    }

    case AVAHI_BROWSER_FAILURE:
        qWarning() << "[AvahiBackend] Browse failure:"
                   << avahi_strerror(avahi_client_errno(avahi_service_browser_get_client(browser)));
        break;

    case AVAHI_BROWSER_REMOVE:
    case AVAHI_BROWSER_ALL_FOR_NOW:
    case AVAHI_BROWSER_CACHE_EXHAUSTED:
        break;
    }
}

void AvahiDiscoveryBackend::resolveCallback(AvahiServiceResolver* resolver,
                                            AvahiIfIndex,
                                            AvahiProtocol,
                                            AvahiResolverEvent event,
                                            const char*,
                                            const char*,
                                            const char*,
                                            const char*,
                                            const AvahiAddress* address,
                                            uint16_t port,
                                            AvahiStringList*,
                                            AvahiLookupResultFlags,
                                            void* userdata)
{
    auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

    if (event == AVAHI_RESOLVER_FOUND) {
        QByteArray record = socketAddressRecord(address, port);
        if (!record.isEmpty())
            self->addresses_.append(record);
        self->resolving_.port = port;
    } else {
        self->lastResolveError_ = avahi_client_errno(avahi_service_resolver_get_client(resolver));
    }

    auto it = std::find(self->resolvers_.begin(), self->resolvers_.end(), resolver);
    if (it == self->resolvers_.end())
        return;
    self->resolvers_.erase(it);
    avahi_service_resolver_free(resolver);

    if (--self->pendingResolvers_ > 0)
        return;

    const quint64 generation = self->resolveGeneration_;
    const DiscoveredService service = self->resolving_;
    const QList<QByteArray> addresses = self->addresses_;
    const int code = resolverCode(self->lastResolveError_);

    QPointer<AvahiDiscoveryBackend> guard(self);
    QMetaObject::invokeMethod(self, [guard, generation, service, addresses, code]() {
        if (!guard) return;
        avahi_threaded_poll_lock(guard->threadedPoll_);
        const bool current = generation == guard->resolveGeneration_;
        avahi_threaded_poll_unlock(guard->threadedPoll_);
        if (!current) return;

        if (addresses.isEmpty())
            emit guard->resolveFailed(service, code);
        else
            emit guard->serviceResolved(service, addresses);
    }, Qt::QueuedConnection);
}

} // namespace dscv
