#include <dscv/Discovery/DiscoveryClient.hpp>
#include <QDebug>

namespace dscv {

DiscoveryClient::DiscoveryClient(IDiscoveryBackend* backend, QObject* parent)
    : QObject(parent)
    , backend_(backend)
    , timeoutTimer_(this)
{
    timeoutTimer_.setSingleShot(true);
    connect(&timeoutTimer_, &QTimer::timeout, this, &DiscoveryClient::onTimeout);
    connect(backend_, &IDiscoveryBackend::serviceFound,
            this, &DiscoveryClient::onServiceFound);
}

DiscoveryClient::~DiscoveryClient()
{
    stop();
}

quint64 DiscoveryClient::search(const QString& type, const QString& domain, int timeoutMs)
{
    stop();

    ++searchId_;
    searching_ = true;
    discovered_ = false;

    qDebug() << "[DiscoveryClient] Search" << searchId_ << "for" << type
             << "in" << (domain.isEmpty() ? QStringLiteral("<default>") : domain)
             << "timeout" << timeoutMs << "ms";

    // A backend that cannot browse finds nothing; the timeout reports it.
    if (!backend_->startBrowse(type, domain))
        qWarning() << "[DiscoveryClient] Backend failed to start browsing for" << type;

    timeoutTimer_.start(timeoutMs);
    return searchId_;
}

void DiscoveryClient::stop()
{
    if (!searching_) return;
    finish(discovered_);
}

void DiscoveryClient::onServiceFound(const DiscoveredService& service, bool moreComing)
{
    if (!searching_) return;

    discovered_ = true;
    qDebug() << "[DiscoveryClient] Found" << service.name << service.type
             << service.domain << (moreComing ? "(more coming)" : "");
    emit serviceDiscovered(searchId_, service);
}

void DiscoveryClient::onTimeout()
{
    if (!searching_) return;

    if (discovered_) {
        // Caller kept browsing after a hit; the search still succeeded.
        finish(true);
        return;
    }

    qWarning() << "[DiscoveryClient] Search" << searchId_ << "timed out";
    const quint64 id = searchId_;
    finish(false);
    emit searchTimedOut(id);
}

void DiscoveryClient::finish(bool success)
{
    timeoutTimer_.stop();
    searching_ = false;
    backend_->stopBrowse();
    emit searchStopped(searchId_, success);
}

} // namespace dscv
