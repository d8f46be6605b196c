#pragma once

#include <QObject>
#include <QTimer>
#include <cstdint>

#include <dscv/Discovery/IDiscoveryBackend.hpp>

namespace dscv {

/// Bounded-duration browse for one service type.
///
/// At most one search is outstanding; search() cancels any earlier one and
/// returns a new search id that tags every signal. Candidates are reported
/// as they are found. If none arrives before the timeout, browsing is
/// aborted and searchTimedOut() fires exactly once. stop() never reports a
/// failure and is a no-op once the search has ended.
class DiscoveryClient : public QObject {
    Q_OBJECT
public:
    explicit DiscoveryClient(IDiscoveryBackend* backend, QObject* parent = nullptr);
    ~DiscoveryClient() override;

    quint64 search(const QString& type, const QString& domain, int timeoutMs);
    void stop();

    bool isSearching() const { return searching_; }
    bool hasDiscovered() const { return discovered_; }
    quint64 currentSearch() const { return searchId_; }

signals:
    void serviceDiscovered(quint64 searchId, const dscv::DiscoveredService& service);
    void searchTimedOut(quint64 searchId);
    /// success is true when at least one candidate was found.
    void searchStopped(quint64 searchId, bool success);

private:
    void onServiceFound(const DiscoveredService& service, bool moreComing);
    void onTimeout();
    void finish(bool success);

    IDiscoveryBackend* backend_;
    QTimer timeoutTimer_;
    quint64 searchId_ = 0;
    bool searching_ = false;
    bool discovered_ = false;
};

} // namespace dscv
