#pragma once

#include <QList>
#include <QObject>
#include <QString>
#include <QTimer>
#include <cstdint>

#include <dscv/Discovery/AddressResolver.hpp>
#include <dscv/Discovery/DiscoveryClient.hpp>
#include <dscv/Discovery/IDiscoveryBackend.hpp>
#include <dscv/Link/LinkQualityMonitor.hpp>
#include <dscv/Session/ISessionObserver.hpp>
#include <dscv/Session/SessionConfig.hpp>
#include <dscv/Session/SessionState.hpp>
#include <dscv/Transport/IDatagramTransport.hpp>
#include <dscv/Transport/SessionTransport.hpp>

namespace dscv {

/// One liveness-aware datagram session.
///
/// discover() browses for a service, resolves it to IPv4 and connects;
/// connectToHost() skips straight to the transport. Once the transport is
/// ready the session greets the peer with "dscv_discover:<name>" and waits
/// for "dscv_shake". Every send arms an ack-wait timer that any inbound
/// datagram cancels; expiries feed the LinkQualityMonitor while connected
/// and drive the handshake retry while connecting.
///
/// Each attempt runs under an epoch. close() and every new discover() or
/// connectToHost() end the epoch, and callbacks from an earlier epoch are
/// ignored.
///
/// The backend, transport and observer are not owned and must outlive the
/// session. A null backend disables discover().
class Session : public QObject {
    Q_OBJECT
public:
    Session(IDiscoveryBackend* discovery, IDatagramTransport* transport,
            const SessionConfig& config, ISessionObserver* observer = nullptr,
            QObject* parent = nullptr);
    ~Session() override;

    /// `serviceType` must look like "_name._udp." or "_name._tcp.".
    /// port 0 selects SessionConfig::defaultPort.
    ConfigError discover(const QString& serviceType, uint16_t port = 0,
                         const QString& domain = QString());
    ConfigError connectToHost(const QString& host, uint16_t port);

    /// Sends an application payload. False unless the transport is ready
    /// and the session is connecting or connected.
    bool send(const QString& payload);

    /// No-op unless connecting or connected.
    void close();
    void close(bool notifyPeer, const ConnectionState& finalState = ConnectionState::disconnected());

    /// Re-reports the current strength without recording a sample.
    float fetchConnectionStrength();

    ConnectionState state() const { return state_; }
    float strength() const { return link_.strength(); }
    int handshakeAttempts() const { return handshakeAttempts_; }
    int pendingAcks() const { return ackTimers_.size(); }
    quint64 epoch() const { return epoch_; }
    const SessionConfig& config() const { return config_; }

    static bool isValidServiceType(const QString& serviceType);

    /// Argument checks run by discover() and connectToHost() before any I/O.
    /// A missing discovery backend is not checked here.
    static ConfigError checkDiscover(const QString& serviceType, const SessionConfig& config);
    static ConfigError checkConnect(const QString& host, uint16_t port, const SessionConfig& config);

signals:
    void stateChanged(const dscv::ConnectionState& state);
    void strengthChanged(float percent);
    /// Inbound datagram that carries no control token.
    void messageReceived(const QString& payload);

private:
    void teardown();
    void startConnection(const QString& host, uint16_t port);
    void sendDiscover();
    void armAckTimer(bool handshake);
    void cancelAckTimers();
    void setState(const ConnectionState& state);
    void reportStrength(float strength);

    void onServiceDiscovered(quint64 searchId, const DiscoveredService& service);
    void onSearchTimedOut(quint64 searchId);
    void onServiceResolved(quint64 resolveId, const DiscoveredService& service);
    void onResolveFailed(quint64 resolveId, SessionError error);
    void onTransportReady();
    void onTransportFailed(int error);
    void onMessageSent(const QString& message);
    void onMessageReceived(const QString& message);
    void onAckTimeout(QTimer* timer, quint64 epoch, bool handshake);

    SessionConfig config_;
    ISessionObserver* observer_;
    DiscoveryClient* discovery_ = nullptr;
    AddressResolver* resolver_ = nullptr;
    SessionTransport* transport_;
    LinkQualityMonitor link_;

    ConnectionState state_;
    quint64 epoch_ = 0;
    uint16_t connectPort_ = 0;
    int handshakeAttempts_ = 0;
    QList<QTimer*> ackTimers_;
};

} // namespace dscv
