#pragma once

#include <QObject>
#include <QString>
#include <QThread>
#include <cstdint>
#include <memory>

#include <dscv/Discovery/IDiscoveryBackend.hpp>
#include <dscv/Session/ISessionObserver.hpp>
#include <dscv/Session/Session.hpp>
#include <dscv/Session/SessionConfig.hpp>
#include <dscv/Transport/IDatagramTransport.hpp>

namespace dscv {

/// Runs a Session, its transport and its discovery backend on a worker
/// thread.
///
/// Control calls validate their arguments on the calling thread and are
/// then posted to the worker. Notifications (observer callbacks and
/// signals) are delivered on the thread that owns this object.
class BackgroundSession : public QObject {
    Q_OBJECT
public:
    /// `discovery` may be null, which disables discover().
    BackgroundSession(std::unique_ptr<IDiscoveryBackend> discovery,
                      std::unique_ptr<IDatagramTransport> transport,
                      const SessionConfig& config,
                      ISessionObserver* observer = nullptr,
                      QObject* parent = nullptr);
    ~BackgroundSession() override;

    ConfigError discover(const QString& serviceType, uint16_t port = 0,
                         const QString& domain = QString());
    ConfigError connectToHost(const QString& host, uint16_t port);
    void send(const QString& payload);
    void close();
    void fetchConnectionStrength();

    /// Last values delivered to this thread.
    ConnectionState state() const { return state_; }
    float strength() const { return strength_; }

    QThread* workerThread() { return &thread_; }

signals:
    void stateChanged(const dscv::ConnectionState& state);
    void strengthChanged(float percent);
    void messageReceived(const QString& payload);
    /// send() found the session not ready for payloads.
    void sendRejected(const QString& payload);

private:
    void onSessionState(const ConnectionState& state);
    void onSessionStrength(float percent);

    SessionConfig config_;
    ISessionObserver* observer_;
    QThread thread_;
    IDiscoveryBackend* discovery_;
    IDatagramTransport* transport_;
    Session* session_;

    ConnectionState state_;
    float strength_ = 0.0f;
};

} // namespace dscv
