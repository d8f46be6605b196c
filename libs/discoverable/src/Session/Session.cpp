#include <dscv/Session/Session.hpp>
#include <dscv/Protocol/ProtocolMessage.hpp>
#include <QDebug>
#include <QRegularExpression>

namespace dscv {

Session::Session(IDiscoveryBackend* discovery, IDatagramTransport* transport,
                 const SessionConfig& config, ISessionObserver* observer,
                 QObject* parent)
    : QObject(parent)
    , config_(config)
    , observer_(observer)
    , transport_(new SessionTransport(transport, this))
    , link_(static_cast<size_t>(boundedStrengthWindow(config.strengthWindow)),
            config.deadLinkThreshold)
{
    if (discovery) {
        discovery_ = new DiscoveryClient(discovery, this);
        resolver_ = new AddressResolver(discovery, this);

        connect(discovery_, &DiscoveryClient::serviceDiscovered,
                this, &Session::onServiceDiscovered);
        connect(discovery_, &DiscoveryClient::searchTimedOut,
                this, &Session::onSearchTimedOut);
        connect(resolver_, &AddressResolver::resolved,
                this, &Session::onServiceResolved);
        connect(resolver_, &AddressResolver::resolveFailed,
                this, &Session::onResolveFailed);
    }

    connect(transport_, &SessionTransport::ready,
            this, &Session::onTransportReady);
    connect(transport_, &SessionTransport::failed,
            this, &Session::onTransportFailed);
    connect(transport_, &SessionTransport::messageSent,
            this, &Session::onMessageSent);
    connect(transport_, &SessionTransport::messageReceived,
            this, &Session::onMessageReceived);
}

Session::~Session()
{
    // Notify the peer only; the observer may already be destroyed.
    transport_->disconnect(this);
    if (state_.isActive() && config_.sendDisconnectOnClose && transport_->isReady())
        transport_->send(controlMessage(ControlMessage::Disconnect));
    teardown();
}

bool Session::isValidServiceType(const QString& serviceType)
{
    static const QRegularExpression pattern(
        QStringLiteral("^_[A-Za-z0-9][A-Za-z0-9-]*\\._(udp|tcp)\\.$"));
    return pattern.match(serviceType).hasMatch();
}

ConfigError Session::checkDiscover(const QString& serviceType, const SessionConfig& config)
{
    if (!isValidServiceType(serviceType))
        return ConfigError::InvalidServiceType;
    if (config.deviceName.trimmed().isEmpty())
        return ConfigError::MissingDeviceName;
    return ConfigError::None;
}

ConfigError Session::checkConnect(const QString& host, uint16_t port, const SessionConfig& config)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s"));
    if (host.isEmpty() || host.contains(whitespace))
        return ConfigError::InvalidHost;
    if (port == 0)
        return ConfigError::InvalidPort;
    if (config.deviceName.trimmed().isEmpty())
        return ConfigError::MissingDeviceName;
    return ConfigError::None;
}

ConfigError Session::discover(const QString& serviceType, uint16_t port,
                              const QString& domain)
{
    ConfigError error = checkDiscover(serviceType, config_);
    if (error != ConfigError::None)
        return error;
    if (!discovery_)
        return ConfigError::DiscoveryUnavailable;

    teardown();
    connectPort_ = port != 0 ? port : config_.defaultPort;
    link_.reset();
    handshakeAttempts_ = 0;
    setState(ConnectionState::connecting());
    discovery_->search(serviceType, domain, config_.discoveryTimeoutMs);
    return ConfigError::None;
}

ConfigError Session::connectToHost(const QString& host, uint16_t port)
{
    ConfigError error = checkConnect(host, port, config_);
    if (error != ConfigError::None)
        return error;

    teardown();
    startConnection(host, port);
    return ConfigError::None;
}

bool Session::send(const QString& payload)
{
    if (!state_.isActive() || !transport_->isReady())
        return false;

    transport_->send(payload);
    return true;
}

void Session::close()
{
    close(config_.sendDisconnectOnClose);
}

void Session::close(bool notifyPeer, const ConnectionState& finalState)
{
    if (!state_.isActive())
        return;

    if (notifyPeer && transport_->isReady()) {
        qInfo() << "[Session] Notifying peer of disconnect";
        transport_->send(controlMessage(ControlMessage::Disconnect));
    }

    teardown();
    setState(finalState);
}

float Session::fetchConnectionStrength()
{
    float current = link_.strength();
    reportStrength(current);
    return current;
}

void Session::teardown()
{
    ++epoch_;
    cancelAckTimers();
    if (discovery_)
        discovery_->stop();
    if (resolver_)
        resolver_->cancel();
    transport_->close();
}

void Session::startConnection(const QString& host, uint16_t port)
{
    link_.reset();
    handshakeAttempts_ = 0;
    setState(ConnectionState::connecting());

    qInfo() << "[Session] Connecting to" << host << "port" << port;
    transport_->open(host, port);
}

void Session::sendDiscover()
{
    ++handshakeAttempts_;
    qDebug() << "[Session] Handshake attempt" << handshakeAttempts_
             << "of" << config_.maxHandshakeAttempts;
    transport_->send(discoverMessage(config_.deviceName));
}

void Session::armAckTimer(bool handshake)
{
    auto* timer = new QTimer(this);
    timer->setSingleShot(true);

    const quint64 epoch = epoch_;
    connect(timer, &QTimer::timeout, this, [this, timer, epoch, handshake]() {
        onAckTimeout(timer, epoch, handshake);
    });

    ackTimers_.append(timer);
    timer->start(config_.ackTimeoutMs);
}

void Session::cancelAckTimers()
{
    // Drain into a local list first, a timer slot may append meanwhile.
    QList<QTimer*> timers;
    timers.swap(ackTimers_);

    for (QTimer* timer : timers) {
        timer->stop();
        timer->deleteLater();
    }
}

void Session::setState(const ConnectionState& state)
{
    if (state == state_)
        return;

    state_ = state;
    if (state.kind == SessionState::Failed)
        qWarning() << "[Session] State:" << toString(state.kind) << toString(state.reason);
    else
        qInfo() << "[Session] State:" << toString(state.kind);

    if (observer_)
        observer_->onConnectionState(state_);
    emit stateChanged(state_);
}

void Session::reportStrength(float strength)
{
    if (observer_)
        observer_->onConnectionStrength(strength);
    emit strengthChanged(strength);
}

void Session::onServiceDiscovered(quint64 searchId, const DiscoveredService& service)
{
    if (state_.kind != SessionState::Connecting || searchId != discovery_->currentSearch())
        return;

    qInfo() << "[Session] Found service" << service.name;
    discovery_->stop();
    resolver_->resolve(service, config_.resolveTimeoutMs);
}

void Session::onSearchTimedOut(quint64 searchId)
{
    if (state_.kind != SessionState::Connecting || searchId != discovery_->currentSearch())
        return;

    close(false, ConnectionState::failed(SessionError::DiscoverTimeout));
}

void Session::onServiceResolved(quint64 resolveId, const DiscoveredService& service)
{
    if (state_.kind != SessionState::Connecting || resolveId != resolver_->currentResolve())
        return;

    startConnection(service.address.toString(), connectPort_);
}

void Session::onResolveFailed(quint64 resolveId, SessionError error)
{
    if (state_.kind != SessionState::Connecting || resolveId != resolver_->currentResolve())
        return;

    close(false, ConnectionState::failed(error));
}

void Session::onTransportReady()
{
    if (state_.kind != SessionState::Connecting)
        return;

    sendDiscover();
}

void Session::onTransportFailed(int error)
{
    if (!state_.isActive())
        return;

    qWarning() << "[Session] Transport error, errno" << error;
    teardown();
    setState(stateForPosixError(error));
}

void Session::onMessageSent(const QString& message)
{
    if (!state_.isActive())
        return;

    link_.recordSent();
    if (containsToken(message, ControlMessage::Disconnect))
        return;

    armAckTimer(containsToken(message, ControlMessage::Discover));
}

void Session::onMessageReceived(const QString& message)
{
    if (!state_.isActive())
        return;

    link_.recordReceived();
    cancelAckTimers();

    // Observer callbacks may start a new attempt
    const quint64 epoch = epoch_;
    if (state_.kind == SessionState::Connecting
        && containsToken(message, ControlMessage::Handshake)) {
        qInfo() << "[Session] Handshake complete after" << handshakeAttempts_ << "attempt(s)";
        setState(ConnectionState::connected());
        if (epoch != epoch_)
            return;
    }

    if (containsToken(message, ControlMessage::Disconnect)) {
        qInfo() << "[Session] Peer disconnected";
        close(false);
        return;
    }

    if (!isControlMessage(message))
        emit messageReceived(message);
    if (epoch != epoch_)
        return;

    reportStrength(link_.recordAck(true, state_.kind == SessionState::Connected));
}

void Session::onAckTimeout(QTimer* timer, quint64 epoch, bool handshake)
{
    if (!ackTimers_.removeOne(timer))
        return;
    timer->deleteLater();

    if (epoch != epoch_ || !state_.isActive())
        return;

    const bool connected = state_.kind == SessionState::Connected;
    float current = link_.recordAck(false, connected);
    reportStrength(current);
    // The observer may have started a new attempt
    if (epoch != epoch_)
        return;

    if (!connected) {
        if (!handshake)
            return;
        if (handshakeAttempts_ >= config_.maxHandshakeAttempts) {
            qWarning() << "[Session] No handshake after" << handshakeAttempts_ << "attempts";
            close(false, ConnectionState::failed(SessionError::ConnectShakeNoResponse));
            return;
        }
        sendDiscover();
        return;
    }

    if (link_.isLinkDead(current)) {
        qWarning() << "[Session] Link strength" << current << "% below threshold, closing";
        close(false);
    }
}

} // namespace dscv
