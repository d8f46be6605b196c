#include <dscv/Session/BackgroundSession.hpp>
#include <QDebug>
#include <QMetaObject>

namespace dscv {

BackgroundSession::BackgroundSession(std::unique_ptr<IDiscoveryBackend> discovery,
                                     std::unique_ptr<IDatagramTransport> transport,
                                     const SessionConfig& config,
                                     ISessionObserver* observer,
                                     QObject* parent)
    : QObject(parent)
    , config_(config)
    , observer_(observer)
    , discovery_(discovery.release())
    , transport_(transport.release())
    , session_(new Session(discovery_, transport_, config))
{
    qRegisterMetaType<dscv::ConnectionState>();
    thread_.setObjectName(QStringLiteral("dscv-session"));

    // Deleted on the worker once its loop has stopped, session first.
    session_->moveToThread(&thread_);
    connect(&thread_, &QThread::finished, session_, &QObject::deleteLater);
    transport_->moveToThread(&thread_);
    connect(&thread_, &QThread::finished, transport_, &QObject::deleteLater);
    if (discovery_) {
        discovery_->moveToThread(&thread_);
        connect(&thread_, &QThread::finished, discovery_, &QObject::deleteLater);
    }

    connect(session_, &Session::stateChanged,
            this, &BackgroundSession::onSessionState, Qt::QueuedConnection);
    connect(session_, &Session::strengthChanged,
            this, &BackgroundSession::onSessionStrength, Qt::QueuedConnection);
    connect(session_, &Session::messageReceived,
            this, &BackgroundSession::messageReceived, Qt::QueuedConnection);

    thread_.start();
}

BackgroundSession::~BackgroundSession()
{
    thread_.quit();
    thread_.wait();
}

ConfigError BackgroundSession::discover(const QString& serviceType, uint16_t port,
                                        const QString& domain)
{
    ConfigError error = Session::checkDiscover(serviceType, config_);
    if (error != ConfigError::None)
        return error;
    if (!discovery_)
        return ConfigError::DiscoveryUnavailable;

    Session* session = session_;
    QMetaObject::invokeMethod(session_, [session, serviceType, port, domain]() {
        ConfigError result = session->discover(serviceType, port, domain);
        if (result != ConfigError::None)
            qWarning() << "[Session] discover rejected:" << toString(result);
    }, Qt::QueuedConnection);
    return ConfigError::None;
}

ConfigError BackgroundSession::connectToHost(const QString& host, uint16_t port)
{
    ConfigError error = Session::checkConnect(host, port, config_);
    if (error != ConfigError::None)
        return error;

    Session* session = session_;
    QMetaObject::invokeMethod(session_, [session, host, port]() {
        ConfigError result = session->connectToHost(host, port);
        if (result != ConfigError::None)
            qWarning() << "[Session] connect rejected:" << toString(result);
    }, Qt::QueuedConnection);
    return ConfigError::None;
}

void BackgroundSession::send(const QString& payload)
{
    Session* session = session_;
    QMetaObject::invokeMethod(session_, [this, session, payload]() {
        if (session->send(payload))
            return;
        QMetaObject::invokeMethod(this, [this, payload]() {
            emit sendRejected(payload);
        }, Qt::QueuedConnection);
    }, Qt::QueuedConnection);
}

void BackgroundSession::close()
{
    Session* session = session_;
    QMetaObject::invokeMethod(session_, [session]() {
        session->close();
    }, Qt::QueuedConnection);
}

void BackgroundSession::fetchConnectionStrength()
{
    Session* session = session_;
    QMetaObject::invokeMethod(session_, [session]() {
        session->fetchConnectionStrength();
    }, Qt::QueuedConnection);
}

void BackgroundSession::onSessionState(const ConnectionState& state)
{
    state_ = state;
    if (observer_)
        observer_->onConnectionState(state);
    emit stateChanged(state);
}

void BackgroundSession::onSessionStrength(float percent)
{
    strength_ = percent;
    if (observer_)
        observer_->onConnectionStrength(percent);
    emit strengthChanged(percent);
}

} // namespace dscv
