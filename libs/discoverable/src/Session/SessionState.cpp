#include <dscv/Session/SessionState.hpp>
#include <QDebug>
#include <cerrno>

namespace dscv {

ConnectionState stateForPosixError(int code)
{
    switch (code) {
    case EADDRINUSE:
    case EADDRNOTAVAIL:
        return ConnectionState::failed(SessionError::ConnectAddressUnavailable);
    case EACCES:
    case EPERM:
        return ConnectionState::failed(SessionError::ConnectPermissionDenied);
    case EBUSY:
        return ConnectionState::failed(SessionError::ConnectDeviceBusy);
    case ECANCELED:
        return ConnectionState::failed(SessionError::ConnectCanceled);
    case ECONNREFUSED:
        return ConnectionState::failed(SessionError::ConnectRefused);
    case EHOSTDOWN:
    case EHOSTUNREACH:
        return ConnectionState::failed(SessionError::ConnectHostDown);
    case EISCONN:
        return ConnectionState::failed(SessionError::ConnectAlreadyConnected);
    case ENOTCONN:
        return ConnectionState::disconnected();
    case ETIMEDOUT:
        return ConnectionState::failed(SessionError::ConnectTimeout);
    case ENETDOWN:
    case ENETUNREACH:
    case ENETRESET:
        return ConnectionState::failed(SessionError::ConnectNetworkDown);
    default:
        qWarning() << "[Session] Unmapped POSIX connection error:" << code;
        return ConnectionState::failed(SessionError::ConnectOther);
    }
}

SessionError resolveErrorFromCode(int code)
{
    switch (code) {
    case ResolverCode::NOT_FOUND:
        return SessionError::DiscoverResolveServiceNotFound;
    case ResolverCode::ACTIVITY_IN_PROGRESS:
        return SessionError::DiscoverResolveBusy;
    case ResolverCode::BAD_ARGUMENT:
    case ResolverCode::INVALID:
        return SessionError::DiscoverIncorrectConfiguration;
    case ResolverCode::CANCELLED:
        return SessionError::DiscoverResolveCanceled;
    case ResolverCode::TIMEOUT:
        return SessionError::DiscoverResolveTimeout;
    default:
        return SessionError::DiscoverResolveUnknown;
    }
}

const char* toString(SessionState state)
{
    switch (state) {
    case SessionState::Disconnected: return "disconnected";
    case SessionState::Connecting:   return "connecting";
    case SessionState::Connected:    return "connected";
    case SessionState::Failed:       return "failed";
    }
    return "unknown";
}

const char* toString(SessionError error)
{
    switch (error) {
    case SessionError::None:                           return "none";
    case SessionError::ConnectOther:                   return "connectOther";
    case SessionError::ConnectAddressUnavailable:      return "connectAddressUnavailable";
    case SessionError::ConnectPermissionDenied:        return "connectPermissionDenied";
    case SessionError::ConnectDeviceBusy:              return "connectDeviceBusy";
    case SessionError::ConnectCanceled:                return "connectCanceled";
    case SessionError::ConnectRefused:                 return "connectRefused";
    case SessionError::ConnectHostDown:                return "connectHostDown";
    case SessionError::ConnectAlreadyConnected:        return "connectAlreadyConnected";
    case SessionError::ConnectTimeout:                 return "connectTimeout";
    case SessionError::ConnectNetworkDown:             return "connectNetworkDown";
    case SessionError::ConnectShakeNoResponse:         return "connectShakeNoResponse";
    case SessionError::DiscoverTimeout:                return "discoverTimeout";
    case SessionError::DiscoverResolveServiceNotFound: return "discoverResolveServiceNotFound";
    case SessionError::DiscoverResolveBusy:            return "discoverResolveBusy";
    case SessionError::DiscoverIncorrectConfiguration: return "discoverIncorrectConfiguration";
    case SessionError::DiscoverResolveCanceled:        return "discoverResolveCanceled";
    case SessionError::DiscoverResolveTimeout:         return "discoverResolveTimeout";
    case SessionError::DiscoverResolveFailed:          return "discoverResolveFailed";
    case SessionError::DiscoverResolveUnknown:         return "discoverResolveUnknown";
    }
    return "unknown";
}

const char* toString(ConfigError error)
{
    switch (error) {
    case ConfigError::None:               return "none";
    case ConfigError::InvalidServiceType: return "invalidServiceType";
    case ConfigError::InvalidHost:        return "invalidHost";
    case ConfigError::InvalidPort:        return "invalidPort";
    case ConfigError::MissingDeviceName:  return "missingDeviceName";
    case ConfigError::DiscoveryUnavailable: return "discoveryUnavailable";
    }
    return "unknown";
}

} // namespace dscv
