#pragma once

#include <QMetaType>
#include <cstdint>

namespace dscv {

enum class SessionState {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

/// Reason carried by SessionState::Failed.
/// Connect* values come from the packet transport (POSIX codes) or the
/// handshake, Discover* values from browsing and resolving.
enum class SessionError {
    None,
    ConnectOther,
    ConnectAddressUnavailable,
    ConnectPermissionDenied,
    ConnectDeviceBusy,
    ConnectCanceled,
    ConnectRefused,
    ConnectHostDown,
    ConnectAlreadyConnected,
    ConnectTimeout,
    ConnectNetworkDown,
    ConnectShakeNoResponse,
    DiscoverTimeout,
    DiscoverResolveServiceNotFound,
    DiscoverResolveBusy,
    DiscoverIncorrectConfiguration,
    DiscoverResolveCanceled,
    DiscoverResolveTimeout,
    DiscoverResolveFailed,
    DiscoverResolveUnknown
};

/// Caller misuse, rejected before any I/O is attempted.
enum class ConfigError {
    None,
    InvalidServiceType,
    InvalidHost,
    InvalidPort,
    MissingDeviceName,
    DiscoveryUnavailable
};

/// DNS-SD resolver error codes. Discovery backends translate their native
/// errors into this table before reporting a failed resolve.
namespace ResolverCode {
    constexpr int UNKNOWN           = -72000;
    constexpr int NOT_FOUND         = -72002;
    constexpr int ACTIVITY_IN_PROGRESS = -72003;
    constexpr int BAD_ARGUMENT      = -72004;
    constexpr int CANCELLED         = -72005;
    constexpr int INVALID           = -72006;
    constexpr int TIMEOUT           = -72007;
}

struct ConnectionState {
    SessionState kind = SessionState::Disconnected;
    SessionError reason = SessionError::None;

    static ConnectionState disconnected() { return {SessionState::Disconnected, SessionError::None}; }
    static ConnectionState connecting() { return {SessionState::Connecting, SessionError::None}; }
    static ConnectionState connected() { return {SessionState::Connected, SessionError::None}; }
    static ConnectionState failed(SessionError reason) { return {SessionState::Failed, reason}; }

    bool isActive() const
    {
        return kind == SessionState::Connecting || kind == SessionState::Connected;
    }

    bool operator==(const ConnectionState& other) const
    {
        return kind == other.kind && reason == other.reason;
    }
    bool operator!=(const ConnectionState& other) const { return !(*this == other); }
};

/// Maps a packet transport error. ENOTCONN yields a plain disconnect,
/// unmapped codes collapse to ConnectOther.
ConnectionState stateForPosixError(int code);

/// Unmapped codes collapse to DiscoverResolveUnknown.
SessionError resolveErrorFromCode(int code);

const char* toString(SessionState state);
const char* toString(SessionError error);
const char* toString(ConfigError error);

} // namespace dscv

Q_DECLARE_METATYPE(dscv::SessionState)
Q_DECLARE_METATYPE(dscv::SessionError)
Q_DECLARE_METATYPE(dscv::ConnectionState)
