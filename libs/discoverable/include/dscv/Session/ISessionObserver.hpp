#pragma once

#include <dscv/Session/SessionState.hpp>

namespace dscv {

/// Receives session updates. Called on the thread the Session lives on;
/// BackgroundSession redispatches to the caller's thread.
class ISessionObserver {
public:
    virtual ~ISessionObserver() = default;

    virtual void onConnectionState(const ConnectionState& state) = 0;
    virtual void onConnectionStrength(float percent) = 0;
};

} // namespace dscv
