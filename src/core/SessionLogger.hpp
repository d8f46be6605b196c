#pragma once

#include <QString>
#include <dscv/Session/ISessionObserver.hpp>

namespace dscv {
namespace client {

/// Reports session activity through Boost.Log.
class SessionLogger : public ISessionObserver {
public:
    void onConnectionState(const ConnectionState& state) override;
    void onConnectionStrength(float percent) override;

    void onPayload(const QString& payload);
    void onSendRejected(const QString& payload);

    /// Strength changes smaller than this are logged at debug level.
    void setStrengthStep(float step) { strengthStep_ = step; }

    float lastStrength() const { return lastStrength_; }
    int stateChanges() const { return stateChanges_; }

private:
    float strengthStep_ = 10.0f;
    float lastStrength_ = -1.0f;
    int stateChanges_ = 0;
};

/// Sets the Boost.Log severity floor: debug when verbose, info otherwise.
void initLogging(bool verbose);

} // namespace client
} // namespace dscv
