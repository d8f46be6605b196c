#pragma once

#include <QString>
#include <cstdint>

#include <dscv/Version.hpp>

namespace dscv {

struct SessionConfig {
    // Appended to the discover greeting: "dscv_discover:<deviceName>"
    QString deviceName;

    // Used when discover() is given no port
    uint16_t defaultPort = DEFAULT_PORT;

    // Timeouts (ms)
    int ackTimeoutMs = ACK_TIMEOUT_MS;
    int discoveryTimeoutMs = DISCOVERY_TIMEOUT_MS;
    int resolveTimeoutMs = RESOLVE_TIMEOUT_MS;

    // Discover datagrams sent before giving up with ConnectShakeNoResponse
    int maxHandshakeAttempts = MAX_HANDSHAKE_ATTEMPTS;

    // Link quality: number of samples averaged, and the mean strength
    // (percent) below which a connected link is considered dead
    int strengthWindow = STRENGTH_WINDOW;
    float deadLinkThreshold = DEAD_LINK_THRESHOLD;

    // close() without arguments tells the peer to shut down too
    bool sendDisconnectOnClose = true;
};

// The strength buffer never exceeds STRENGTH_WINDOW samples.
// Values outside 1..STRENGTH_WINDOW select the full window.
inline int boundedStrengthWindow(int window)
{
    if (window < 1 || window > STRENGTH_WINDOW)
        return STRENGTH_WINDOW;
    return window;
}

} // namespace dscv
