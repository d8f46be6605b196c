#pragma once

#include <QString>

namespace dscv {

/// Control tokens of the dscv wire protocol. Each is sent as a whole
/// UTF-8 datagram; inbound datagrams are matched by substring containment.
namespace ProtocolToken {
    constexpr const char* DISCOVER   = "dscv_discover";
    constexpr const char* HANDSHAKE  = "dscv_shake";
    constexpr const char* ACKNOWLEDGE = "dscv_ack";
    constexpr const char* DISCONNECT = "dscv_disconnect";
}

enum class ControlMessage {
    Discover,
    Handshake,
    Acknowledge,
    Disconnect
};

/// "dscv_discover:<deviceName>"
QString discoverMessage(const QString& deviceName);
QString controlMessage(ControlMessage message);

bool containsToken(const QString& datagram, ControlMessage message);

/// True when the datagram carries any control token, i.e. is not an
/// application payload.
bool isControlMessage(const QString& datagram);

} // namespace dscv
