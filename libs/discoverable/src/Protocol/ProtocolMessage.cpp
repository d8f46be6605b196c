#include <dscv/Protocol/ProtocolMessage.hpp>

namespace dscv {

QString discoverMessage(const QString& deviceName)
{
    return QLatin1String(ProtocolToken::DISCOVER) + QLatin1Char(':') + deviceName;
}

QString controlMessage(ControlMessage message)
{
    switch (message) {
    case ControlMessage::Discover:    return QLatin1String(ProtocolToken::DISCOVER);
    case ControlMessage::Handshake:   return QLatin1String(ProtocolToken::HANDSHAKE);
    case ControlMessage::Acknowledge: return QLatin1String(ProtocolToken::ACKNOWLEDGE);
    case ControlMessage::Disconnect:  return QLatin1String(ProtocolToken::DISCONNECT);
    }
    return {};
}

bool containsToken(const QString& datagram, ControlMessage message)
{
    return datagram.contains(controlMessage(message));
}

bool isControlMessage(const QString& datagram)
{
    return containsToken(datagram, ControlMessage::Discover)
        || containsToken(datagram, ControlMessage::Handshake)
        || containsToken(datagram, ControlMessage::Acknowledge)
        || containsToken(datagram, ControlMessage::Disconnect);
}

} // namespace dscv
