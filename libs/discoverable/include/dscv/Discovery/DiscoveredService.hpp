#pragma once

#include <QHostAddress>
#include <QMetaType>
#include <QString>
#include <cstdint>

namespace dscv {

/// A DNS-SD service instance found while browsing. `address` stays null
/// until the AddressResolver fills it in.
struct DiscoveredService {
    QString name;
    QString type;
    QString domain;
    QHostAddress address;
    uint16_t port = 0;

    bool isResolved() const { return !address.isNull(); }

    /// Same service instance, ignoring resolution results.
    bool sameInstance(const DiscoveredService& other) const
    {
        return name == other.name && type == other.type && domain == other.domain;
    }
};

} // namespace dscv

Q_DECLARE_METATYPE(dscv::DiscoveredService)
