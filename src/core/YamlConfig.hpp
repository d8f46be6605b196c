#pragma once

#include <QString>
#include <QVariant>
#include <cstdint>
#include <yaml-cpp/yaml.h>

#include <dscv/Session/SessionConfig.hpp>

namespace dscv {
namespace client {

class YamlConfig {
public:
    YamlConfig();

    /// Merges the file over the defaults. Throws YAML::Exception on a
    /// missing or malformed file.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    // Identity
    QString deviceName() const;
    void setDeviceName(const QString& v);

    // Discovery
    QString serviceType() const;
    void setServiceType(const QString& v);
    QString domain() const;
    void setDomain(const QString& v);
    int discoveryTimeoutMs() const;
    int resolveTimeoutMs() const;

    // Connection. An empty host means "discover".
    QString host() const;
    void setHost(const QString& v);
    uint16_t port() const;
    void setPort(uint16_t v);
    int ackTimeoutMs() const;
    int handshakeAttempts() const;
    bool disconnectOnClose() const;

    // Link quality
    int linkWindow() const;
    double deadThreshold() const;

    // Generic dot-path access (e.g. "connection.ack_timeout_ms")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

    SessionConfig toSessionConfig() const;

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace client
} // namespace dscv
