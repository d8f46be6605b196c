#include "core/YamlConfig.hpp"
#include "core/YamlMerge.hpp"
#include <QStringList>
#include <fstream>

#include <dscv/Version.hpp>

namespace dscv {
namespace client {

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["identity"]["device_name"] = "dscv-client";

    root_["discovery"]["service_type"] = "_discoverable._udp.";
    root_["discovery"]["domain"] = "";
    root_["discovery"]["timeout_ms"] = DISCOVERY_TIMEOUT_MS;
    root_["discovery"]["resolve_timeout_ms"] = RESOLVE_TIMEOUT_MS;

    root_["connection"]["host"] = "";
    root_["connection"]["port"] = static_cast<int>(DEFAULT_PORT);
    root_["connection"]["ack_timeout_ms"] = ACK_TIMEOUT_MS;
    root_["connection"]["handshake_attempts"] = MAX_HANDSHAKE_ATTEMPTS;
    root_["connection"]["disconnect_on_close"] = true;

    root_["link"]["window"] = STRENGTH_WINDOW;
    root_["link"]["dead_threshold"] = static_cast<double>(DEAD_LINK_THRESHOLD);
}

void YamlConfig::load(const QString& filePath)
{
    YAML::Node defaults = buildDefaultsNode();
    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = mergeYaml(defaults, loaded);
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

// --- Identity ---

QString YamlConfig::deviceName() const
{
    return QString::fromStdString(root_["identity"]["device_name"].as<std::string>(""));
}

void YamlConfig::setDeviceName(const QString& v)
{
    root_["identity"]["device_name"] = v.toStdString();
}

// --- Discovery ---

QString YamlConfig::serviceType() const
{
    return QString::fromStdString(root_["discovery"]["service_type"].as<std::string>(""));
}

void YamlConfig::setServiceType(const QString& v)
{
    root_["discovery"]["service_type"] = v.toStdString();
}

QString YamlConfig::domain() const
{
    return QString::fromStdString(root_["discovery"]["domain"].as<std::string>(""));
}

void YamlConfig::setDomain(const QString& v)
{
    root_["discovery"]["domain"] = v.toStdString();
}

int YamlConfig::discoveryTimeoutMs() const
{
    return root_["discovery"]["timeout_ms"].as<int>(DISCOVERY_TIMEOUT_MS);
}

int YamlConfig::resolveTimeoutMs() const
{
    return root_["discovery"]["resolve_timeout_ms"].as<int>(RESOLVE_TIMEOUT_MS);
}

// --- Connection ---

QString YamlConfig::host() const
{
    return QString::fromStdString(root_["connection"]["host"].as<std::string>(""));
}

void YamlConfig::setHost(const QString& v)
{
    root_["connection"]["host"] = v.toStdString();
}

uint16_t YamlConfig::port() const
{
    int port = root_["connection"]["port"].as<int>(DEFAULT_PORT);
    if (port <= 0 || port > 65535)
        return 0;
    return static_cast<uint16_t>(port);
}

void YamlConfig::setPort(uint16_t v)
{
    root_["connection"]["port"] = static_cast<int>(v);
}

int YamlConfig::ackTimeoutMs() const
{
    return root_["connection"]["ack_timeout_ms"].as<int>(ACK_TIMEOUT_MS);
}

int YamlConfig::handshakeAttempts() const
{
    return root_["connection"]["handshake_attempts"].as<int>(MAX_HANDSHAKE_ATTEMPTS);
}

bool YamlConfig::disconnectOnClose() const
{
    return root_["connection"]["disconnect_on_close"].as<bool>(true);
}

// --- Link quality ---

int YamlConfig::linkWindow() const
{
    return root_["link"]["window"].as<int>(STRENGTH_WINDOW);
}

double YamlConfig::deadThreshold() const
{
    return root_["link"]["dead_threshold"].as<double>(DEAD_LINK_THRESHOLD);
}

SessionConfig YamlConfig::toSessionConfig() const
{
    SessionConfig config;
    config.deviceName = deviceName();
    config.defaultPort = port() != 0 ? port() : DEFAULT_PORT;
    config.ackTimeoutMs = ackTimeoutMs();
    config.discoveryTimeoutMs = discoveryTimeoutMs();
    config.resolveTimeoutMs = resolveTimeoutMs();
    config.maxHandshakeAttempts = handshakeAttempts();
    config.strengthWindow = boundedStrengthWindow(linkWindow());
    config.deadLinkThreshold = static_cast<float>(deadThreshold());
    config.sendDisconnectOnClose = disconnectOnClose();
    return config;
}

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());

    if (s == QLatin1String("true")) return QVariant(true);
    if (s == QLatin1String("false")) return QVariant(false);

    bool intOk = false;
    int i = s.toInt(&intOk);
    if (intOk) return QVariant(i);

    bool dblOk = false;
    double d = s.toDouble(&dblOk);
    if (dblOk) return QVariant(d);

    return QVariant(s);
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return yamlScalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only leaves of the defaults tree are writable
    {
        YAML::Node defaults = buildDefaultsNode();
        for (const auto& part : parts) {
            if (!defaults.IsMap()) return false;
            defaults.reset(defaults[part.toStdString()]);
            if (!defaults.IsDefined()) return false;
        }
        if (!defaults.IsScalar()) return false;
    }

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i) {
        if (!node.IsMap()) return false;
        node.reset(node[parts[i].toStdString()]);
    }

    const std::string leafKey = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leafKey] = value.toBool();
        break;
    case QMetaType::Int:
    case QMetaType::UInt:
        node[leafKey] = value.toInt();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[leafKey] = value.toDouble();
        break;
    default:
        node[leafKey] = value.toString().toStdString();
        break;
    }

    return true;
}

} // namespace client
} // namespace dscv
