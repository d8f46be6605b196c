#include <signal.h>
#include <unistd.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <memory>
#include <boost/log/trivial.hpp>

#include <dscv/Session/BackgroundSession.hpp>
#include <dscv/Transport/UdpTransport.hpp>
#ifdef DSCV_HAS_AVAHI
#include <dscv/Discovery/AvahiDiscoveryBackend.hpp>
#endif

#include "core/LineReader.hpp"
#include "core/SessionLogger.hpp"
#include "core/YamlConfig.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("dscv-client");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Connects to a discoverable datagram service; "
                                     "stdin lines are sent as payloads.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption("config", "YAML configuration file.", "path");
    QCommandLineOption hostOption("host", "Connect to this host instead of browsing.", "host");
    QCommandLineOption portOption("port", "Service port.", "port");
    QCommandLineOption typeOption("type", "DNS-SD service type, e.g. _chat._udp.", "type");
    QCommandLineOption nameOption("name", "Device name sent in the greeting.", "name");
    QCommandLineOption verboseOption({"v", "verbose"}, "Log debug output.");
    parser.addOptions({configOption, hostOption, portOption, typeOption, nameOption, verboseOption});
    parser.process(app);

    dscv::client::initLogging(parser.isSet(verboseOption));

    // Explicit --config must exist; the default path is optional
    dscv::client::YamlConfig config;
    QString yamlPath = parser.value(configOption);
    const bool explicitConfig = !yamlPath.isEmpty();
    if (!explicitConfig)
        yamlPath = QDir::homePath() + "/.config/dscv/client.yaml";
    if (explicitConfig || QFile::exists(yamlPath)) {
        try {
            config.load(yamlPath);
            BOOST_LOG_TRIVIAL(info) << "[Client] Loaded " << yamlPath.toStdString();
        } catch (const YAML::Exception& e) {
            BOOST_LOG_TRIVIAL(error) << "[Client] Cannot load " << yamlPath.toStdString()
                                     << ": " << e.what();
            return 1;
        }
    }

    if (parser.isSet(hostOption))
        config.setHost(parser.value(hostOption));
    if (parser.isSet(typeOption))
        config.setServiceType(parser.value(typeOption));
    if (parser.isSet(nameOption))
        config.setDeviceName(parser.value(nameOption));
    if (parser.isSet(portOption)) {
        bool ok = false;
        uint port = parser.value(portOption).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            BOOST_LOG_TRIVIAL(error) << "[Client] Invalid port: "
                                     << parser.value(portOption).toStdString();
            return 1;
        }
        config.setPort(static_cast<uint16_t>(port));
    }

    std::unique_ptr<dscv::IDiscoveryBackend> discovery;
#ifdef DSCV_HAS_AVAHI
    discovery = std::make_unique<dscv::AvahiDiscoveryBackend>();
#endif

    dscv::client::SessionLogger logger;
    dscv::BackgroundSession session(std::move(discovery),
                                    std::make_unique<dscv::UdpTransport>(),
                                    config.toSessionConfig(),
                                    &logger);

    int exitCode = 0;
    QObject::connect(&session, &dscv::BackgroundSession::stateChanged,
                     &app, [&exitCode](const dscv::ConnectionState& state) {
        if (state.isActive())
            return;
        exitCode = state.kind == dscv::SessionState::Failed ? 2 : 0;
        QCoreApplication::quit();
    });
    QObject::connect(&session, &dscv::BackgroundSession::messageReceived,
                     &app, [&logger](const QString& payload) { logger.onPayload(payload); });
    QObject::connect(&session, &dscv::BackgroundSession::sendRejected,
                     &app, [&logger](const QString& payload) { logger.onSendRejected(payload); });

    dscv::ConfigError error = config.host().isEmpty()
        ? session.discover(config.serviceType(), config.port(), config.domain())
        : session.connectToHost(config.host(), config.port());
    if (error != dscv::ConfigError::None) {
        BOOST_LOG_TRIVIAL(error) << "[Client] Invalid configuration: " << dscv::toString(error);
        return 1;
    }

    // stdin: one payload per line, EOF closes the session
    dscv::client::LineReader input;
    if (!input.open(STDIN_FILENO))
        return 1;
    QObject::connect(&input, &dscv::client::LineReader::lineRead,
                     &app, [&session](const QString& line) { session.send(line); });
    QObject::connect(&input, &dscv::client::LineReader::finished, &app, [&session]() {
        BOOST_LOG_TRIVIAL(info) << "[Client] End of input, closing";
        if (session.state().isActive())
            session.close();
        else
            QCoreApplication::quit();
    });

    // SIGINT -> graceful close (disconnect datagram, then quit on state change)
    static dscv::BackgroundSession* g_session = &session;
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(qApp, []() {
            if (g_session->state().isActive())
                g_session->close();
            else
                QCoreApplication::quit();
        }, Qt::QueuedConnection);
    });

    int ret = app.exec();
    signal(SIGINT, SIG_DFL);
    return ret != 0 ? ret : exitCode;
}
