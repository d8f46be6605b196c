#include "core/SessionLogger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <cmath>

namespace dscv {
namespace client {

void initLogging(bool verbose)
{
    namespace logging = boost::log;
    logging::core::get()->set_filter(
        logging::trivial::severity >= (verbose ? logging::trivial::debug
                                               : logging::trivial::info));
}

void SessionLogger::onConnectionState(const ConnectionState& state)
{
    ++stateChanges_;
    if (state.kind == SessionState::Failed) {
        BOOST_LOG_TRIVIAL(error) << "[Client] Session failed: " << toString(state.reason);
        return;
    }
    BOOST_LOG_TRIVIAL(info) << "[Client] Session " << toString(state.kind);
}

void SessionLogger::onConnectionStrength(float percent)
{
    if (lastStrength_ < 0.0f || std::fabs(percent - lastStrength_) >= strengthStep_)
        BOOST_LOG_TRIVIAL(info) << "[Client] Link strength " << percent << "%";
    else
        BOOST_LOG_TRIVIAL(debug) << "[Client] Link strength " << percent << "%";
    lastStrength_ = percent;
}

void SessionLogger::onPayload(const QString& payload)
{
    BOOST_LOG_TRIVIAL(info) << "[Client] <- " << payload.toStdString();
}

void SessionLogger::onSendRejected(const QString& payload)
{
    BOOST_LOG_TRIVIAL(warning) << "[Client] Not connected, dropped: " << payload.toStdString();
}

} // namespace client
} // namespace dscv
