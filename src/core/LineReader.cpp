#include "core/LineReader.hpp"
#include <boost/log/trivial.hpp>

namespace dscv {
namespace client {

LineReader::LineReader(QObject* parent)
    : QObject(parent)
{
}

bool LineReader::open(int fd)
{
    if (!input_.open(fd, QIODevice::ReadOnly)) {
        BOOST_LOG_TRIVIAL(error) << "[Client] Cannot read fd " << fd << ": "
                                 << input_.errorString().toStdString();
        return false;
    }

    notifier_ = new QSocketNotifier(fd, QSocketNotifier::Read, this);
    connect(notifier_, &QSocketNotifier::activated, this, &LineReader::onActivated);
    return true;
}

void LineReader::onActivated()
{
    // One read may carry several lines; drain the whole buffer
    do {
        QByteArray line = input_.readLine();
        if (line.isEmpty()) {
            BOOST_LOG_TRIVIAL(debug) << "[Client] End of input";
            notifier_->setEnabled(false);
            emit finished();
            return;
        }
        QString payload = QString::fromUtf8(line).trimmed();
        if (!payload.isEmpty())
            emit lineRead(payload);
    } while (input_.canReadLine());
}

} // namespace client
} // namespace dscv
