#pragma once

#include <dscv/Transport/IDatagramTransport.hpp>
#include <QList>

namespace dscv {

class ReplayTransport : public IDatagramTransport {
    Q_OBJECT
public:
    explicit ReplayTransport(QObject* parent = nullptr);
    ~ReplayTransport() override;

    // IDatagramTransport interface
    void open(const QString& host, uint16_t port) override;
    void close() override;
    void send(const QByteArray& datagram, SendCompletion completion) override;
    bool isReady() const override;

    // Test API
    void simulateReady();
    void simulateFailure(int error);
    void feedDatagram(const QByteArray& datagram);
    void setSendError(int error) { sendError_ = error; }

    QList<QByteArray> writtenData() const;
    int writtenCount(const QByteArray& needle) const;
    void clearWritten();

    QString host() const { return host_; }
    uint16_t port() const { return port_; }
    int openCount() const { return openCount_; }
    int closeCount() const { return closeCount_; }

private:
    bool open_ = false;
    bool ready_ = false;
    QString host_;
    uint16_t port_ = 0;
    int openCount_ = 0;
    int closeCount_ = 0;
    int sendError_ = 0;
    QList<QByteArray> written_;
};

} // namespace dscv
