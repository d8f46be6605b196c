#pragma once

#include <QFile>
#include <QObject>
#include <QSocketNotifier>
#include <QString>

namespace dscv {
namespace client {

/// Splits a readable file descriptor (stdin, a pipe) into trimmed lines.
/// Blank lines are skipped; finished() follows end of input once.
class LineReader : public QObject {
    Q_OBJECT
public:
    explicit LineReader(QObject* parent = nullptr);

    /// Does not take ownership of the descriptor.
    bool open(int fd);

signals:
    void lineRead(const QString& line);
    void finished();

private:
    void onActivated();

    QFile input_;
    QSocketNotifier* notifier_ = nullptr;
};

} // namespace client
} // namespace dscv
