#include "network/stdio_core_link.hpp"
#include "network/json_wire.hpp"
#include "core/log.hpp"

#include <QFileDevice>
#include <cerrno>
#include <unistd.h>

namespace tether::network {
namespace {

constexpr int kReadChunk = 64 * 1024;

} // namespace

StdioCoreLink::StdioCoreLink(int input_fd, QIODevice* output, QObject* parent)
    : QObject(parent)
    , input_fd_(input_fd)
    , output_(output)
{
}

StdioCoreLink::~StdioCoreLink() {
    stop();
}

Result<void, Error> StdioCoreLink::start() {
    if (notifier_) {
        return Result<void, Error>::ok();
    }
    if (input_fd_ < 0) {
        return Result<void, Error>::err(Error{"no input descriptor", ErrorCode::NotInitialized});
    }

    notifier_ = std::make_unique<QSocketNotifier>(input_fd_, QSocketNotifier::Read, this);
    connect(notifier_.get(), &QSocketNotifier::activated, this, &StdioCoreLink::onReadable);
    qCInfo(tetherLinkLog) << "listening for Core events on fd" << input_fd_;
    return Result<void, Error>::ok();
}

void StdioCoreLink::stop() {
    if (notifier_) {
        // May run inside the notifier's own activated() emission.
        notifier_->setEnabled(false);
        notifier_.release()->deleteLater();
    }
}

Result<void, Error> StdioCoreLink::send(const commands::Request& request) {
    if (!output_ || !output_->isWritable()) {
        return Result<void, Error>::err(Error{"Core output not writable", ErrorCode::NotInitialized});
    }

    QByteArray line = encode_request(request);
    line.append('\n');
    if (output_->write(line) != line.size()) {
        return Result<void, Error>::err(Error{output_->errorString().toStdString(), ErrorCode::CommandRejected});
    }
    if (auto* file = qobject_cast<QFileDevice*>(output_)) {
        file->flush();
    }
    return Result<void, Error>::ok();
}

void StdioCoreLink::feed(const QByteArray& chunk) {
    if (finished_) {
        return;
    }

    buffer_.append(chunk);
    qsizetype newline = buffer_.indexOf('\n');
    while (newline >= 0) {
        const QByteArray line = buffer_.left(newline);
        buffer_.remove(0, newline + 1);
        handleLine(line);
        newline = buffer_.indexOf('\n');
    }
}

void StdioCoreLink::finish() {
    if (finished_) {
        return;
    }
    if (!buffer_.isEmpty()) {
        handleLine(buffer_);
        buffer_.clear();
    }
    finished_ = true;
    stop();
    qCInfo(tetherLinkLog) << "Core event stream ended";
    if (on_closed) {
        on_closed();
    }
}

void StdioCoreLink::onReadable() {
    char data[kReadChunk];
    const ssize_t n = ::read(input_fd_, data, sizeof(data));
    if (n > 0) {
        feed(QByteArray(data, static_cast<qsizetype>(n)));
        return;
    }
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
        return;
    }
    if (n < 0) {
        qCWarning(tetherLinkLog) << "read failed, errno" << errno;
    }
    finish();
}

void StdioCoreLink::handleLine(const QByteArray& line) {
    const QByteArray trimmed = line.trimmed();
    if (trimmed.isEmpty()) {
        return;
    }

    auto event = decode_core_event(trimmed);
    if (event.is_err()) {
        ++dropped_lines_;
        qCWarning(tetherLinkLog) << "dropping malformed Core line:"
                                 << QString::fromStdString(event.unwrap_err().message);
        return;
    }
    if (on_event) {
        on_event(std::move(event).unwrap());
    }
}

} // namespace tether::network
