#include "network/command_dispatcher.hpp"
#include "core/log.hpp"

namespace tether::network {

using namespace tether::commands;

CommandDispatcher::CommandDispatcher(QObject* parent)
    : QObject(parent)
{
}

void CommandDispatcher::setChannel(CoreChannel* channel) {
    channel_ = channel;
}

Result<void, Error> CommandDispatcher::dispatch(const Request& request) {
    const auto name = command_name(request.command);

    if (!channel_) {
        qCWarning(tetherCommandsLog) << name.data() << "for" << request.device.value()
                                     << "dropped: Core link not initialized";
        return Result<void, Error>::err(Error{"Core link not initialized", ErrorCode::NotInitialized});
    }

    auto sent = channel_->send(request).inspect_err([&](const Error& e) {
        qCWarning(tetherCommandsLog) << name.data() << "for" << request.device.value()
                                     << "failed:" << QString::fromStdString(e.message);
    });
    if (sent.is_err()) {
        return sent;
    }

    qCDebug(tetherCommandsLog) << name.data() << "sent to" << request.device.value();
    return sent;
}

void CommandDispatcher::fire(const DeviceId& device, CoreCommand command) {
    const auto name = command_name(command);
    dispatch(Request{.device = device, .command = std::move(command)}).inspect_err([&](const Error& e) {
        emit commandFailed(QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size())),
                           QString::fromStdString(e.message));
    });
}

void CommandDispatcher::pair(const DeviceId& device) {
    fire(device, Pair{});
}

void CommandDispatcher::unpair(const DeviceId& device) {
    fire(device, Unpair{});
}

void CommandDispatcher::acceptPairing(const DeviceId& device) {
    pair(device);
}

void CommandDispatcher::rejectPairing(const DeviceId& device) {
    unpair(device);
}

void CommandDispatcher::ping(const DeviceId& device) {
    ping(device, ping_message_);
}

void CommandDispatcher::ping(const DeviceId& device, const QString& message) {
    fire(device, Ping{.message = message});
}

void CommandDispatcher::ring(const DeviceId& device) {
    fire(device, Ping{.message = ring_message_});
}

void CommandDispatcher::sendFiles(const DeviceId& device, const QStringList& paths) {
    fire(device, SendFiles{.paths = paths});
}

void CommandDispatcher::sendClipboard(const DeviceId& device, const QString& content) {
    fire(device, SendClipboard{.content = content});
}

void CommandDispatcher::requestConversations(const DeviceId& device) {
    fire(device, RequestConversations{});
}

void CommandDispatcher::requestConversation(const DeviceId& device, const QString& thread_id) {
    bool ok = false;
    const qint64 id = thread_id.toLongLong(&ok);
    if (!ok) {
        qCWarning(tetherCommandsLog) << "not requesting conversation: invalid thread id" << thread_id;
        return;
    }
    requestConversation(device, id);
}

void CommandDispatcher::requestConversation(const DeviceId& device, qint64 thread_id) {
    fire(device, RequestConversation{.thread_id = thread_id});
}

void CommandDispatcher::sendSms(const DeviceId& device,
                                const QString& phone_number,
                                const QString& message) {
    fire(device, SendSms{.phone_number = phone_number, .message = message});
}

void CommandDispatcher::startSftpBrowsing(const DeviceId& device) {
    fire(device, StartSftpBrowsing{});
}

void CommandDispatcher::executeCommand(const DeviceId& device, const QString& command_key) {
    fire(device, ExecuteCommand{.command_key = command_key});
}

void CommandDispatcher::requestCommandList(const DeviceId& device) {
    fire(device, RequestCommandList{});
}

void CommandDispatcher::requestBatteryStatus(const DeviceId& device) {
    fire(device, RequestBatteryStatus{});
}

} // namespace tether::network
