#pragma once

#include "core/commands.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/core_link.hpp"
#include <QObject>
#include <QString>
#include <QStringList>

namespace tether::network {

/**
 * CommandDispatcher - Turns user actions into Core requests.
 *
 * Every action maps to exactly one request and returns immediately. Actions
 * are best effort: failures are logged and otherwise invisible to the
 * caller. dispatch() is the single send path and does report the outcome,
 * for tests and the log line.
 *
 * Before a channel is attached every command fails fast with
 * ErrorCode::NotInitialized.
 */
class CommandDispatcher : public QObject {
    Q_OBJECT

public:
    static constexpr const char* kDefaultPingMessage = "Ping from Tether";
    static constexpr const char* kDefaultRingMessage = "Ring ring! Find my phone";

    explicit CommandDispatcher(QObject* parent = nullptr);

    /**
     * Attach (or detach, with nullptr) the Core channel. Not owned.
     */
    void setChannel(CoreChannel* channel);
    [[nodiscard]] bool hasChannel() const { return channel_ != nullptr; }

    void setPingMessage(QString message) { ping_message_ = std::move(message); }
    void setRingMessage(QString message) { ring_message_ = std::move(message); }
    [[nodiscard]] const QString& pingMessage() const { return ping_message_; }
    [[nodiscard]] const QString& ringMessage() const { return ring_message_; }

    [[nodiscard]] Result<void, Error> dispatch(const commands::Request& request);

    void pair(const DeviceId& device);
    void unpair(const DeviceId& device);
    void acceptPairing(const DeviceId& device);
    void rejectPairing(const DeviceId& device);
    void ping(const DeviceId& device);
    void ping(const DeviceId& device, const QString& message);
    void ring(const DeviceId& device);
    void sendFiles(const DeviceId& device, const QStringList& paths);
    void sendClipboard(const DeviceId& device, const QString& content);
    void requestConversations(const DeviceId& device);

    /**
     * Ask for one thread's messages. Thread ids travel as strings through
     * the SMS tables; a non-numeric id (e.g. an unsent new_ placeholder) is
     * logged and dropped.
     */
    void requestConversation(const DeviceId& device, const QString& thread_id);
    void requestConversation(const DeviceId& device, qint64 thread_id);

    void sendSms(const DeviceId& device, const QString& phone_number, const QString& message);
    void startSftpBrowsing(const DeviceId& device);
    void executeCommand(const DeviceId& device, const QString& command_key);
    void requestCommandList(const DeviceId& device);
    void requestBatteryStatus(const DeviceId& device);

signals:
    void commandFailed(const QString& command, const QString& message);

private:
    CoreChannel* channel_ = nullptr;
    QString ping_message_ = QString::fromLatin1(kDefaultPingMessage);
    QString ring_message_ = QString::fromLatin1(kDefaultRingMessage);

    void fire(const DeviceId& device, commands::CoreCommand command);
};

} // namespace tether::network
