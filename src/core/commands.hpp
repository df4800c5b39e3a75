#pragma once

#include "core/types.hpp"
#include <QString>
#include <QStringList>
#include <string_view>
#include <variant>

namespace tether::commands {

/**
 * Requests sent toward the Core. Every user action maps to exactly one of
 * these; none of them expects a reply.
 */

struct Pair {
    bool operator==(const Pair&) const = default;
};

struct Unpair {
    bool operator==(const Unpair&) const = default;
};

struct Ping {
    QString message;

    bool operator==(const Ping&) const = default;
};

struct SendFiles {
    QStringList paths;

    bool operator==(const SendFiles&) const = default;
};

struct SendClipboard {
    QString content;

    bool operator==(const SendClipboard&) const = default;
};

struct RequestConversations {
    bool operator==(const RequestConversations&) const = default;
};

struct RequestConversation {
    qint64 thread_id = 0;

    bool operator==(const RequestConversation&) const = default;
};

struct SendSms {
    QString phone_number;
    QString message;

    bool operator==(const SendSms&) const = default;
};

struct StartSftpBrowsing {
    bool operator==(const StartSftpBrowsing&) const = default;
};

struct ExecuteCommand {
    QString command_key;

    bool operator==(const ExecuteCommand&) const = default;
};

struct RequestCommandList {
    bool operator==(const RequestCommandList&) const = default;
};

struct RequestBatteryStatus {
    bool operator==(const RequestBatteryStatus&) const = default;
};

using CoreCommand = std::variant<
    Pair,
    Unpair,
    Ping,
    SendFiles,
    SendClipboard,
    RequestConversations,
    RequestConversation,
    SendSms,
    StartSftpBrowsing,
    ExecuteCommand,
    RequestCommandList,
    RequestBatteryStatus
>;

/**
 * Request - a command addressed to one device.
 */
struct Request {
    DeviceId device;
    CoreCommand command;

    bool operator==(const Request&) const = default;
};

[[nodiscard]] std::string_view command_name(const CoreCommand& command);

} // namespace tether::commands
