#pragma once

#include "core/types.hpp"
#include <QHash>
#include <QMetaType>
#include <QString>
#include <variant>
#include <vector>

namespace tether::sms {

/**
 * Conversation - One SMS thread as shown in the conversation list.
 *
 * `thread_id` here is the SMS thread, not an OS thread. contact_name falls
 * back to phone_number until a contact resolves it.
 */
struct Conversation {
    QString thread_id;
    QString phone_number;
    QString contact_name;
    QString last_message;
    Timestamp timestamp;
    bool unread = false;

    bool operator==(const Conversation&) const = default;
};

enum class MessageDirection {
    Received,
    Sent
};

/**
 * Message - A single SMS in the open thread.
 */
struct Message {
    QString id;
    QString thread_id;
    QString body;
    QString address;
    Timestamp date;
    MessageDirection direction = MessageDirection::Received;
    bool read = false;

    [[nodiscard]] bool is_sent() const noexcept { return direction == MessageDirection::Sent; }

    bool operator==(const Message&) const = default;
};

/**
 * Phone number -> display name. Lookups only; iteration order is not
 * meaningful.
 */
using ContactsMap = QHash<QString, QString>;

// Decoded SMS protocol events, in delivery order.
struct MessageReceived {
    Message message;
};

struct ConversationsReceived {
    std::vector<Conversation> conversations;
};

struct ProtocolError {
    QString message;
};

using ProtocolEvent = std::variant<MessageReceived, ConversationsReceived, ProtocolError>;

} // namespace tether::sms

Q_DECLARE_METATYPE(tether::sms::Conversation)
Q_DECLARE_METATYPE(tether::sms::Message)
