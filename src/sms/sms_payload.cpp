#include "sms/sms_payload.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <algorithm>
#include <unordered_map>

namespace tether::sms {
namespace {

constexpr int kSentMessageType = 2;

// Ids arrive as numbers from Android and as strings from some forks.
QString id_string(const QJsonValue& value) {
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toInteger());
    }
    return {};
}

QJsonValue first_of(const QJsonObject& obj, const char* key, const char* alias) {
    const auto value = obj.value(QLatin1String(key));
    return value.isUndefined() ? obj.value(QLatin1String(alias)) : value;
}

Result<Message, Error> message_from_json(const QJsonObject& obj) {
    Message message;
    message.id = id_string(first_of(obj, "_id", "id"));
    message.thread_id = id_string(obj.value(QLatin1String("thread_id")));
    if (message.id.isEmpty() || message.thread_id.isEmpty()) {
        return Result<Message, Error>::err(Error{"sms message without id or thread_id", ErrorCode::MalformedPayload});
    }

    const auto addresses = obj.value(QLatin1String("addresses")).toArray();
    if (!addresses.isEmpty()) {
        message.address = addresses.first().toObject().value(QLatin1String("address")).toString();
    }

    message.body = obj.value(QLatin1String("body")).toString();
    message.date = Timestamp(obj.value(QLatin1String("date")).toInteger());
    message.direction = first_of(obj, "type", "message_type").toInt() == kSentMessageType
        ? MessageDirection::Sent
        : MessageDirection::Received;

    const auto read = obj.value(QLatin1String("read"));
    message.read = read.isBool() ? read.toBool() : read.toInt() == 1;

    return Result<Message, Error>::ok(std::move(message));
}

} // namespace

Result<std::vector<Message>, Error> parse_sms_messages(const QByteArray& payload) {
    QJsonParseError parse_error;
    const auto doc = QJsonDocument::fromJson(payload, &parse_error);
    if (doc.isNull() || !doc.isObject()) {
        return Result<std::vector<Message>, Error>::err(
            Error{"sms payload is not a JSON object", ErrorCode::MalformedPayload});
    }

    const auto list = doc.object().value(QLatin1String("messages"));
    if (!list.isArray()) {
        return Result<std::vector<Message>, Error>::err(
            Error{"sms payload has no messages array", ErrorCode::MalformedPayload});
    }

    std::vector<Message> messages;
    const auto array = list.toArray();
    messages.reserve(static_cast<size_t>(array.size()));
    for (const auto& value : array) {
        if (!value.isObject()) {
            return Result<std::vector<Message>, Error>::err(
                Error{"sms message is not an object", ErrorCode::MalformedPayload});
        }
        auto message = message_from_json(value.toObject());
        if (message.is_err()) {
            return Result<std::vector<Message>, Error>::err(message.unwrap_err());
        }
        messages.push_back(std::move(message).unwrap());
    }

    return Result<std::vector<Message>, Error>::ok(std::move(messages));
}

std::vector<Conversation> messages_to_conversations(const std::vector<Message>& messages) {
    std::vector<Conversation> conversations;
    std::unordered_map<QString, size_t> index;

    for (const auto& message : messages) {
        auto [it, inserted] = index.try_emplace(message.thread_id, conversations.size());
        if (inserted) {
            conversations.push_back(Conversation{
                .thread_id = message.thread_id,
                .phone_number = message.address,
                .contact_name = {},
                .last_message = message.body,
                .timestamp = message.date,
                .unread = !message.read,
            });
            continue;
        }

        auto& conversation = conversations[it->second];
        if (message.date > conversation.timestamp) {
            conversation.last_message = message.body;
            conversation.timestamp = message.date;
            conversation.phone_number = message.address;
        }
        conversation.unread = conversation.unread || !message.read;
    }

    return conversations;
}

Result<std::vector<ProtocolEvent>, Error> decode_sms_events(const QByteArray& payload) {
    auto messages = parse_sms_messages(payload);
    if (messages.is_err()) {
        return Result<std::vector<ProtocolEvent>, Error>::err(messages.unwrap_err());
    }

    std::vector<ProtocolEvent> events;
    const auto& list = messages.unwrap();
    events.reserve(list.size() + 1);
    for (const auto& message : list) {
        events.emplace_back(MessageReceived{message});
    }
    events.emplace_back(ConversationsReceived{messages_to_conversations(list)});

    return Result<std::vector<ProtocolEvent>, Error>::ok(std::move(events));
}

} // namespace tether::sms
