#include "sms/sms_reconciler.hpp"
#include "sms/contacts.hpp"
#include "sms/phone_number.hpp"
#include "sms/sms_payload.hpp"
#include "core/log.hpp"

#include <QMutexLocker>
#include <algorithm>
#include <type_traits>

namespace tether::sms {
namespace {

bool is_placeholder(const Message& message) {
    return message.id.startsWith(QLatin1String(SmsReconciler::kPlaceholderPrefix));
}

bool is_echo_of(const Message& placeholder, const Message& sent) {
    if (!is_placeholder(placeholder) || !sent.is_sent()) {
        return false;
    }
    const auto gap = sent.date > placeholder.date ? sent.date - placeholder.date
                                                  : placeholder.date - sent.date;
    return placeholder.body == sent.body
        && phone_numbers_match(placeholder.address, sent.address)
        && gap <= SmsReconciler::kEchoWindow;
}

} // namespace

SmsReconciler::SmsReconciler(QObject* parent)
    : QObject(parent)
{
}

std::vector<Conversation> SmsReconciler::conversations() const {
    QMutexLocker lock(&mu_);
    return conversations_;
}

std::optional<Conversation> SmsReconciler::conversation(const QString& thread_id) const {
    QMutexLocker lock(&mu_);
    auto it = std::find_if(conversations_.begin(), conversations_.end(),
                           [&](const Conversation& c) { return c.thread_id == thread_id; });
    if (it == conversations_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<Message> SmsReconciler::messages() const {
    QMutexLocker lock(&mu_);
    return messages_;
}

std::optional<QString> SmsReconciler::selectedThread() const {
    QMutexLocker lock(&mu_);
    return selected_thread_;
}

ContactsMap SmsReconciler::contacts() const {
    QMutexLocker lock(&mu_);
    return contacts_;
}

void SmsReconciler::mergeConversations(const std::vector<Conversation>& batch) {
    {
        QMutexLocker lock(&mu_);
        mergeLocked(batch);
    }
    emit conversationsChanged();
}

bool SmsReconciler::ingestMessage(const Message& message) {
    bool conversations_changed = false;
    bool messages_changed = false;
    {
        QMutexLocker lock(&mu_);
        messages_changed = ingestLocked(message, conversations_changed);
    }
    if (messages_changed) {
        emit messagesChanged();
    }
    if (conversations_changed) {
        emit conversationsChanged();
    }
    return messages_changed;
}

void SmsReconciler::handleProtocolEvent(const ProtocolEvent& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, MessageReceived>) {
            ingestMessage(e.message);
        } else if constexpr (std::is_same_v<T, ConversationsReceived>) {
            mergeConversations(e.conversations);
        } else if constexpr (std::is_same_v<T, ProtocolError>) {
            qCWarning(tetherSmsLog) << "protocol error:" << e.message;
            emit protocolError(e.message);
        }
    }, event);
}

Result<void, Error> SmsReconciler::ingestPayload(const QByteArray& payload) {
    auto events = decode_sms_events(payload);
    if (events.is_err()) {
        const auto message = QString::fromStdString(events.unwrap_err().message);
        qCWarning(tetherSmsLog) << "dropping sms batch:" << message;
        emit protocolError(message);
        return Result<void, Error>::err(events.unwrap_err());
    }

    bool messages_changed = false;
    bool conversations_changed = false;
    {
        QMutexLocker lock(&mu_);
        for (const auto& event : events.unwrap()) {
            if (const auto* received = std::get_if<MessageReceived>(&event)) {
                messages_changed = ingestLocked(received->message, conversations_changed) || messages_changed;
            } else if (const auto* batch = std::get_if<ConversationsReceived>(&event)) {
                mergeLocked(batch->conversations);
                conversations_changed = true;
            }
        }
        qCDebug(tetherSmsLog) << "sms batch applied," << conversations_.size() << "conversations,"
                              << messages_.size() << "messages in open thread";
    }

    if (messages_changed) {
        emit messagesChanged();
    }
    if (conversations_changed) {
        emit conversationsChanged();
    }
    return Result<void, Error>::ok();
}

int SmsReconciler::applyContacts(const ContactsMap& contacts) {
    int renamed = 0;
    {
        QMutexLocker lock(&mu_);
        contacts_ = contacts;
        for (auto& conversation : conversations_) {
            auto name = resolve_contact_name(contacts_, conversation.phone_number);
            if (name && conversation.contact_name != *name) {
                conversation.contact_name = *name;
                ++renamed;
            }
        }
    }

    qCInfo(tetherSmsLog) << "loaded" << contacts.size() << "contacts, renamed" << renamed << "conversations";
    if (renamed > 0) {
        emit conversationsChanged();
    }
    return renamed;
}

Result<int, Error> SmsReconciler::applyContactsPayload(const QByteArray& payload) {
    auto contacts = parse_contacts_payload(payload);
    if (contacts.is_err()) {
        const auto message = QString::fromStdString(contacts.unwrap_err().message);
        qCWarning(tetherSmsLog) << "dropping contacts batch:" << message;
        emit protocolError(message);
        return Result<int, Error>::err(contacts.unwrap_err());
    }
    return Result<int, Error>::ok(applyContacts(contacts.unwrap()));
}

void SmsReconciler::selectThread(const QString& thread_id) {
    {
        QMutexLocker lock(&mu_);
        selected_thread_ = thread_id;
        messages_.clear();
    }
    emit messagesChanged();
}

QString SmsReconciler::startChat(const QString& phone_number, Timestamp now) {
    QString thread_id;
    bool inserted = false;
    {
        QMutexLocker lock(&mu_);
        auto it = std::find_if(conversations_.begin(), conversations_.end(),
                               [&](const Conversation& c) {
                                   return phone_numbers_match(c.phone_number, phone_number);
                               });
        if (it != conversations_.end()) {
            thread_id = it->thread_id;
        } else {
            thread_id = QLatin1String(kNewThreadPrefix) + QString::number(now.millis());
            Conversation conversation{
                .thread_id = thread_id,
                .phone_number = phone_number,
                .contact_name = resolve_contact_name(contacts_, phone_number).value_or(phone_number),
                .last_message = {},
                .timestamp = now,
                .unread = false,
            };
            conversations_.insert(conversations_.begin(), std::move(conversation));
            inserted = true;
        }
        selected_thread_ = thread_id;
        messages_.clear();
    }

    if (inserted) {
        emit conversationsChanged();
    }
    emit messagesChanged();
    return thread_id;
}

std::optional<Message> SmsReconciler::sendMessage(const QString& body, Timestamp now) {
    if (body.trimmed().isEmpty()) {
        return std::nullopt;
    }

    Message placeholder;
    {
        QMutexLocker lock(&mu_);
        if (!selected_thread_) {
            qCWarning(tetherSmsLog) << "not sending: no thread selected";
            return std::nullopt;
        }
        auto it = std::find_if(conversations_.begin(), conversations_.end(),
                               [&](const Conversation& c) { return c.thread_id == *selected_thread_; });
        if (it == conversations_.end()) {
            qCWarning(tetherSmsLog) << "not sending: no conversation for thread" << *selected_thread_;
            return std::nullopt;
        }

        placeholder = Message{
            .id = QLatin1String(kPlaceholderPrefix) + QString::number(now.millis()),
            .thread_id = *selected_thread_,
            .body = body,
            .address = it->phone_number,
            .date = now,
            .direction = MessageDirection::Sent,
            .read = true,
        };
        messages_.push_back(placeholder);
        sortMessagesLocked();
    }

    emit messagesChanged();
    return placeholder;
}

void SmsReconciler::mergeLocked(const std::vector<Conversation>& batch) {
    for (auto incoming : batch) {
        if (incoming.contact_name.isEmpty()) {
            incoming.contact_name = resolve_contact_name(contacts_, incoming.phone_number)
                                        .value_or(incoming.phone_number);
        }

        auto it = std::find_if(conversations_.begin(), conversations_.end(),
                               [&](const Conversation& c) { return c.thread_id == incoming.thread_id; });
        if (it == conversations_.end()) {
            conversations_.push_back(std::move(incoming));
            continue;
        }
        it->last_message = incoming.last_message;
        it->timestamp = incoming.timestamp;
        it->contact_name = incoming.contact_name;
    }
    sortConversationsLocked();
}

bool SmsReconciler::ingestLocked(const Message& message, bool& conversations_changed) {
    auto conv = std::find_if(conversations_.begin(), conversations_.end(),
                             [&](const Conversation& c) { return c.thread_id == message.thread_id; });
    if (conv != conversations_.end() && message.date >= conv->timestamp) {
        conv->last_message = message.body;
        conv->timestamp = message.date;
        sortConversationsLocked();
        conversations_changed = true;
    }

    if (!selected_thread_ || *selected_thread_ != message.thread_id) {
        return false;
    }

    const bool duplicate = std::any_of(messages_.begin(), messages_.end(),
                                       [&](const Message& m) { return m.id == message.id; });
    if (duplicate) {
        qCDebug(tetherSmsLog) << "duplicate message" << message.id << "ignored";
        return false;
    }

    auto echo = std::find_if(messages_.begin(), messages_.end(),
                             [&](const Message& m) { return is_echo_of(m, message); });
    if (echo != messages_.end()) {
        qCDebug(tetherSmsLog) << "placeholder" << echo->id << "replaced by" << message.id;
        *echo = message;
    } else {
        messages_.push_back(message);
    }
    sortMessagesLocked();
    return true;
}

void SmsReconciler::sortConversationsLocked() {
    std::stable_sort(conversations_.begin(), conversations_.end(),
                     [](const Conversation& a, const Conversation& b) { return a.timestamp > b.timestamp; });
}

void SmsReconciler::sortMessagesLocked() {
    std::stable_sort(messages_.begin(), messages_.end(),
                     [](const Message& a, const Message& b) { return a.date < b.date; });
}

} // namespace tether::sms
