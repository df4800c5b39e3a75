#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sms/models.hpp"
#include <QByteArray>
#include <QMutex>
#include <QObject>
#include <QString>
#include <chrono>
#include <optional>
#include <vector>

namespace tether::sms {

/**
 * SmsReconciler - Owns the conversation table and the open thread's
 * message list.
 *
 * Conversations are unique by thread_id and kept sorted newest first;
 * merges are last-writer-wins on last_message, timestamp and contact_name.
 * Messages are unique by id (first one wins) and kept sorted oldest first.
 *
 * Sending is optimistic: sendMessage() inserts a `sending_<ms>` placeholder
 * right away. When the phone later reports a Sent message with the same
 * body to a matching address within kEchoWindow of the placeholder, the
 * placeholder is replaced by it.
 *
 * All reads return copies; every method is safe to call from any thread.
 */
class SmsReconciler : public QObject {
    Q_OBJECT

public:
    static constexpr std::chrono::milliseconds kEchoWindow{2 * 60 * 1000};
    static constexpr const char* kPlaceholderPrefix = "sending_";
    static constexpr const char* kNewThreadPrefix = "new_";

    explicit SmsReconciler(QObject* parent = nullptr);

    [[nodiscard]] std::vector<Conversation> conversations() const;
    [[nodiscard]] std::optional<Conversation> conversation(const QString& thread_id) const;
    [[nodiscard]] std::vector<Message> messages() const;
    [[nodiscard]] std::optional<QString> selectedThread() const;
    [[nodiscard]] ContactsMap contacts() const;

    /**
     * Merge a conversation batch. Entries with an empty contact_name are
     * resolved against the known contacts first (falling back to the phone
     * number).
     */
    void mergeConversations(const std::vector<Conversation>& batch);

    /**
     * Take one message. It joins the message list only when it belongs to
     * the open thread and its id is new; the matching conversation is
     * refreshed if the message is not older than it. Returns true if the
     * message list changed.
     */
    bool ingestMessage(const Message& message);

    void handleProtocolEvent(const ProtocolEvent& event);

    /**
     * Decode and apply a raw `kdeconnect.sms.messages` body. A malformed
     * batch is dropped whole: state stays untouched and protocolError() is
     * emitted.
     */
    Result<void, Error> ingestPayload(const QByteArray& payload);

    /**
     * Replace the contacts map and backfill contact names. Returns the
     * number of conversations renamed.
     */
    int applyContacts(const ContactsMap& contacts);
    Result<int, Error> applyContactsPayload(const QByteArray& payload);

    /**
     * Make `thread_id` the open thread with an empty message list. The
     * caller asks the Core for the thread's messages.
     */
    void selectThread(const QString& thread_id);

    /**
     * Open the conversation whose number matches `phone_number`, or insert a
     * `new_<ms>` conversation at the top. Returns the open thread id.
     */
    QString startChat(const QString& phone_number, Timestamp now);

    /**
     * Insert the optimistic placeholder for `body` into the open thread.
     * Returns nullopt (and changes nothing) for blank bodies, no open
     * thread, or an open thread without a conversation.
     */
    std::optional<Message> sendMessage(const QString& body, Timestamp now);

signals:
    void conversationsChanged();
    void messagesChanged();
    void protocolError(const QString& message);

private:
    mutable QMutex mu_;
    std::vector<Conversation> conversations_;
    std::vector<Message> messages_;
    std::optional<QString> selected_thread_;
    ContactsMap contacts_;

    // Callers hold mu_.
    void mergeLocked(const std::vector<Conversation>& batch);
    bool ingestLocked(const Message& message, bool& conversations_changed);
    void sortConversationsLocked();
    void sortMessagesLocked();
};

} // namespace tether::sms
