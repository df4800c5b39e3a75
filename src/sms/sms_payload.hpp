#pragma once

#include "core/result.hpp"
#include "sms/models.hpp"
#include <QByteArray>
#include <vector>

namespace tether::sms {

/**
 * Decode a `kdeconnect.sms.messages` body:
 *   {"messages":[{"_id", "thread_id", "addresses":[{"address"}], "body",
 *                 "date", "type", "read"}, ...]}
 * `id`/`message_type` are accepted as aliases. A batch with any entry
 * missing its id or thread id is rejected as a whole.
 */
[[nodiscard]] Result<std::vector<Message>, Error> parse_sms_messages(const QByteArray& payload);

/**
 * Group messages by thread. The newest message of each thread supplies
 * last_message, timestamp and phone_number; a thread is unread if any of
 * its messages is. contact_name is left empty for the caller to resolve.
 */
[[nodiscard]] std::vector<Conversation> messages_to_conversations(const std::vector<Message>& messages);

/**
 * One MessageReceived per message followed by a single
 * ConversationsReceived for the whole batch.
 */
[[nodiscard]] Result<std::vector<ProtocolEvent>, Error> decode_sms_events(const QByteArray& payload);

} // namespace tether::sms
