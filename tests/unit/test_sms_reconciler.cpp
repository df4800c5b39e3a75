#include <catch2/catch_test_macros.hpp>
#include "sms/sms_reconciler.hpp"

using namespace tether;
using namespace tether::sms;

namespace {

Conversation conversation(const char* thread, const char* phone, const char* last, int64_t ts) {
    return Conversation{
        .thread_id = QString::fromLatin1(thread),
        .phone_number = QString::fromLatin1(phone),
        .contact_name = QString::fromLatin1(phone),
        .last_message = QString::fromLatin1(last),
        .timestamp = Timestamp(ts),
        .unread = false,
    };
}

Message message(const char* id, const char* thread, const char* body, int64_t date,
                MessageDirection direction = MessageDirection::Received,
                const char* address = "+15551234567") {
    return Message{
        .id = QString::fromLatin1(id),
        .thread_id = QString::fromLatin1(thread),
        .body = QString::fromLatin1(body),
        .address = QString::fromLatin1(address),
        .date = Timestamp(date),
        .direction = direction,
        .read = true,
    };
}

QStringList ids(const std::vector<Message>& messages) {
    QStringList out;
    for (const auto& m : messages) out.append(m.id);
    return out;
}

QStringList threads(const std::vector<Conversation>& conversations) {
    QStringList out;
    for (const auto& c : conversations) out.append(c.thread_id);
    return out;
}

} // namespace

TEST_CASE("SmsReconciler: merge inserts, overwrites and sorts newest first", "[sms][reconciler]") {
    SmsReconciler sms;
    sms.mergeConversations({conversation("1", "111", "old", 100), conversation("2", "222", "b", 200)});
    REQUIRE(threads(sms.conversations()) == QStringList{QStringLiteral("2"), QStringLiteral("1")});

    sms.mergeConversations({conversation("1", "111", "new", 300)});
    const auto table = sms.conversations();
    REQUIRE(threads(table) == QStringList{QStringLiteral("1"), QStringLiteral("2")});
    REQUIRE(table.front().last_message == QStringLiteral("new"));
    REQUIRE(table.size() == 2);
}

TEST_CASE("SmsReconciler: merge is last-writer-wins even when older", "[sms][reconciler]") {
    SmsReconciler sms;
    sms.mergeConversations({conversation("1", "111", "newer", 500)});
    sms.mergeConversations({conversation("1", "111", "older", 100)});

    const auto c = sms.conversation(QStringLiteral("1"));
    REQUIRE(c->last_message == QStringLiteral("older"));
    REQUIRE(c->timestamp == Timestamp(100));
}

TEST_CASE("SmsReconciler: merging the same batch twice is idempotent", "[sms][reconciler]") {
    const std::vector<Conversation> batch{
        conversation("1", "111", "a", 100),
        conversation("2", "222", "b", 300),
        conversation("3", "333", "c", 200),
    };
    SmsReconciler once;
    once.mergeConversations(batch);
    SmsReconciler twice;
    twice.mergeConversations(batch);
    twice.mergeConversations(batch);

    REQUIRE(once.conversations() == twice.conversations());
}

TEST_CASE("SmsReconciler: messages only join the open thread", "[sms][reconciler]") {
    SmsReconciler sms;
    REQUIRE_FALSE(sms.ingestMessage(message("a", "7", "hi", 100)));

    sms.selectThread(QStringLiteral("7"));
    REQUIRE(sms.ingestMessage(message("a", "7", "hi", 100)));
    REQUIRE_FALSE(sms.ingestMessage(message("x", "8", "other", 100)));
    REQUIRE(ids(sms.messages()) == QStringList{QStringLiteral("a")});
}

TEST_CASE("SmsReconciler: messages dedupe by id and sort by date", "[sms][reconciler]") {
    SmsReconciler sms;
    sms.selectThread(QStringLiteral("7"));

    sms.ingestMessage(message("a", "7", "hi", 100));
    sms.ingestMessage(message("b", "7", "yo", 50));
    REQUIRE_FALSE(sms.ingestMessage(message("a", "7", "changed", 100)));

    const auto list = sms.messages();
    REQUIRE(ids(list) == QStringList{QStringLiteral("b"), QStringLiteral("a")});
    REQUIRE(list.back().body == QStringLiteral("hi"));
}

TEST_CASE("SmsReconciler: identical bodies with distinct ids both stay", "[sms][reconciler]") {
    SmsReconciler sms;
    sms.selectThread(QStringLiteral("7"));
    sms.ingestMessage(message("a", "7", "ok", 100));
    sms.ingestMessage(message("b", "7", "ok", 100));
    REQUIRE(sms.messages().size() == 2);
}

TEST_CASE("SmsReconciler: a newer message refreshes its conversation", "[sms][reconciler]") {
    SmsReconciler sms;
    sms.mergeConversations({conversation("7", "+15551234567", "first", 100),
                            conversation("8", "222", "other", 200)});

    sms.ingestMessage(message("z", "7", "latest", 300));
    REQUIRE(sms.conversations().front().thread_id == QStringLiteral("7"));
    REQUIRE(sms.conversations().front().last_message == QStringLiteral("latest"));

    sms.ingestMessage(message("y", "7", "stale", 10));
    REQUIRE(sms.conversation(QStringLiteral("7"))->last_message == QStringLiteral("latest"));
}

TEST_CASE("SmsReconciler: optimistic send and echo replacement", "[sms][reconciler]") {
    SmsReconciler sms;
    sms.mergeConversations({conversation("7", "+15551234567", "", 100)});
    sms.selectThread(QStringLiteral("7"));

    const auto placeholder = sms.sendMessage(QStringLiteral("on my way"), Timestamp(1'000'000));
    REQUIRE(placeholder.has_value());
    REQUIRE(placeholder->id == QStringLiteral("sending_1000000"));
    REQUIRE(placeholder->is_sent());
    REQUIRE(placeholder->address == QStringLiteral("+15551234567"));
    REQUIRE(sms.messages().size() == 1);

    SECTION("matching echo replaces the placeholder") {
        sms.ingestMessage(message("991", "7", "on my way", 1'030'000, MessageDirection::Sent, "5551234567"));
        REQUIRE(ids(sms.messages()) == QStringList{QStringLiteral("991")});
    }

    SECTION("echo outside the window is kept separately") {
        sms.ingestMessage(message("991", "7", "on my way", 1'000'000 + 3 * 60 * 1000, MessageDirection::Sent));
        REQUIRE(sms.messages().size() == 2);
    }

    SECTION("received message with the same body is not an echo") {
        sms.ingestMessage(message("992", "7", "on my way", 1'001'000));
        REQUIRE(sms.messages().size() == 2);
    }

    SECTION("different body is not an echo") {
        sms.ingestMessage(message("993", "7", "on my way!", 1'001'000, MessageDirection::Sent));
        REQUIRE(sms.messages().size() == 2);
    }
}

TEST_CASE("SmsReconciler: sendMessage preconditions", "[sms][reconciler]") {
    SmsReconciler sms;
    REQUIRE_FALSE(sms.sendMessage(QStringLiteral("hi"), Timestamp(1)).has_value());

    sms.selectThread(QStringLiteral("7"));
    REQUIRE_FALSE(sms.sendMessage(QStringLiteral("hi"), Timestamp(1)).has_value());

    sms.mergeConversations({conversation("7", "555", "", 1)});
    REQUIRE_FALSE(sms.sendMessage(QStringLiteral("   "), Timestamp(1)).has_value());
    REQUIRE(sms.sendMessage(QStringLiteral("hi"), Timestamp(1)).has_value());
}

TEST_CASE("SmsReconciler: startChat reuses a matching conversation", "[sms][reconciler]") {
    SmsReconciler sms;
    sms.mergeConversations({conversation("7", "+1 (555) 123-4567", "hi", 100)});
    sms.selectThread(QStringLiteral("7"));
    sms.ingestMessage(message("a", "7", "hi", 100));

    const auto thread = sms.startChat(QStringLiteral("5551234567"), Timestamp(5000));
    REQUIRE(thread == QStringLiteral("7"));
    REQUIRE(sms.selectedThread() == QStringLiteral("7"));
    REQUIRE(sms.messages().empty());
    REQUIRE(sms.conversations().size() == 1);
}

TEST_CASE("SmsReconciler: startChat inserts a new thread on top", "[sms][reconciler]") {
    SmsReconciler sms;
    ContactsMap contacts;
    contacts.insert(QStringLiteral("+44 20 7946 0018"), QStringLiteral("Bob"));
    sms.applyContacts(contacts);
    sms.mergeConversations({conversation("7", "5551234567", "hi", 9000)});

    const auto thread = sms.startChat(QStringLiteral("020 7946 0018"), Timestamp(5000));
    REQUIRE(thread == QStringLiteral("new_5000"));

    const auto table = sms.conversations();
    REQUIRE(table.front().thread_id == QStringLiteral("new_5000"));
    REQUIRE(table.front().contact_name == QStringLiteral("Bob"));
    REQUIRE(sms.selectedThread() == QStringLiteral("new_5000"));
}

TEST_CASE("SmsReconciler: contact backfill renames only on change", "[sms][reconciler]") {
    SmsReconciler sms;
    sms.mergeConversations({conversation("1", "+15551234567", "a", 100),
                            conversation("2", "999", "b", 50)});

    ContactsMap contacts;
    contacts.insert(QStringLiteral("5551234567"), QStringLiteral("Alice"));
    REQUIRE(sms.applyContacts(contacts) == 1);
    REQUIRE(sms.conversation(QStringLiteral("1"))->contact_name == QStringLiteral("Alice"));
    REQUIRE(sms.conversation(QStringLiteral("2"))->contact_name == QStringLiteral("999"));

    REQUIRE(sms.applyContacts(contacts) == 0);
}

TEST_CASE("SmsReconciler: payload builds messages and conversations", "[sms][reconciler]") {
    SmsReconciler sms;
    sms.selectThread(QStringLiteral("7"));

    const auto result = sms.ingestPayload(R"({"messages":[
        {"_id":"a","thread_id":"7","addresses":[{"address":"555"}],"body":"hi","date":100,"type":1,"read":1},
        {"_id":"b","thread_id":"7","addresses":[{"address":"555"}],"body":"yo","date":50,"type":1,"read":1}
    ]})");
    REQUIRE(result.is_ok());

    REQUIRE(ids(sms.messages()) == QStringList{QStringLiteral("b"), QStringLiteral("a")});
    const auto c = sms.conversation(QStringLiteral("7"));
    REQUIRE(c.has_value());
    REQUIRE(c->last_message == QStringLiteral("hi"));
    REQUIRE(c->contact_name == QStringLiteral("555"));
}

TEST_CASE("SmsReconciler: malformed payload leaves state untouched", "[sms][reconciler]") {
    SmsReconciler sms;
    sms.mergeConversations({conversation("1", "111", "a", 100)});
    const auto before = sms.conversations();

    QString error;
    QObject::connect(&sms, &SmsReconciler::protocolError, [&](const QString& e) { error = e; });

    const auto result = sms.ingestPayload("{\"messages\": 5}");
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().is(ErrorCode::MalformedPayload));
    REQUIRE_FALSE(error.isEmpty());
    REQUIRE(sms.conversations() == before);
}

TEST_CASE("SmsReconciler: protocol events", "[sms][reconciler]") {
    SmsReconciler sms;
    int errors = 0;
    QObject::connect(&sms, &SmsReconciler::protocolError, [&]() { ++errors; });

    sms.handleProtocolEvent(ConversationsReceived{{conversation("1", "111", "a", 100)}});
    sms.handleProtocolEvent(ProtocolError{QStringLiteral("device went away")});

    REQUIRE(sms.conversations().size() == 1);
    REQUIRE(errors == 1);
}
