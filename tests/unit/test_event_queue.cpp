#include <catch2/catch_test_macros.hpp>
#include "network/event_queue.hpp"

#include <variant>

using namespace tether;
using namespace tether::network;

namespace {

events::RelayEvent disconnected(const char* id) {
    return events::CoreEvent{events::Disconnected{DeviceId(QString::fromLatin1(id))}};
}

DeviceId id_of(const events::RelayEvent& event) {
    const auto& core = std::get<events::CoreEvent>(event);
    return std::get<events::Disconnected>(core).id;
}

} // namespace

TEST_CASE("EventQueue: delivers in FIFO order", "[queue]") {
    EventQueue queue;
    REQUIRE(queue.push(disconnected("a")));
    REQUIRE(queue.push(events::TimerTick{events::TimerKind::Backstop}));
    REQUIRE(queue.push(disconnected("b")));
    REQUIRE(queue.pending() == 3);

    REQUIRE(id_of(*queue.tryNext()) == DeviceId(QStringLiteral("a")));
    auto tick = queue.tryNext();
    REQUIRE(std::holds_alternative<events::TimerTick>(*tick));
    REQUIRE(id_of(*queue.tryNext()) == DeviceId(QStringLiteral("b")));
    REQUIRE_FALSE(queue.tryNext().has_value());
}

TEST_CASE("EventQueue: close keeps the backlog and refuses new events", "[queue]") {
    EventQueue queue;
    queue.push(disconnected("a"));
    queue.close();

    REQUIRE(queue.isClosed());
    REQUIRE_FALSE(queue.isFinished());
    REQUIRE_FALSE(queue.push(disconnected("b")));

    REQUIRE(queue.tryNext().has_value());
    REQUIRE(queue.isFinished());
    REQUIRE_FALSE(queue.tryNext().has_value());
}

TEST_CASE("EventQueue: signals on push and close", "[queue]") {
    EventQueue queue;
    int available = 0;
    int closed = 0;
    QObject::connect(&queue, &EventQueue::eventsAvailable, [&]() { ++available; });
    QObject::connect(&queue, &EventQueue::closed, [&]() { ++closed; });

    queue.push(disconnected("a"));
    queue.close();
    queue.close();
    queue.push(disconnected("b"));

    REQUIRE(closed == 1);
    REQUIRE(available == 2);
}
