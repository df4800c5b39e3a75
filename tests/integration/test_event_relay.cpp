#include <catch2/catch_test_macros.hpp>

#include "network/device_cache.hpp"
#include "network/event_queue.hpp"
#include "network/event_relay.hpp"

#include <QJsonObject>
#include <QSignalSpy>

using namespace tether;
using namespace tether::network;

namespace {

const DeviceId kPhone(QStringLiteral("dev1"));

Device pixel(PairState state = PairState::Paired) {
    Device d;
    d.id = kPhone;
    d.name = QStringLiteral("Pixel");
    d.pair_state = state;
    return d;
}

struct Harness {
    DeviceCache cache;
    EventQueue queue;
    EventRelay relay{cache, queue};

    void push(events::CoreEvent event) {
        REQUIRE(queue.push(std::move(event)));
    }
};

} // namespace

TEST_CASE("Relay: connect then disconnect", "[integration][relay]") {
    Harness h;
    QSignalSpy changed(&h.relay, &EventRelay::devicesChanged);

    h.push(events::Connected{kPhone, pixel()});
    REQUIRE(h.relay.drain() == 1);

    const auto devices = h.cache.getAll();
    REQUIRE(devices.size() == 1);
    REQUIRE(devices.front().name == QStringLiteral("Pixel"));
    REQUIRE(devices.front().pair_state == PairState::Paired);
    REQUIRE(devices.front().reachable);

    h.push(events::Disconnected{kPhone});
    h.relay.drain();
    REQUIRE(h.cache.getAll().empty());
    REQUIRE(changed.count() == 2);
}

TEST_CASE("Relay: connect and pair start a burst", "[integration][relay]") {
    Harness h;
    QSignalSpy burst(&h.relay, &EventRelay::pairingBurstStarted);

    h.push(events::Connected{kPhone, pixel(PairState::NotPaired)});
    h.push(events::DevicePaired{kPhone, pixel(PairState::NotPaired)});
    h.relay.drain();

    REQUIRE(burst.count() == 2);
    REQUIRE(h.cache.get(kPhone)->pair_state == PairState::Paired);
}

TEST_CASE("Relay: pairing request notifies once", "[integration][relay][pairing]") {
    Harness h;
    QSignalSpy requests(&h.relay, &EventRelay::pairingRequested);
    QSignalSpy changed(&h.relay, &EventRelay::devicesChanged);

    h.push(events::Connected{kPhone, pixel(PairState::NotPaired)});
    h.push(events::PairStateChanged{kPhone, PairState::Requested});
    h.push(events::PairStateChanged{kPhone, PairState::Requested});
    h.relay.drain();

    REQUIRE(requests.count() == 1);
    const auto notification = requests.first().first().value<PairingNotification>();
    REQUIRE(notification.device_id == kPhone);
    REQUIRE(notification.device_name == QStringLiteral("Pixel"));
    REQUIRE(notification.device_type == QStringLiteral("phone"));

    // Pair state changes never touch the cache.
    REQUIRE(changed.count() == 1);
    REQUIRE(h.cache.get(kPhone)->pair_state == PairState::NotPaired);

    SECTION("reconnect after disconnect prompts again") {
        h.push(events::Disconnected{kPhone});
        h.push(events::Connected{kPhone, pixel(PairState::NotPaired)});
        h.push(events::PairStateChanged{kPhone, PairState::Requested});
        h.relay.drain();
        REQUIRE(requests.count() == 2);
    }
}

TEST_CASE("Relay: pairing again after a completed pairing prompts again", "[integration][relay][pairing]") {
    Harness h;
    QSignalSpy requests(&h.relay, &EventRelay::pairingRequested);

    h.push(events::Connected{kPhone, pixel(PairState::NotPaired)});
    h.push(events::PairStateChanged{kPhone, PairState::Requested});
    h.push(events::DevicePaired{kPhone, pixel(PairState::Paired)});
    h.push(events::PairStateChanged{kPhone, PairState::Requested});
    h.relay.drain();

    REQUIRE(requests.count() == 2);

    SECTION("a re-announce as not paired also re-arms") {
        h.push(events::Connected{kPhone, pixel(PairState::NotPaired)});
        h.push(events::PairStateChanged{kPhone, PairState::Requested});
        h.relay.drain();
        REQUIRE(requests.count() == 3);
    }
}

TEST_CASE("Relay: pairing request for an unknown device is dropped", "[integration][relay][pairing]") {
    Harness h;
    QSignalSpy requests(&h.relay, &EventRelay::pairingRequested);

    h.push(events::PairStateChanged{DeviceId(QStringLiteral("ghost")), PairState::Requested});
    h.relay.drain();

    REQUIRE(requests.isEmpty());
    REQUIRE(h.cache.size() == 0);
}

TEST_CASE("Relay: state updates touch optional fields only", "[integration][relay]") {
    Harness h;
    h.push(events::Connected{kPhone, pixel()});
    h.relay.drain();

    QSignalSpy changed(&h.relay, &EventRelay::devicesChanged);

    QJsonObject state;
    state[QStringLiteral("currentCharge")] = 64;
    state[QStringLiteral("isCharging")] = false;
    state[QStringLiteral("signalStrength")] = 9;
    state[QStringLiteral("networkType")] = QStringLiteral("LTE");
    h.push(events::StateUpdated{kPhone, state});
    h.relay.drain();

    const auto device = h.cache.get(kPhone);
    REQUIRE(device->battery_level == 64);
    REQUIRE(device->charging == false);
    REQUIRE_FALSE(device->signal_strength.has_value());
    REQUIRE(device->network_type == QStringLiteral("LTE"));
    REQUIRE(device->name == QStringLiteral("Pixel"));
    REQUIRE(changed.count() == 1);

    SECTION("repeating the same state is not a change") {
        h.push(events::StateUpdated{kPhone, state});
        h.relay.drain();
        REQUIRE(changed.count() == 1);
    }

    SECTION("state for an unknown device is ignored") {
        h.push(events::StateUpdated{DeviceId(QStringLiteral("ghost")), state});
        h.relay.drain();
        REQUIRE(h.cache.size() == 1);
        REQUIRE(changed.count() == 1);
    }
}

TEST_CASE("Relay: pass-through events reach their listeners", "[integration][relay]") {
    Harness h;
    QSignalSpy clipboard(&h.relay, &EventRelay::clipboardReceived);
    QSignalSpy sms(&h.relay, &EventRelay::smsPayloadReceived);
    QSignalSpy contacts(&h.relay, &EventRelay::contactsPayloadReceived);
    QSignalSpy media(&h.relay, &EventRelay::mediaUpdated);

    h.push(events::ClipboardReceived{QStringLiteral("copied")});
    h.push(events::SmsMessages{kPhone, QByteArray("{\"messages\":[]}")});
    h.push(events::ContactsReceived{kPhone, QByteArray("{}")});
    h.push(events::Mpris{kPhone, QJsonObject{}});
    h.relay.drain();

    REQUIRE(clipboard.count() == 1);
    REQUIRE(clipboard.first().first().toString() == QStringLiteral("copied"));
    REQUIRE(sms.count() == 1);
    REQUIRE(contacts.count() == 1);
    REQUIRE(media.count() == 1);
    REQUIRE(h.cache.size() == 0);
}

TEST_CASE("Relay: timer ticks request a refresh", "[integration][relay]") {
    Harness h;
    QSignalSpy refresh(&h.relay, &EventRelay::refreshRequested);
    QSignalSpy changed(&h.relay, &EventRelay::devicesChanged);

    REQUIRE(h.queue.push(events::TimerTick{events::TimerKind::PairingBurst}));
    h.relay.drain();

    REQUIRE(refresh.count() == 1);
    REQUIRE(refresh.first().first().value<events::TimerKind>() == events::TimerKind::PairingBurst);
    REQUIRE(changed.count() == 1);
}

TEST_CASE("Relay: closed source stops the relay once", "[integration][relay]") {
    Harness h;
    QSignalSpy stopped(&h.relay, &EventRelay::stopped);

    h.push(events::Connected{kPhone, pixel()});
    h.queue.close();

    REQUIRE(h.relay.drain() == 1);
    REQUIRE(h.relay.isStopped());
    REQUIRE(h.relay.drain() == 0);
    REQUIRE(stopped.count() == 1);
    REQUIRE(h.cache.size() == 1);
}
