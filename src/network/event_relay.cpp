#include "network/event_relay.hpp"
#include "core/log.hpp"

#include <type_traits>

namespace tether::network {

bool apply_state_fields(Device& device, const QJsonObject& state) {
    const Device before = device;

    if (auto v = state.value("currentCharge"); v.isDouble()) {
        if (auto level = checked_battery_level(v.toInt(-1))) {
            device.battery_level = level;
        }
    }
    if (auto v = state.value("isCharging"); v.isBool()) {
        device.charging = v.toBool();
    }
    if (auto v = state.value("signalStrength"); v.isDouble()) {
        if (auto strength = checked_signal_strength(v.toInt(-2))) {
            device.signal_strength = strength;
        }
    }
    if (auto v = state.value("networkType"); v.isString()) {
        device.network_type = v.toString();
    }

    return !(device == before);
}

EventRelay::EventRelay(DeviceCache& cache, EventQueue& queue, QObject* parent)
    : QObject(parent)
    , cache_(cache)
    , queue_(queue)
{
}

int EventRelay::drain() {
    int applied = 0;
    while (auto event = queue_.tryNext()) {
        apply(*event);
        ++applied;
    }

    if (!stopped_ && queue_.isFinished()) {
        stopped_ = true;
        qCInfo(tetherRelayLog) << "event source closed, relay stopped";
        emit stopped();
    }
    return applied;
}

void EventRelay::apply(const events::RelayEvent& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, events::CoreEvent>) {
            applyCore(e);
        } else if constexpr (std::is_same_v<T, events::TimerTick>) {
            qCDebug(tetherRelayLog) << "refresh tick" << events::timer_kind_name(e.kind).data();
            emit refreshRequested(e.kind);
            emit devicesChanged();
        }
    }, event);
}

void EventRelay::applyCore(const events::CoreEvent& event) {
    qCDebug(tetherRelayLog) << "core event" << events::event_name(event).data();

    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, events::Connected>) {
            Device device = e.device;
            device.id = e.id;
            handleConnected(std::move(device), false);
        } else if constexpr (std::is_same_v<T, events::DevicePaired>) {
            Device device = e.device;
            device.id = e.id;
            handleConnected(std::move(device), true);
        } else if constexpr (std::is_same_v<T, events::Disconnected>) {
            detector_.forget(e.id);
            if (!cache_.remove(e.id)) {
                qCDebug(tetherRelayLog) << "disconnect for uncached device" << e.id.value();
            }
            emit devicesChanged();
        } else if constexpr (std::is_same_v<T, events::PairStateChanged>) {
            if (auto notification = detector_.observe(e.id, e.state, cache_)) {
                qCInfo(tetherRelayLog) << "pairing request from" << notification->device_name;
                emit pairingRequested(*notification);
            }
        } else if constexpr (std::is_same_v<T, events::StateUpdated>) {
            handleStateUpdated(e);
        } else if constexpr (std::is_same_v<T, events::ClipboardReceived>) {
            emit clipboardReceived(e.content);
        } else if constexpr (std::is_same_v<T, events::Mpris>) {
            emit mediaUpdated(e.id, e.payload);
        } else if constexpr (std::is_same_v<T, events::SmsMessages>) {
            emit smsPayloadReceived(e.id, e.payload);
        } else if constexpr (std::is_same_v<T, events::ContactsReceived>) {
            emit contactsPayloadReceived(e.id, e.payload);
        }
    }, event);
}

void EventRelay::handleConnected(Device device, bool paired) {
    device.reachable = true;
    if (paired) {
        device.pair_state = PairState::Paired;
    }
    detector_.record(device.id, device.pair_state);
    cache_.upsert(device);

    emit devicesChanged();
    emit pairingBurstStarted();
}

void EventRelay::handleStateUpdated(const events::StateUpdated& update) {
    auto device = cache_.get(update.id);
    if (!device) {
        qCDebug(tetherRelayLog) << "state update for unknown device" << update.id.value();
        return;
    }

    if (apply_state_fields(*device, update.state)) {
        cache_.upsert(*device);
        emit devicesChanged();
    }
}

} // namespace tether::network
