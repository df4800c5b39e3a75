#include "network/pairing.hpp"
#include "core/log.hpp"

namespace tether::network {

std::optional<PairingNotification> PairingDetector::observe(const DeviceId& id,
                                                            PairState state,
                                                            const DeviceCache& cache) {
    if (state != PairState::Requested) {
        last_state_.insert_or_assign(id, state);
        return std::nullopt;
    }

    auto it = last_state_.find(id);
    if (it != last_state_.end() && it->second == PairState::Requested) {
        qCDebug(tetherRelayLog) << "pairing request re-delivered for" << id.value();
        return std::nullopt;
    }

    auto device = cache.get(id);
    if (!device) {
        // Request raced ahead of Connected; nothing to render yet.
        qCDebug(tetherRelayLog) << "pairing request for unknown device" << id.value();
        return std::nullopt;
    }

    last_state_.insert_or_assign(id, PairState::Requested);
    const auto type = device_type_name(device->type);
    return PairingNotification{
        .device_id = id,
        .device_name = device->name,
        .device_type = QString::fromLatin1(type.data(), static_cast<qsizetype>(type.size())),
    };
}

void PairingDetector::record(const DeviceId& id, PairState state) {
    // Requested is only entered through observe(), so the prompt still fires.
    if (state == PairState::Requested) {
        return;
    }
    last_state_.insert_or_assign(id, state);
}

void PairingDetector::forget(const DeviceId& id) {
    last_state_.erase(id);
}

std::optional<PairState> PairingDetector::lastObserved(const DeviceId& id) const {
    auto it = last_state_.find(id);
    if (it == last_state_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace tether::network
