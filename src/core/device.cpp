#include "core/device.hpp"

namespace tether {

std::string_view pair_state_name(PairState state) {
    switch (state) {
        case PairState::NotPaired: return "notPaired";
        case PairState::Requested: return "requested";
        case PairState::Paired: return "paired";
    }
    return "notPaired";
}

std::optional<PairState> parse_pair_state(std::string_view name) {
    if (name == "notPaired" || name == "NotPaired") return PairState::NotPaired;
    if (name == "requested" || name == "Requested") return PairState::Requested;
    if (name == "paired" || name == "Paired") return PairState::Paired;
    return std::nullopt;
}

std::string_view device_type_name(DeviceType type) {
    switch (type) {
        case DeviceType::Phone: return "phone";
        case DeviceType::Tablet: return "tablet";
        case DeviceType::Desktop: return "desktop";
        case DeviceType::Laptop: return "laptop";
        case DeviceType::Tv: return "tv";
        case DeviceType::Unknown: return "unknown";
    }
    return "unknown";
}

DeviceType parse_device_type(std::string_view name) {
    if (name.empty() || name == "phone" || name == "smartphone") return DeviceType::Phone;
    if (name == "tablet") return DeviceType::Tablet;
    if (name == "desktop") return DeviceType::Desktop;
    if (name == "laptop") return DeviceType::Laptop;
    if (name == "tv") return DeviceType::Tv;
    return DeviceType::Unknown;
}

std::optional<int> checked_battery_level(int level) {
    if (level < 0 || level > 100) {
        return std::nullopt;
    }
    return level;
}

std::optional<int> checked_signal_strength(int strength) {
    if (strength < -1 || strength > 4) {
        return std::nullopt;
    }
    return strength;
}

const char* device_icon_name(const Device& device) {
    switch (device.type) {
        case DeviceType::Tablet: return "tablet-symbolic";
        case DeviceType::Desktop:
        case DeviceType::Laptop: return "computer-symbolic";
        case DeviceType::Tv: return "video-display-symbolic";
        case DeviceType::Phone:
        case DeviceType::Unknown: break;
    }
    return "phone-symbolic";
}

const char* battery_icon_name(const Device& device) {
    if (!device.battery_level || !device.charging) {
        return "battery-symbolic";
    }
    if (*device.charging) {
        return "battery-full-charging-symbolic";
    }
    const int level = *device.battery_level;
    if (level <= 20) return "battery-level-20-symbolic";
    if (level <= 40) return "battery-level-40-symbolic";
    if (level <= 60) return "battery-level-60-symbolic";
    if (level <= 80) return "battery-level-80-symbolic";
    return "battery-level-100-symbolic";
}

std::optional<const char*> signal_icon_name(const Device& device) {
    if (!device.signal_strength) {
        return std::nullopt;
    }
    switch (*device.signal_strength) {
        case -1: return "network-cellular-offline-symbolic";
        case 0: return "network-cellular-signal-none-symbolic";
        case 1: return "network-cellular-signal-weak-symbolic";
        case 2: return "network-cellular-signal-ok-symbolic";
        case 3: return "network-cellular-signal-good-symbolic";
        case 4: return "network-cellular-signal-excellent-symbolic";
        default: break;
    }
    return "network-cellular-symbolic";
}

} // namespace tether
