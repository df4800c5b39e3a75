#pragma once

#include "core/types.hpp"
#include <QMetaType>
#include <QString>
#include <optional>
#include <string_view>

namespace tether {

/**
 * PairState - Pairing lifecycle as reported by the Core.
 *
 * NotPaired -> Requested  (incoming request or outgoing attempt)
 * Requested -> Paired     (handshake completes)
 * Requested -> NotPaired  (rejected / timed out)
 * Paired    -> NotPaired  (unpaired or removed)
 */
enum class PairState {
    NotPaired,
    Requested,
    Paired
};

enum class DeviceType {
    Phone,
    Tablet,
    Desktop,
    Laptop,
    Tv,
    Unknown
};

/**
 * Capabilities - Plugins the remote device advertises.
 */
struct Capabilities {
    bool battery = false;
    bool ping = false;
    bool share = false;
    bool sftp = false;
    bool sms = false;
    bool contacts = false;
    bool clipboard = false;
    bool findmyphone = false;
    bool mpris = false;
    bool remote_keyboard = false;
    bool presenter = false;
    bool lockdevice = false;
    bool virtualmonitor = false;
    bool runcommand = false;

    bool operator==(const Capabilities&) const = default;
};

/**
 * Device - Last known state of a remote device.
 *
 * A Device only exists in the cache while it is connected; disconnect removes it.
 */
struct Device {
    DeviceId id;
    QString name;
    DeviceType type = DeviceType::Phone;
    PairState pair_state = PairState::NotPaired;
    bool reachable = false;
    Capabilities capabilities;

    std::optional<int> battery_level;       // 0..100
    std::optional<bool> charging;
    std::optional<int> signal_strength;     // -1 (no signal) .. 4 bars
    std::optional<QString> network_type;    // "5G", "LTE", ...

    [[nodiscard]] bool is_paired() const noexcept { return pair_state == PairState::Paired; }

    bool operator==(const Device&) const = default;
};

[[nodiscard]] std::string_view pair_state_name(PairState state);
[[nodiscard]] std::optional<PairState> parse_pair_state(std::string_view name);

[[nodiscard]] std::string_view device_type_name(DeviceType type);

/**
 * Parse the Core's deviceType string. Empty means phone, which is what
 * every KDE Connect mobile client reports.
 */
[[nodiscard]] DeviceType parse_device_type(std::string_view name);

/**
 * Range-checked setters for fields that arrive from untrusted packets.
 * Out-of-range input leaves the field empty.
 */
[[nodiscard]] std::optional<int> checked_battery_level(int level);
[[nodiscard]] std::optional<int> checked_signal_strength(int strength);

// Freedesktop icon names for the applet rows.
[[nodiscard]] const char* device_icon_name(const Device& device);
[[nodiscard]] const char* battery_icon_name(const Device& device);
[[nodiscard]] std::optional<const char*> signal_icon_name(const Device& device);

} // namespace tether

Q_DECLARE_METATYPE(tether::Device)
