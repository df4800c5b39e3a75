#pragma once

#include "core/device.hpp"
#include "core/types.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <string_view>
#include <variant>

namespace tether::events {

/**
 * Core connection events. One struct per variant the Core emits; the set is
 * closed, so consumers visit it exhaustively.
 */

struct Connected {
    DeviceId id;
    Device device;
};

struct DevicePaired {
    DeviceId id;
    Device device;
};

struct Disconnected {
    DeviceId id;
};

struct PairStateChanged {
    DeviceId id;
    PairState state;
};

struct ClipboardReceived {
    QString content;
};

// Battery / connectivity report. Only the optional Device fields are read.
struct StateUpdated {
    DeviceId id;
    QJsonObject state;
};

struct Mpris {
    DeviceId id;
    QJsonObject payload;
};

// Raw `kdeconnect.sms.messages` body; decoded by the SMS engine so a bad
// batch can be dropped there without touching device state.
struct SmsMessages {
    DeviceId id;
    QByteArray payload;
};

// Raw `kdeconnect.contacts.response_vcards` body.
struct ContactsReceived {
    DeviceId id;
    QByteArray payload;
};

using CoreEvent = std::variant<
    Connected,
    DevicePaired,
    Disconnected,
    PairStateChanged,
    ClipboardReceived,
    StateUpdated,
    Mpris,
    SmsMessages,
    ContactsReceived
>;

/**
 * Timer ticks share the relay queue with Core events so that a single loop
 * owns every cache-facing decision.
 */
enum class TimerKind {
    PairingBurst,
    Backstop
};

struct TimerTick {
    TimerKind kind;
};

using RelayEvent = std::variant<CoreEvent, TimerTick>;

[[nodiscard]] std::string_view event_name(const CoreEvent& event);
[[nodiscard]] std::string_view timer_kind_name(TimerKind kind);

} // namespace tether::events

Q_DECLARE_METATYPE(tether::events::TimerKind)
