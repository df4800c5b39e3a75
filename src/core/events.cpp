#include "core/events.hpp"

#include <type_traits>

namespace tether::events {

std::string_view event_name(const CoreEvent& event) {
    return std::visit([](const auto& e) -> std::string_view {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Connected>) return "connected";
        else if constexpr (std::is_same_v<T, DevicePaired>) return "paired";
        else if constexpr (std::is_same_v<T, Disconnected>) return "disconnected";
        else if constexpr (std::is_same_v<T, PairStateChanged>) return "pairState";
        else if constexpr (std::is_same_v<T, ClipboardReceived>) return "clipboard";
        else if constexpr (std::is_same_v<T, StateUpdated>) return "state";
        else if constexpr (std::is_same_v<T, Mpris>) return "mpris";
        else if constexpr (std::is_same_v<T, SmsMessages>) return "sms";
        else if constexpr (std::is_same_v<T, ContactsReceived>) return "contacts";
    }, event);
}

std::string_view timer_kind_name(TimerKind kind) {
    switch (kind) {
        case TimerKind::PairingBurst: return "pairingBurst";
        case TimerKind::Backstop: return "backstop";
    }
    return "backstop";
}

} // namespace tether::events
