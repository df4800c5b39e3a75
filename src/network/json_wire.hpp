#pragma once

#include "core/commands.hpp"
#include "core/device.hpp"
#include "core/events.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QJsonObject>

namespace tether::network {

// JSON-lines codec for the stdio Core link. One object per line in both
// directions. Kept free of I/O so it can be tested without a process.

/**
 * Decode one inbound line, e.g.
 *   {"event":"connected","deviceId":"dev1","device":{"name":"Pixel",...}}
 *   {"event":"pairState","deviceId":"dev1","state":"requested"}
 *   {"event":"sms","deviceId":"dev1","payload":{"messages":[...]}}
 */
[[nodiscard]] Result<events::CoreEvent, Error> decode_core_event(const QByteArray& line);

/**
 * Device objects: {id, name, deviceType, pairState, reachable,
 * capabilities:[...], batteryLevel, isCharging, signalStrength, networkType}.
 * `fallback_id` is used when the object carries no id of its own.
 */
[[nodiscard]] Result<Device, Error> device_from_json(const QJsonObject& obj, const DeviceId& fallback_id);
[[nodiscard]] QJsonObject device_to_json(const Device& device);

/**
 * Encode a request as {"deviceId":..., "type":<packet type>, "body":{...}},
 * without a trailing newline.
 */
[[nodiscard]] QByteArray encode_request(const commands::Request& request);

} // namespace tether::network
