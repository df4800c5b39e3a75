#pragma once

#include "core/device.hpp"
#include "core/types.hpp"
#include "network/device_cache.hpp"
#include <QMetaType>
#include <QString>
#include <optional>
#include <unordered_map>

namespace tether::network {

/**
 * PairingNotification - What the UI needs to render an incoming request.
 */
struct PairingNotification {
    DeviceId device_id;
    QString device_name;
    QString device_type;

    bool operator==(const PairingNotification&) const = default;
};

/**
 * PairingDetector - Turns PairStateChanged deliveries into one notification
 * per transition into Requested.
 *
 * The Core re-sends pair packets; a device that stays in Requested must not
 * raise a second prompt. The last observed state per device is the dedupe
 * key, so Requested -> NotPaired -> Requested prompts twice.
 */
class PairingDetector {
public:
    /**
     * Record a pair state delivery. Returns a notification when the device
     * just entered Requested and is known to the cache; requests for devices
     * the cache has never seen are dropped.
     */
    [[nodiscard]] std::optional<PairingNotification> observe(const DeviceId& id,
                                                             PairState state,
                                                             const DeviceCache& cache);

    /**
     * Record a pair state learned outside PairStateChanged (Connected or
     * DevicePaired). Never notifies. Requested is ignored here so that the
     * following PairStateChanged still decides whether to prompt.
     */
    void record(const DeviceId& id, PairState state);

    /**
     * Forget a device (disconnect). The next Requested notifies again.
     */
    void forget(const DeviceId& id);

    [[nodiscard]] std::optional<PairState> lastObserved(const DeviceId& id) const;

private:
    std::unordered_map<DeviceId, PairState> last_state_;
};

} // namespace tether::network

Q_DECLARE_METATYPE(tether::network::PairingNotification)
