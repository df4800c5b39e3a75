#pragma once

#include "core/events.hpp"
#include "network/device_cache.hpp"
#include "network/event_queue.hpp"
#include "network/pairing.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QObject>
#include <QString>

namespace tether::network {

/**
 * EventRelay - Applies Core events and timer ticks to the device cache.
 *
 * The relay is the only writer of the DeviceCache. Each event is fully
 * applied (at most one cache mutation) before the next one is taken from the
 * queue, and listeners are told afterwards:
 *
 * - devicesChanged() carries no payload; listeners re-read the cache.
 * - pairingRequested() fires once per transition into Requested.
 * - SMS, contacts, clipboard and media events pass through untouched.
 */
class EventRelay : public QObject {
    Q_OBJECT

public:
    EventRelay(DeviceCache& cache, EventQueue& queue, QObject* parent = nullptr);

    /**
     * Apply a single event. Exposed for tests and replay; the live path goes
     * through drain().
     */
    void apply(const events::RelayEvent& event);

    [[nodiscard]] bool isStopped() const { return stopped_; }

    [[nodiscard]] const PairingDetector& pairing() const { return detector_; }

public slots:
    /**
     * Consume everything currently queued. Returns the number of events
     * applied. Emits stopped() once after the queue has been closed and
     * emptied.
     */
    int drain();

signals:
    void devicesChanged();
    void pairingBurstStarted();
    void pairingRequested(const tether::network::PairingNotification& notification);
    void clipboardReceived(const QString& content);
    void mediaUpdated(const tether::DeviceId& id, const QJsonObject& payload);
    void smsPayloadReceived(const tether::DeviceId& id, const QByteArray& payload);
    void contactsPayloadReceived(const tether::DeviceId& id, const QByteArray& payload);
    void refreshRequested(tether::events::TimerKind kind);
    void stopped();

private:
    DeviceCache& cache_;
    EventQueue& queue_;
    PairingDetector detector_;
    bool stopped_ = false;

    void applyCore(const events::CoreEvent& event);
    void handleConnected(Device device, bool paired);
    void handleStateUpdated(const events::StateUpdated& update);
};

/**
 * Copy the optional state fields present in `state` (currentCharge,
 * isCharging, signalStrength, networkType) onto `device`. Returns true if
 * any field changed. Out-of-range values are ignored.
 */
bool apply_state_fields(Device& device, const QJsonObject& state);

} // namespace tether::network
