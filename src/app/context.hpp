#pragma once

#include "app/settings.hpp"
#include "core/events.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/command_dispatcher.hpp"
#include "network/core_link.hpp"
#include "network/device_cache.hpp"
#include "network/event_queue.hpp"
#include "network/event_relay.hpp"
#include "network/refresh_scheduler.hpp"
#include "sms/sms_reconciler.hpp"
#include <QObject>
#include <QString>
#include <memory>

namespace tether::app {

/**
 * AppContext - Owns every relay component for the lifetime of the process.
 *
 * Built once at startup and passed by reference to whoever needs it; there
 * is no global state. Wiring:
 *
 *   CoreEventSource -> EventQueue <- RefreshScheduler
 *                          |
 *                      EventRelay -> DeviceCache
 *                          |
 *                      SmsReconciler
 *
 *   CommandDispatcher -> CoreChannel
 *
 * The queue is drained on the event loop, so Core callbacks and timer ticks
 * only ever enqueue.
 */
class AppContext : public QObject {
    Q_OBJECT

public:
    explicit AppContext(RelaySettings settings = {},
                        ClockFn clock = &Timestamp::now,
                        QObject* parent = nullptr);
    ~AppContext() override;

    /**
     * Connect the Core. Neither pointer is owned; both must outlive the
     * context or be detached with attachCore(nullptr, nullptr).
     */
    void attachCore(network::CoreEventSource* source, network::CoreChannel* channel);

    /**
     * Start the Core event source and the refresh timers.
     */
    Result<void, Error> start();

    /**
     * Enqueue a Core event as if the attached source had produced it.
     */
    bool post(events::CoreEvent event);

    /**
     * Apply everything queued right now, without waiting for the event loop.
     */
    int drainNow();

    [[nodiscard]] const network::DeviceCache& cache() const { return *cache_; }
    [[nodiscard]] network::EventQueue& queue() { return *queue_; }
    [[nodiscard]] network::EventRelay& relay() { return *relay_; }
    [[nodiscard]] network::RefreshScheduler& scheduler() { return *scheduler_; }
    [[nodiscard]] network::CommandDispatcher& commands() { return *dispatcher_; }
    [[nodiscard]] sms::SmsReconciler& sms() { return *sms_; }
    [[nodiscard]] const RelaySettings& settings() const { return settings_; }

    // SMS window actions. Each updates the local tables and sends at most
    // one request to the Core.
    void loadConversations(const DeviceId& device);
    void openThread(const DeviceId& device, const QString& thread_id);
    QString startChat(const DeviceId& device, const QString& phone_number);
    bool sendSms(const DeviceId& device, const QString& body);

private:
    RelaySettings settings_;
    ClockFn clock_;
    network::CoreEventSource* source_ = nullptr;

    std::unique_ptr<network::DeviceCache> cache_;
    std::unique_ptr<network::EventQueue> queue_;
    std::unique_ptr<network::EventRelay> relay_;
    std::unique_ptr<network::RefreshScheduler> scheduler_;
    std::unique_ptr<network::CommandDispatcher> dispatcher_;
    std::unique_ptr<sms::SmsReconciler> sms_;

    void wire();
};

} // namespace tether::app
