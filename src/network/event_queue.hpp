#pragma once

#include "core/events.hpp"
#include <QMutex>
#include <QObject>
#include <deque>
#include <optional>

namespace tether::network {

/**
 * EventQueue - FIFO feeding the relay's single consumption loop.
 *
 * Producers (the Core link, refresh timers) may push from any thread. The
 * relay drains on its own thread after eventsAvailable() is delivered.
 * Once closed, pushes are refused and tryNext() returns nullopt after the
 * backlog is consumed.
 */
class EventQueue : public QObject {
    Q_OBJECT

public:
    explicit EventQueue(QObject* parent = nullptr);

    /**
     * Enqueue an event. Returns false if the queue has been closed.
     */
    bool push(events::RelayEvent event);

    /**
     * Mark the source as finished. Already queued events are still delivered.
     */
    void close();

    [[nodiscard]] std::optional<events::RelayEvent> tryNext();

    [[nodiscard]] bool isClosed() const;

    /**
     * True when closed and nothing is left to consume.
     */
    [[nodiscard]] bool isFinished() const;

    [[nodiscard]] size_t pending() const;

signals:
    void eventsAvailable();
    void closed();

private:
    mutable QMutex mu_;
    std::deque<events::RelayEvent> events_;
    bool closed_ = false;
};

} // namespace tether::network
