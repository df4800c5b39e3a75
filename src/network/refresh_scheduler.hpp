#pragma once

#include "core/events.hpp"
#include "core/types.hpp"
#include "network/event_queue.hpp"
#include <QObject>
#include <QTimer>
#include <chrono>
#include <memory>
#include <optional>

namespace tether::network {

/**
 * RefreshPolicy - Timing for the relay's refresh ticks.
 *
 * A pairing burst polls quickly for burst_window after a device appears so
 * the UI catches the pair prompt and the first state report. Outside a
 * burst the backstop tick keeps the view from going stale.
 */
struct RefreshPolicy {
    std::chrono::milliseconds burst_window{10000};
    std::chrono::milliseconds burst_interval{500};
    std::chrono::milliseconds backstop_interval{10000};

    bool operator==(const RefreshPolicy&) const = default;
};

/**
 * Replace non-positive durations with defaults and clamp the burst interval
 * to the window.
 */
[[nodiscard]] RefreshPolicy sanitized(RefreshPolicy policy);

/**
 * BurstWindow - Pure timing state behind RefreshScheduler.
 */
class BurstWindow {
public:
    explicit BurstWindow(RefreshPolicy policy = {});

    /**
     * Open (or reopen) the window at `now`. A restart extends the burst, it
     * never shortens it.
     */
    void start(Timestamp now);

    [[nodiscard]] bool isActive(Timestamp now) const;
    [[nodiscard]] events::TimerKind kindAt(Timestamp now) const;

    /**
     * Delay until the next tick if one were scheduled at `now`.
     */
    [[nodiscard]] std::chrono::milliseconds delayAt(Timestamp now) const;

    [[nodiscard]] std::optional<Timestamp> startedAt() const { return started_at_; }
    [[nodiscard]] const RefreshPolicy& policy() const { return policy_; }

private:
    RefreshPolicy policy_;
    std::optional<Timestamp> started_at_;
};

/**
 * RefreshScheduler - Posts TimerTick events into the relay queue.
 *
 * The scheduler never touches the cache; it only enqueues. One single-shot
 * timer is re-armed after each tick with the cadence the window dictates.
 */
class RefreshScheduler : public QObject {
    Q_OBJECT

public:
    RefreshScheduler(EventQueue& queue,
                     RefreshPolicy policy,
                     ClockFn clock = &Timestamp::now,
                     QObject* parent = nullptr);
    ~RefreshScheduler() override;

    void start();
    void stop();
    [[nodiscard]] bool isRunning() const { return running_; }

    [[nodiscard]] const BurstWindow& window() const { return window_; }

public slots:
    /**
     * A device connected or paired: restart the burst window and switch to
     * the fast cadence immediately.
     */
    void markBurst();

signals:
    void tickQueued(tether::events::TimerKind kind);

private slots:
    void onTimeout();

private:
    EventQueue& queue_;
    BurstWindow window_;
    ClockFn clock_;
    std::unique_ptr<QTimer> timer_;
    bool running_ = false;

    void arm(Timestamp now);
};

} // namespace tether::network
