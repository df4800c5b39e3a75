#include "network/refresh_scheduler.hpp"
#include "core/log.hpp"

namespace tether::network {

RefreshPolicy sanitized(RefreshPolicy policy) {
    const RefreshPolicy defaults;
    if (policy.burst_window.count() <= 0) {
        policy.burst_window = defaults.burst_window;
    }
    if (policy.burst_interval.count() <= 0) {
        policy.burst_interval = defaults.burst_interval;
    }
    if (policy.backstop_interval.count() <= 0) {
        policy.backstop_interval = defaults.backstop_interval;
    }
    if (policy.burst_interval > policy.burst_window) {
        policy.burst_interval = policy.burst_window;
    }
    return policy;
}

BurstWindow::BurstWindow(RefreshPolicy policy)
    : policy_(sanitized(policy))
{
}

void BurstWindow::start(Timestamp now) {
    if (started_at_ && *started_at_ > now) {
        return;
    }
    started_at_ = now;
}

bool BurstWindow::isActive(Timestamp now) const {
    if (!started_at_) {
        return false;
    }
    return now - *started_at_ < policy_.burst_window;
}

events::TimerKind BurstWindow::kindAt(Timestamp now) const {
    return isActive(now) ? events::TimerKind::PairingBurst : events::TimerKind::Backstop;
}

std::chrono::milliseconds BurstWindow::delayAt(Timestamp now) const {
    return isActive(now) ? policy_.burst_interval : policy_.backstop_interval;
}

RefreshScheduler::RefreshScheduler(EventQueue& queue,
                                   RefreshPolicy policy,
                                   ClockFn clock,
                                   QObject* parent)
    : QObject(parent)
    , queue_(queue)
    , window_(policy)
    , clock_(std::move(clock))
    , timer_(std::make_unique<QTimer>(this))
{
    timer_->setSingleShot(true);
    connect(timer_.get(), &QTimer::timeout, this, &RefreshScheduler::onTimeout);
    connect(&queue_, &EventQueue::closed, this, &RefreshScheduler::stop);
}

RefreshScheduler::~RefreshScheduler() {
    stop();
}

void RefreshScheduler::start() {
    if (running_ || queue_.isClosed()) {
        return;
    }
    running_ = true;
    arm(clock_());
}

void RefreshScheduler::stop() {
    running_ = false;
    timer_->stop();
}

void RefreshScheduler::markBurst() {
    const auto now = clock_();
    window_.start(now);
    qCDebug(tetherRelayLog) << "pairing burst started";
    if (running_) {
        arm(now);
    }
}

void RefreshScheduler::onTimeout() {
    if (!running_) {
        return;
    }

    const auto now = clock_();
    const auto kind = window_.kindAt(now);
    if (!queue_.push(events::TimerTick{kind})) {
        stop();
        return;
    }
    emit tickQueued(kind);
    arm(now);
}

void RefreshScheduler::arm(Timestamp now) {
    timer_->start(window_.delayAt(now));
}

} // namespace tether::network
