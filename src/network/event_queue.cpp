#include "network/event_queue.hpp"

#include <QMutexLocker>

namespace tether::network {

EventQueue::EventQueue(QObject* parent)
    : QObject(parent)
{
}

bool EventQueue::push(events::RelayEvent event) {
    {
        QMutexLocker lock(&mu_);
        if (closed_) {
            return false;
        }
        events_.push_back(std::move(event));
    }
    emit eventsAvailable();
    return true;
}

void EventQueue::close() {
    {
        QMutexLocker lock(&mu_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    emit closed();
    // Wake the consumer so it can observe the end of the stream.
    emit eventsAvailable();
}

std::optional<events::RelayEvent> EventQueue::tryNext() {
    QMutexLocker lock(&mu_);
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

bool EventQueue::isClosed() const {
    QMutexLocker lock(&mu_);
    return closed_;
}

bool EventQueue::isFinished() const {
    QMutexLocker lock(&mu_);
    return closed_ && events_.empty();
}

size_t EventQueue::pending() const {
    QMutexLocker lock(&mu_);
    return events_.size();
}

} // namespace tether::network
