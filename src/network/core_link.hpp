#pragma once

#include "core/commands.hpp"
#include "core/events.hpp"
#include "core/result.hpp"
#include <functional>

namespace tether::network {

/**
 * CoreChannel - Outbound half of the Core connection.
 *
 * send() only reports whether the request left this process; the Core never
 * answers a request directly.
 */
class CoreChannel {
public:
    virtual ~CoreChannel() = default;

    virtual Result<void, Error> send(const commands::Request& request) = 0;
};

/**
 * CoreEventSource - Inbound half of the Core connection.
 */
class CoreEventSource {
public:
    virtual ~CoreEventSource() = default;

    virtual Result<void, Error> start() = 0;
    virtual void stop() = 0;

    // Callbacks
    std::function<void(events::CoreEvent)> on_event;
    std::function<void()> on_closed;
};

} // namespace tether::network
