#pragma once

#include "xpl/bridge/event_source.hpp"
#include "xpl/core/types.hpp"
#include "xpl/window/registry.hpp"

namespace xpl {

/**
 * @brief Fans backend events out to every live window
 *
 * Subscribes once; the registry is the only list of recipients. Events are
 * delivered in arrival order, unchanged, at most once per window.
 */
class EventBridge
{
public:
    explicit EventBridge(WindowRegistry& registry);

    EventBridge(EventBridge const&) = delete;
    EventBridge& operator=(EventBridge const&) = delete;

    /// Returns false if a source is already subscribed.
    bool subscribe(BackendEventSource& source);
    bool subscribed() const { return subscribed_; }

    void publish(BackendEvent const& event);

    uint64_t published() const { return published_; }

private:
    WindowRegistry& registry_;
    bool subscribed_ = false;
    uint64_t published_ = 0;
};

} // namespace xpl
