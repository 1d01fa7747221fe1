#include "event_bridge.hpp"
#include "xpl/core/log.hpp"
#include "xpl/ipc/protocol.hpp"

namespace xpl {

EventBridge::EventBridge(WindowRegistry& registry)
    : registry_(registry)
{
}

bool EventBridge::subscribe(BackendEventSource& source)
{
    if (subscribed_)
    {
        LOG_WARN("Backend events already subscribed, ignoring second subscription");
        return false;
    }

    source.on_event([this](BackendEvent const& event) { publish(event); });
    subscribed_ = true;
    LOG_DEBUG("Subscribed to backend events");
    return true;
}

void EventBridge::publish(BackendEvent const& event)
{
    ++published_;
    auto message = protocol::event_message(event);

    size_t recipients = 0;
    registry_.for_each(
        [&](ManagedWindow& window)
        {
            registry_.deliver(window.id, message);
            ++recipients;
        }
    );
    LOG_TRACE("Backend event #{} delivered to {} window(s)", published_, recipients);
}

} // namespace xpl
