#pragma once

#include "EventChannel.hpp"
#include "Types.hpp"

#include <mutex>
#include <optional>

namespace vd {

/// One-way sink the orchestrator pushes status events into.
class StatusSink {
public:
    virtual ~StatusSink() = default;
    virtual void publish(const StatusEvent& event) = 0;
};

/// Default sink: remembers only the most recent event and forwards every
/// event to its subscribers (typically a toast / banner view).
class StatusNotifier : public StatusSink {
public:
    void publish(const StatusEvent& event) override;

    /// Most recent event, if any was published.
    std::optional<StatusEvent> latest() const;

    EventChannel<StatusEvent>& channel() { return channel_; }

private:
    mutable std::mutex         mu_;
    std::optional<StatusEvent> latest_;
    EventChannel<StatusEvent>  channel_;
};

} // namespace vd
