#include "StatusNotifier.hpp"

namespace vd {

void StatusNotifier::publish(const StatusEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        latest_ = event;
    }
    channel_.publish(event);
}

std::optional<StatusEvent> StatusNotifier::latest() const {
    std::lock_guard<std::mutex> lock(mu_);
    return latest_;
}

} // namespace vd
