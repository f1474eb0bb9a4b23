#include "Executor.hpp"

#include "Log.hpp"

#include <exception>

namespace vd {

SerialExecutor::SerialExecutor(std::string name)
    : name_(std::move(name)) {
    thread_ = std::thread(&SerialExecutor::run_loop, this);
}

SerialExecutor::~SerialExecutor() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
    }
    cv_.notify_one();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SerialExecutor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_) {
            Logger::warn(name_ + ": task posted after shutdown, dropped");
            return;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

bool SerialExecutor::is_current() const {
    return std::this_thread::get_id() == thread_.get_id();
}

void SerialExecutor::run_loop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;     // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            Logger::error(name_ + ": task threw: " + e.what());
        }
    }
}

} // namespace vd
