#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace vd {

/// Something that runs posted tasks later, in posting order.
class Executor {
public:
    using Task = std::function<void()>;

    virtual ~Executor() = default;

    /// Queue a task.  Never runs it inline.
    virtual void post(Task task) = 0;
};

/// Executor backed by one dedicated worker thread.  Tasks run strictly one
/// after another.  The destructor drains the queue and joins the thread.
class SerialExecutor : public Executor {
public:
    explicit SerialExecutor(std::string name);
    ~SerialExecutor() override;

    // Non-copyable.
    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    void post(Task task) override;

    /// Whether the caller is running on this executor's thread.
    bool is_current() const;

private:
    void run_loop();

    std::string             name_;
    std::mutex              mu_;
    std::condition_variable cv_;
    std::deque<Task>        queue_;
    bool                    stopping_ = false;
    std::thread             thread_;
};

} // namespace vd
