#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace vdcam {

// Runs posted tasks one at a time, in submission order, on a private thread.
class SerialExecutor {
public:
    using Task = std::function<void()>;

    explicit SerialExecutor(std::string name);
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    // Returns false once the executor has been stopped.
    bool post(Task task);

    // Blocks until every task posted before the call has run. Must not be
    // called from the executor thread itself.
    void drain();

    // Runs the remaining queue, then joins the worker.
    void stop();

    bool isCurrentThread() const;
    const std::string& name() const { return name_; }

private:
    void workerLoop();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> queue_;
    bool stopping_{false};
    bool running_task_{false};
    std::thread worker_;
};

}  // namespace vdcam
