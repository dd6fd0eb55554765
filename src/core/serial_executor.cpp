#include "core/serial_executor.hpp"

#include <iostream>
#include <stdexcept>

namespace vdcam {

SerialExecutor::SerialExecutor(std::string name)
    : name_(std::move(name)) {
    worker_ = std::thread(&SerialExecutor::workerLoop, this);
}

SerialExecutor::~SerialExecutor() {
    stop();
}

bool SerialExecutor::post(Task task) {
    if (!task) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void SerialExecutor::drain() {
    if (isCurrentThread()) {
        throw std::logic_error(name_ + ": drain() called from its own thread");
    }
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return queue_.empty() && !running_task_; });
}

void SerialExecutor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable() && !isCurrentThread()) {
        worker_.join();
    }
}

bool SerialExecutor::isCurrentThread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void SerialExecutor::workerLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            running_task_ = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << name_ << ": task failed: " << e.what() << '\n';
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_task_ = false;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

}  // namespace vdcam
