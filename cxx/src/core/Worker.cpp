#include "Worker.hpp"
#include <exception>
#include <iostream>

namespace megaphone {

Worker::Worker(std::string name)
    : name_(std::move(name))
{
    thread_ = std::thread(&Worker::thread_loop, this);
}

Worker::~Worker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Worker::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void Worker::set_idle_task(std::function<void()> task, std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!on_worker_thread()) {
        idle_cv_.wait(lock, [this]() { return !busy_; });
    }
    idle_task_ = std::move(task);
    idle_interval_ = interval;
    lock.unlock();
    cv_.notify_all();
}

void Worker::wait_idle() {
    if (on_worker_thread()) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return tasks_.empty() && !busy_; });
}

void Worker::run_locked(std::unique_lock<std::mutex>& lock, const std::function<void()>& task) {
    busy_ = true;
    lock.unlock();

    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "[" << name_ << "] Task failed: " << e.what() << std::endl;
    }

    lock.lock();
    busy_ = false;
    idle_cv_.notify_all();
}

void Worker::thread_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto has_work = [this]() { return !tasks_.empty() || !running_; };
    while (true) {
        if (idle_task_) {
            if (!cv_.wait_for(lock, idle_interval_, has_work)) {
                if (idle_task_) {
                    const auto idle = idle_task_;
                    run_locked(lock, idle);
                }
                continue;
            }
        } else {
            cv_.wait(lock, [&]() { return has_work() || static_cast<bool>(idle_task_); });
            if (!has_work()) {
                continue; // idle task installed
            }
        }

        if (tasks_.empty()) {
            break; // stopping and drained
        }

        auto task = std::move(tasks_.front());
        tasks_.pop_front();
        run_locked(lock, task);
    }
    idle_cv_.notify_all();
}

} // namespace megaphone
