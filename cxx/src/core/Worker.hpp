/**
 * @file Worker.hpp
 * @brief General worker context for work that must stay off the audio threads.
 */

#ifndef MEGAPHONE_WORKER_HPP
#define MEGAPHONE_WORKER_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>

namespace megaphone {

/**
 * @brief Single background thread executing posted tasks in FIFO order.
 *
 * Used for asset decoding and for tearing down a session after a device is
 * lost (the driver thread reporting the loss cannot join itself).
 * Tasks still queued at destruction are executed before the thread exits.
 * An optional idle task runs whenever the queue has been empty for one idle
 * interval.
 */
class Worker {
public:
    explicit Worker(std::string name = "worker");
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void post(std::function<void()> task);

    /**
     * @brief Install (or clear, with an empty function) the periodic idle task.
     *
     * Returns once any run of the previous idle task has finished.
     */
    void set_idle_task(std::function<void()> task, std::chrono::milliseconds interval);

    /**
     * @brief Post a task and obtain its result through a future.
     */
    template<typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        post([task]() { (*task)(); });
        return future;
    }

    /**
     * @brief Block until every task posted so far has finished.
     */
    void wait_idle();

    bool on_worker_thread() const { return std::this_thread::get_id() == thread_.get_id(); }

    const std::string& name() const { return name_; }

private:
    void thread_loop();
    void run_locked(std::unique_lock<std::mutex>& lock, const std::function<void()>& task);

    std::string name_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> tasks_;
    std::function<void()> idle_task_;
    std::chrono::milliseconds idle_interval_{100};
    bool running_ = true;
    bool busy_ = false;
    std::thread thread_;
};

} // namespace megaphone

#endif // MEGAPHONE_WORKER_HPP
