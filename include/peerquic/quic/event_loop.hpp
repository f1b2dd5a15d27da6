#pragma once

#include "peerquic/core/result.hpp"
#include "peerquic/core/failures.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>

namespace peerquic::quic {

/// Monotonic nanoseconds, the engine's clock
using Timestamp = uint64_t;

[[nodiscard]] Timestamp Now() noexcept;

/**
 * @brief Single-threaded actor loop of one Endpoint
 *
 * One thread waits on the socket, a wake-up pipe and the earliest engine
 * deadline. Everything that touches engine state runs on this thread;
 * other threads hand work over through Post/Invoke.
 */
class EventLoop {
public:
    using Task = std::function<void()>;
    using FailureHandler = std::function<void(const TransportFailure&)>;
    using DeadlineSource = std::function<std::optional<Timestamp>()>;

    [[nodiscard]] static Result<std::shared_ptr<EventLoop>, TransportFailure> Create();

    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // ========================================================================
    // Setup (before Start)
    // ========================================================================

    void SetReadHandler(int fd, Task on_readable);

    /**
     * @brief Deadline polling
     *
     * next_deadline is asked before every wait; on_deadline runs once the
     * returned time has passed.
     */
    void SetDeadlineHandler(DeadlineSource next_deadline, Task on_deadline);

    /**
     * @brief Called on the loop thread when waiting itself fails
     *
     * A poll() error or an invalidated read descriptor ends the loop; the
     * handler runs first so the owner can fail everything that depends on it.
     */
    void SetFailureHandler(FailureHandler on_failure);

    void Start();

    // ========================================================================
    // Any thread
    // ========================================================================

    /**
     * @brief Stop the loop
     *
     * Tasks already accepted still run before the thread exits. From any
     * thread but the loop's own, blocks until the thread has exited.
     */
    void Stop();

    /// @return false once the loop no longer accepts tasks
    bool Post(Task task);

    /**
     * @brief Run func on the loop thread and wait for its result
     *
     * Runs inline when called from the loop thread.
     *
     * @return nullopt when the loop has stopped and func never ran
     */
    template<typename F>
    auto Invoke(F&& func) -> std::optional<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        if (IsLoopThread()) {
            return std::optional<R>(std::forward<F>(func)());
        }
        auto promise = std::make_shared<std::promise<R>>();
        auto future = promise->get_future();
        auto shared_func = std::make_shared<std::decay_t<F>>(std::forward<F>(func));
        const bool accepted = Post([promise, shared_func]() {
            try {
                promise->set_value((*shared_func)());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        if (!accepted) {
            return std::nullopt;
        }
        return std::optional<R>(future.get());
    }

    [[nodiscard]] bool IsLoopThread() const noexcept {
        return std::this_thread::get_id() == loop_thread_id_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool IsRunning() const noexcept {
        return accepting_.load(std::memory_order_acquire);
    }

private:
    EventLoop(int wake_read_fd, int wake_write_fd) noexcept;

    void Run();
    void RunPendingTasks();
    void Wake() noexcept;
    void DrainWakeups() noexcept;
    void Fail(TransportFailure failure);
    [[nodiscard]] int ComputeTimeoutMs() const;

    int wake_read_fd_;
    int wake_write_fd_;

    int read_fd_ = -1;
    Task on_readable_;
    DeadlineSource next_deadline_;
    Task on_deadline_;
    FailureHandler on_failure_;

    std::mutex mutex_;
    std::deque<Task> tasks_;
    std::atomic<bool> accepting_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::thread::id> loop_thread_id_{};
    std::thread thread_;
};

}
