#include "peerquic/quic/event_loop.hpp"
#include "peerquic/debug/logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <fmt/core.h>

#include <cerrno>
#include <cstring>

namespace peerquic::quic {

namespace {

constexpr std::string_view kComponent = "loop";

}

Timestamp Now() noexcept {
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

Result<std::shared_ptr<EventLoop>, TransportFailure> EventLoop::Create() {
    int fds[2];
    if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) != 0) {
        return Result<std::shared_ptr<EventLoop>, TransportFailure>::Err(
            TransportFailure::Socket(fmt::format("pipe2() failed: {}", std::strerror(errno))));
    }
    return Result<std::shared_ptr<EventLoop>, TransportFailure>::Ok(
        std::shared_ptr<EventLoop>(new EventLoop(fds[0], fds[1])));
}

EventLoop::EventLoop(const int wake_read_fd, const int wake_write_fd) noexcept
    : wake_read_fd_(wake_read_fd)
    , wake_write_fd_(wake_write_fd) {
}

EventLoop::~EventLoop() {
    Stop();
    if (thread_.joinable()) {
        // Destroyed from its own thread: the last owner was a loop task.
        thread_.detach();
    }
    ::close(wake_read_fd_);
    ::close(wake_write_fd_);
}

void EventLoop::SetReadHandler(const int fd, Task on_readable) {
    read_fd_ = fd;
    on_readable_ = std::move(on_readable);
}

void EventLoop::SetDeadlineHandler(DeadlineSource next_deadline, Task on_deadline) {
    next_deadline_ = std::move(next_deadline);
    on_deadline_ = std::move(on_deadline);
}

void EventLoop::SetFailureHandler(FailureHandler on_failure) {
    on_failure_ = std::move(on_failure);
}

void EventLoop::Start() {
    accepting_.store(true, std::memory_order_release);
    thread_ = std::thread([this]() { Run(); });
}

void EventLoop::Stop() {
    stop_requested_.store(true, std::memory_order_release);
    Wake();
    if (!IsLoopThread() && thread_.joinable()) {
        thread_.join();
    }
}

bool EventLoop::Post(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (!accepting_.load(std::memory_order_acquire)) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    Wake();
    return true;
}

void EventLoop::Wake() noexcept {
    const uint8_t byte = 1;
    // A full pipe already guarantees a pending wake-up.
    while (::write(wake_write_fd_, &byte, 1) < 0 && errno == EINTR) {
    }
}

void EventLoop::DrainWakeups() noexcept {
    uint8_t buffer[64];
    while (::read(wake_read_fd_, buffer, sizeof(buffer)) > 0) {
    }
}

void EventLoop::RunPendingTasks() {
    std::deque<Task> batch;
    {
        std::lock_guard lock(mutex_);
        batch.swap(tasks_);
    }
    for (auto& task : batch) {
        task();
    }
}

void EventLoop::Fail(TransportFailure failure) {
    PEERQUIC_LOG_ERROR(kComponent, "loop failed: {}", failure.message);
    stop_requested_.store(true, std::memory_order_release);
    if (on_failure_) {
        on_failure_(failure);
    }
}

int EventLoop::ComputeTimeoutMs() const {
    if (!next_deadline_) {
        return -1;
    }
    const auto deadline = next_deadline_();
    if (!deadline) {
        return -1;
    }
    const Timestamp now = Now();
    if (*deadline <= now) {
        return 0;
    }
    // Round up so the deadline has passed when poll returns.
    const Timestamp remaining_ms = (*deadline - now + 999'999) / 1'000'000;
    return remaining_ms > 60'000 ? 60'000 : static_cast<int>(remaining_ms);
}

void EventLoop::Run() {
    loop_thread_id_.store(std::this_thread::get_id(), std::memory_order_release);
    PEERQUIC_LOG_TRACE(kComponent, "loop started");

    while (!stop_requested_.load(std::memory_order_acquire)) {
        RunPendingTasks();
        if (stop_requested_.load(std::memory_order_acquire)) {
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        fds[count++] = pollfd{wake_read_fd_, POLLIN, 0};
        if (read_fd_ >= 0) {
            fds[count++] = pollfd{read_fd_, POLLIN, 0};
        }

        const int rc = ::poll(fds, count, ComputeTimeoutMs());
        if (rc < 0 && errno != EINTR) {
            Fail(TransportFailure::Socket(fmt::format("poll() failed: {}", std::strerror(errno))));
            break;
        }
        if (rc > 0 && count > 1 && (fds[1].revents & POLLNVAL)) {
            Fail(TransportFailure::Socket(fmt::format("descriptor {} is no longer valid", read_fd_)));
            break;
        }
        if (rc > 0 && (fds[0].revents & POLLIN)) {
            DrainWakeups();
        }
        if (rc > 0 && count > 1 && (fds[1].revents & (POLLIN | POLLERR)) && on_readable_) {
            on_readable_();
        }
        if (next_deadline_ && on_deadline_) {
            const auto deadline = next_deadline_();
            if (deadline && *deadline <= Now()) {
                on_deadline_();
            }
        }
    }

    {
        std::lock_guard lock(mutex_);
        accepting_.store(false, std::memory_order_release);
    }
    RunPendingTasks();
    PEERQUIC_LOG_TRACE(kComponent, "loop stopped");
}

}
