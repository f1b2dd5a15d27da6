#include <catch2/catch_test_macros.hpp>
#include "peerquic/quic/event_loop.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <atomic>
#include <future>
#include <vector>
using namespace peerquic;
using namespace peerquic::quic;
using namespace std::chrono_literals;

TEST_CASE("EventLoop - task execution", "[quic][loop]") {
    auto loop = EventLoop::Create().Unwrap();

    SECTION("Post is refused before Start") {
        REQUIRE_FALSE(loop->IsRunning());
        REQUIRE_FALSE(loop->Post([]() {}));
        REQUIRE_FALSE(loop->Invoke([]() { return 1; }).has_value());
    }

    SECTION("Tasks run in posting order on the loop thread") {
        loop->Start();
        std::vector<int> order;
        std::atomic<bool> all_on_loop{true};
        for (int i = 0; i < 100; ++i) {
            REQUIRE(loop->Post([&, i]() {
                if (!loop->IsLoopThread()) {
                    all_on_loop = false;
                }
                order.push_back(i);
            }));
        }
        const auto size = loop->Invoke([&]() { return order.size(); });
        REQUIRE(size.has_value());
        REQUIRE(*size == 100);
        for (int i = 0; i < 100; ++i) {
            REQUIRE(order[static_cast<size_t>(i)] == i);
        }
        REQUIRE(all_on_loop);
        REQUIRE_FALSE(loop->IsLoopThread());
    }

    SECTION("Invoke from the loop thread runs inline") {
        loop->Start();
        const auto nested = loop->Invoke([&]() {
            return loop->Invoke([]() { return 7; }).value_or(0);
        });
        REQUIRE(nested == std::optional<int>(7));
    }

    SECTION("Invoke propagates exceptions") {
        loop->Start();
        REQUIRE_THROWS_AS(loop->Invoke([]() -> int { throw std::runtime_error("boom"); }), std::runtime_error);
    }

    SECTION("Accepted tasks still run on Stop, later ones are refused") {
        loop->Start();
        std::atomic<int> ran{0};
        for (int i = 0; i < 10; ++i) {
            REQUIRE(loop->Post([&]() { ++ran; }));
        }
        loop->Stop();
        REQUIRE(ran == 10);
        REQUIRE_FALSE(loop->IsRunning());
        REQUIRE_FALSE(loop->Post([]() {}));
        REQUIRE_FALSE(loop->Invoke([]() { return 1; }).has_value());
    }
}

TEST_CASE("EventLoop - readiness and deadlines", "[quic][loop]") {
    auto loop = EventLoop::Create().Unwrap();

    SECTION("Read handler fires when the descriptor becomes readable") {
        int fds[2];
        REQUIRE(::pipe2(fds, O_NONBLOCK) == 0);
        std::promise<uint8_t> received;
        loop->SetReadHandler(fds[0], [&]() {
            uint8_t byte = 0;
            if (::read(fds[0], &byte, 1) == 1) {
                received.set_value(byte);
            }
        });
        loop->Start();

        const uint8_t byte = 0x42;
        REQUIRE(::write(fds[1], &byte, 1) == 1);
        auto future = received.get_future();
        REQUIRE(future.wait_for(2s) == std::future_status::ready);
        REQUIRE(future.get() == 0x42);

        loop->Stop();
        ::close(fds[0]);
        ::close(fds[1]);
    }

    SECTION("Deadline handler fires once the deadline passes") {
        const Timestamp started = Now();
        const Timestamp deadline = started + 20'000'000;
        std::atomic<bool> armed{true};
        std::promise<Timestamp> fired;
        loop->SetDeadlineHandler(
            [&]() -> std::optional<Timestamp> {
                return armed ? std::optional<Timestamp>(deadline) : std::nullopt;
            },
            [&]() {
                armed = false;
                fired.set_value(Now());
            });
        loop->Start();

        auto future = fired.get_future();
        REQUIRE(future.wait_for(2s) == std::future_status::ready);
        REQUIRE(future.get() >= deadline);
        loop->Stop();
    }
}

TEST_CASE("EventLoop - failure of the wait itself", "[quic][loop]") {
    auto loop = EventLoop::Create().Unwrap();
    int fds[2];
    REQUIRE(::pipe2(fds, O_NONBLOCK) == 0);

    std::promise<TransportFailure> failed;
    loop->SetReadHandler(fds[0], []() {});
    loop->SetFailureHandler([&](const TransportFailure& failure) { failed.set_value(failure); });
    loop->Start();

    // The next poll() round sees the descriptor as invalid.
    ::close(fds[0]);
    REQUIRE(loop->Post([]() {}));

    auto future = failed.get_future();
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    REQUIRE(future.get().type == TransportFailureType::Socket);

    loop->Stop();
    REQUIRE_FALSE(loop->IsRunning());
    REQUIRE_FALSE(loop->Post([]() {}));
    ::close(fds[1]);
}
