#include <catch2/catch_test_macros.hpp>

#include "worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <sys/signalfd.h>
#include <thread>
#include <unistd.h>
#include <vector>

TEST_CASE("WorkerPool", "[workers]") {

    SECTION("RunsEveryJob") {
        std::atomic<int> done{0};
        {
            WorkerPool pool(3);
            pool.start();
            for (int i = 0; i < 50; ++i) {
                REQUIRE(pool.submit([&done] { done++; }));
            }
            pool.stop();
        }
        REQUIRE(done == 50);
    }

    SECTION("SingleThreadKeepsOrder") {
        std::vector<int> order;
        std::mutex m;
        WorkerPool pool(1);
        pool.start();
        for (int i = 0; i < 10; ++i) {
            REQUIRE(pool.submit([&, i] {
                std::lock_guard lock(m);
                order.push_back(i);
            }));
        }
        pool.stop();
        REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9});
    }

    SECTION("JobsRunConcurrently") {
        std::atomic<int> active{0};
        std::atomic<int> peak{0};
        WorkerPool pool(4);
        pool.start();
        for (int i = 0; i < 4; ++i) {
            REQUIRE(pool.submit([&] {
                int now = ++active;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                --active;
            }));
        }
        pool.stop();
        REQUIRE(peak > 1);
    }

    SECTION("ThrowingJobDoesNotKillWorker") {
        std::atomic<int> done{0};
        WorkerPool pool(1);
        pool.start();
        REQUIRE(pool.submit([] { throw std::runtime_error("boom"); }));
        REQUIRE(pool.submit([&done] { done++; }));
        pool.stop();
        REQUIRE(done == 1);
    }

    SECTION("SubmitAfterStopRefused") {
        WorkerPool pool(2);
        pool.start();
        pool.stop();
        REQUIRE_FALSE(pool.submit([] {}));
        REQUIRE(pool.pending() == 0);
    }

    SECTION("ZeroThreadsStillRuns") {
        std::atomic<int> done{0};
        WorkerPool pool(0);
        pool.start();
        REQUIRE(pool.submit([&done] { done++; }));
        pool.stop();
        REQUIRE(done == 1);
    }
}

TEST_CASE("WorkerPool threads leave SIGTERM to the signalfd", "[workers][signals]") {
    // Same order as the event loop: pool member built, mask blocked, signalfd, start.
    WorkerPool pool(4);

    sigset_t mask, old_mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    REQUIRE(sigprocmask(SIG_BLOCK, &mask, &old_mask) == 0);

    int sfd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    REQUIRE(sfd >= 0);

    pool.start();
    std::atomic<int> done{0};
    for (int i = 0; i < 4; ++i) {
        REQUIRE(pool.submit([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            done++;
        }));
    }

    REQUIRE(kill(getpid(), SIGTERM) == 0);

    pollfd pfd{.fd = sfd, .events = POLLIN, .revents = 0};
    REQUIRE(poll(&pfd, 1, 2000) == 1);
    REQUIRE((pfd.revents & POLLIN) != 0);

    signalfd_siginfo info{};
    REQUIRE(read(sfd, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info)));
    REQUIRE(info.ssi_signo == static_cast<uint32_t>(SIGTERM));

    pool.stop();
    REQUIRE(done == 4);

    close(sfd);
    REQUIRE(sigprocmask(SIG_SETMASK, &old_mask, nullptr) == 0);
}
