#include "platform/linux/linux_event_loop.hpp"

#include "correction/languagetool_corrector.hpp"
#include "platform/platform_paths.hpp"
#include "render/docx_encoder.hpp"
#include "render/pdf_encoder.hpp"
#include "render/txt_encoder.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

std::string resolve_scratch_dir(const Config& config) {
    return config.storage.scratch_dir.empty() ? platform::scratch_dir()
                                              : config.storage.scratch_dir;
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      scratch_(resolve_scratch_dir(config_)),
      telegram_(config_.telegram),
      transcriber_(config_.transcriber),
      corrector_([correction = config_.correction]() -> std::unique_ptr<Corrector> {
          return std::make_unique<LanguageToolCorrector>(correction);
      }),
      renderer_(scratch_,
                std::make_unique<TxtEncoder>(),
                std::make_unique<DocxEncoder>(config_.render.title),
                std::make_unique<PdfEncoder>(config_.render, scratch_)),
      workers_(config_.workers),
      core_(config_, verbose_, telegram_, transcriber_, corrector_, renderer_, scratch_,
            config_.storage.history ? &history_db_ : nullptr,
            // TaskRunner
            [this](std::function<void()> job) {
                if (!workers_.submit(std::move(job))) {
                    std::println(stderr, "worker pool stopped, job dropped");
                }
            },
            // NotifyCallback
            [this]() { wake(worker_event_fd_); }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (poller_.joinable()) {
        poller_.request_stop();
        poller_.join();
    }
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (update_event_fd_ >= 0) ::close(update_event_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (reap_timer_fd_ >= 0) ::close(reap_timer_fd_);
}

bool LinuxEventLoop::init() {
    if (config_.telegram.token.empty()) {
        std::println(stderr, "No bot token: set telegram.token in the config or BOT_TOKEN");
        return false;
    }

    if (!scratch_.init()) return false;
    log("Scratch files in " + scratch_.dir().string());

    if (config_.storage.history) {
        auto data = platform::data_dir();
        std::string db_path = !data.empty() ? data + "/history.db" : "/tmp/voicescribe/history.db";
        if (!history_db_.open(db_path)) {
            std::println(stderr, "Warning: history DB failed to open, history disabled");
        }
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd. The mask must be in place before any
    // thread is spawned, or SIGTERM lands on a thread that still has it unblocked.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (sigprocmask(SIG_BLOCK, &mask, nullptr) < 0) {
        std::println(stderr, "sigprocmask failed: {}", std::strerror(errno));
        return false;
    }

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    update_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (update_event_fd_ < 0 || worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    reap_timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (reap_timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    itimerspec interval{};
    interval.it_value.tv_sec = config_.session.reap_interval;
    interval.it_interval.tv_sec = config_.session.reap_interval;
    if (timerfd_settime(reap_timer_fd_, 0, &interval, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    for (int fd : {signal_fd_, update_event_fd_, worker_event_fd_, reap_timer_fd_}) {
        if (!add_fd(fd, EPOLLIN)) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
    }

    workers_.start();
    running_.store(true, std::memory_order_release);
    poller_ = std::jthread([this](std::stop_token stop) { poll_updates(stop); });
    log("Polling for updates");
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;
            uint64_t val;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == update_event_fd_) {
                ::read(update_event_fd_, &val, sizeof(val));
                dispatch_inbound();
                continue;
            }

            if (fd == worker_event_fd_) {
                ::read(worker_event_fd_, &val, sizeof(val));
                core_.process_completions();
                continue;
            }

            if (fd == reap_timer_fd_) {
                ::read(reap_timer_fd_, &val, sizeof(val));
                auto reaped = core_.reap_idle(BotCore::Clock::now());
                if (reaped > 0) log(std::format("Expired {} idle session(s)", reaped));
                continue;
            }
        }
    }

    // Clean shutdown: no new input, let running jobs finish, then drop sessions
    poller_.request_stop();
    backoff_cv_.notify_all();
    if (poller_.joinable()) poller_.join();
    workers_.stop();
    core_.shutdown();
}

void LinuxEventLoop::poll_updates(std::stop_token stop) {
    int64_t offset = 0;
    while (!stop.stop_requested()) {
        auto updates = telegram_.get_updates(offset, stop);
        if (!updates) {
            if (stop.stop_requested()) break;
            std::println(stderr, "telegram: getUpdates failed: {}", updates.error());
            std::unique_lock lock(backoff_mutex_);
            backoff_cv_.wait_for(lock, stop, std::chrono::seconds(5), [] { return false; });
            continue;
        }

        bool queued = false;
        {
            std::lock_guard lock(inbound_mutex_);
            for (auto& u : *updates) {
                offset = std::max(offset, u.update_id + 1);
                if (u.event) {
                    inbound_.push_back(std::move(*u.event));
                    queued = true;
                }
            }
        }
        if (queued) wake(update_event_fd_);
    }
}

void LinuxEventLoop::dispatch_inbound() {
    std::deque<InboundEvent> batch;
    {
        std::lock_guard lock(inbound_mutex_);
        batch.swap(inbound_);
    }
    for (auto& ev : batch) {
        core_.handle_event(ev);
    }
}

void LinuxEventLoop::wake(int fd) {
    if (fd < 0) return;
    uint64_t val = 1;
    if (::write(fd, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voicescribe] {}", msg);
    }
}
