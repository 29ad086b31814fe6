#pragma once

#include "bot_core.hpp"
#include "config.hpp"
#include "correction/corrector_pool.hpp"
#include "messaging/telegram_client.hpp"
#include "render/document_renderer.hpp"
#include "scratch/scratch_file.hpp"
#include "storage/history_db.hpp"
#include "whisper/lan_backend.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stop_token>
#include <thread>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();

private:
    // Long-poll thread: fetches updates and hands them to the loop.
    void poll_updates(std::stop_token stop);
    void dispatch_inbound();
    void wake(int fd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Adapters (constructed before core_)
    ScratchTracker scratch_;
    TelegramClient telegram_;
    LanBackend transcriber_;
    CorrectorPool corrector_;
    DocumentRenderer renderer_;
    HistoryDb history_db_;
    WorkerPool workers_;

    // Portable business logic
    BotCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int update_event_fd_ = -1;
    int worker_event_fd_ = -1;
    int reap_timer_fd_ = -1;

    std::atomic<bool> running_{false};

    std::mutex inbound_mutex_;
    std::deque<InboundEvent> inbound_;

    std::mutex backoff_mutex_;
    std::condition_variable_any backoff_cv_;
    std::jthread poller_;
};
