#pragma once

#include "config.hpp"
#include "correction/corrector_pool.hpp"
#include "messaging/messaging_port.hpp"
#include "render/document_renderer.hpp"
#include "scratch/scratch_file.hpp"
#include "session.hpp"
#include "storage/history_db.hpp"
#include "whisper/backend.hpp"

#include <expected>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// The audio-to-document workflow. Owns every session; all public methods run
// on the event-loop thread. Slow steps (download, transcription, correction,
// render + delivery) are handed to the task runner and report back through
// post(), after which the loop calls process_completions().
class BotCore {
public:
    using TaskRunner = std::function<void(std::function<void()>)>;
    using NotifyCallback = std::function<void()>;
    using Clock = Session::Clock;

    BotCore(Config config, bool verbose,
            MessagingPort& port, TranscriptionBackend& transcriber,
            CorrectorPool& corrector, DocumentRenderer& renderer,
            ScratchTracker& scratch, HistoryDb* history,
            TaskRunner runner, NotifyCallback notify);
    ~BotCore();

    BotCore(const BotCore&) = delete;
    BotCore& operator=(const BotCore&) = delete;

    void handle_event(const InboundEvent& ev);

    // Runs completions posted by worker jobs, including any they trigger.
    void process_completions();

    // Ends sessions left waiting on a choice for longer than the idle
    // timeout. Returns how many were ended.
    size_t reap_idle(Clock::time_point now);

    // Ends every session and drops pending completions. Workers must already
    // be drained.
    void shutdown();

    size_t session_count() const { return sessions_.size(); }
    const Session* session(ChatId id) const { return sessions_.find(id); }

private:
    void on_message(const InboundEvent& ev);
    void on_command(const InboundEvent& ev, const std::string& command);
    void on_choice(const InboundEvent& ev);

    void start_session(const InboundEvent& ev);
    void on_downloaded(ChatId chat, std::expected<void, std::string> result);
    void on_transcribed(ChatId chat, std::expected<TranscriptResult, std::string> result);

    void on_correction_choice(Session& session, bool accept);
    void on_corrected(ChatId chat, std::expected<std::string, std::string> result);
    void present_format_choice(Session& session);

    void on_format_choice(Session& session, OutputFormat format);
    std::expected<void, std::string> deliver(ChatId chat, const std::string& text,
                                             OutputFormat format, const std::string& timestamp);
    void on_delivered(ChatId chat, OutputFormat format, std::expected<void, std::string> result);

    void on_job_failed(ChatId chat, const std::string& error);

    // Edits the progress message, or posts a new one if editing fails.
    bool update_progress(Session& session, const std::string& text,
                         const std::vector<Choice>& choices = {});
    void notify(ChatId chat, const std::string& text);

    // Terminal path: destroying the session releases its scratch audio.
    void finish(ChatId chat, const std::string& reason);

    void run_async(ChatId chat, std::function<void()> job);
    void post(std::function<void()> completion);

    void send_history(ChatId chat);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    MessagingPort& port_;
    TranscriptionBackend& transcriber_;
    CorrectorPool& corrector_;
    DocumentRenderer& renderer_;
    ScratchTracker& scratch_;
    HistoryDb* history_;

    TaskRunner runner_;
    NotifyCallback notify_;

    SessionStore sessions_;

    std::mutex completions_mutex_;
    std::vector<std::function<void()>> completions_;
};
