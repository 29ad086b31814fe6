#include "bot_core.hpp"

#include "text_utils.hpp"
#include "utf8.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <print>

namespace {

const std::vector<Choice> kCorrectionChoices = {
    {"✅ Yes", "corr_yes"},
    {"❌ No", "corr_no"},
};

const std::vector<Choice> kFormatChoices = {
    {"📩 Message", "fmt_msg"},
    {"📄 TXT", "fmt_txt"},
    {"📝 DOCX", "fmt_docx"},
    {"📄 PDF", "fmt_pdf"},
};

constexpr const char* kGreeting =
    "Hi! Send me a voice message or an audio file and I will transcribe it.\n\n"
    "/cancel - abandon the current transcript\n"
    "/history - your recent transcripts";

constexpr const char* kSendAudio = "Please send a voice message or an audio file.";

constexpr int kHistoryLimit = 5;
constexpr size_t kHistoryPreviewChars = 200;

} // namespace

BotCore::BotCore(Config config, bool verbose,
                 MessagingPort& port, TranscriptionBackend& transcriber,
                 CorrectorPool& corrector, DocumentRenderer& renderer,
                 ScratchTracker& scratch, HistoryDb* history,
                 TaskRunner runner, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      port_(port), transcriber_(transcriber),
      corrector_(corrector), renderer_(renderer),
      scratch_(scratch), history_(history),
      runner_(std::move(runner)), notify_(std::move(notify)) {}

BotCore::~BotCore() = default;

void BotCore::handle_event(const InboundEvent& ev) {
    if (ev.kind == InboundEvent::Kind::Choice) {
        on_choice(ev);
    } else {
        on_message(ev);
    }
}

void BotCore::on_message(const InboundEvent& ev) {
    auto text = text::trim(ev.text);
    if (!ev.has_audio() && text.starts_with('/')) {
        // "/cmd@botname args"
        on_command(ev, text.substr(0, text.find_first_of(" @")));
        return;
    }

    auto* session = sessions_.find(ev.chat_id);
    if (ev.has_audio()) {
        if (session) {
            notify(ev.chat_id,
                   "⏳ I'm still working on your previous audio. "
                   "Finish it first or send /cancel.");
            return;
        }
        start_session(ev);
        return;
    }

    if (session) {
        notify(ev.chat_id, "Please use the buttons above, or send /cancel to start over.");
        return;
    }
    notify(ev.chat_id, kSendAudio);
}

void BotCore::on_command(const InboundEvent& ev, const std::string& command) {
    if (command == "/start" || command == "/help") {
        notify(ev.chat_id, kGreeting);
    } else if (command == "/cancel") {
        auto* session = sessions_.find(ev.chat_id);
        if (!session) {
            notify(ev.chat_id, "Nothing to cancel.");
        } else if (!session->is_awaiting_choice()) {
            notify(ev.chat_id, "⏳ Still working on it, please wait a moment.");
        } else {
            update_progress(*session, "🚫 Cancelled.");
            finish(ev.chat_id, "cancelled by user");
        }
    } else if (command == "/history") {
        send_history(ev.chat_id);
    } else {
        notify(ev.chat_id, kSendAudio);
    }
}

void BotCore::on_choice(const InboundEvent& ev) {
    // Cosmetic: only stops the button spinner on the client.
    if (auto ack = port_.answer_choice(ev.callback_id); !ack) {
        log("Choice acknowledgement failed: " + ack.error());
    }

    auto* session = sessions_.find(ev.chat_id);
    if (!session) {
        log(std::format("Choice '{}' from chat {} without a session, ignored", ev.signal, ev.chat_id));
        return;
    }
    if (ev.message_id != 0 && ev.message_id != session->progress_message()) {
        log(std::format("Choice '{}' from a stale message, ignored", ev.signal));
        return;
    }

    switch (session->state()) {
        case SessionState::AwaitingCorrectionChoice:
            if (ev.signal == "corr_yes") {
                on_correction_choice(*session, true);
            } else if (ev.signal == "corr_no") {
                on_correction_choice(*session, false);
            } else {
                log(std::format("Signal '{}' ignored while awaiting correction choice", ev.signal));
            }
            break;
        case SessionState::AwaitingFormatChoice:
            if (auto format = format_from_signal(ev.signal)) {
                on_format_choice(*session, *format);
            } else {
                log(std::format("Signal '{}' ignored while awaiting format choice", ev.signal));
            }
            break;
        default:
            log(std::format("Signal '{}' ignored while {}", ev.signal, state_name(session->state())));
            break;
    }
}

void BotCore::start_session(const InboundEvent& ev) {
    ChatId chat = ev.chat_id;
    uint64_t limit = config_.telegram.max_download_bytes;
    if (limit > 0 && ev.audio_size > limit) {
        notify(chat, std::format("❌ This audio file is too large (limit {} MB).", limit / (1024 * 1024)));
        return;
    }

    auto* session = sessions_.create(chat, Clock::now());
    if (!session) {
        return;
    }

    auto progress = port_.send_message(chat, "📥 Receiving audio...", {});
    if (!progress) {
        std::println(stderr, "bot: cannot reach chat {}: {}", chat, progress.error());
        finish(chat, "progress message failed");
        return;
    }
    session->set_progress_message(*progress);

    auto audio = scratch_.create(".ogg");
    if (!audio) {
        update_progress(*session, "⚠️ Error: " + audio.error());
        finish(chat, "no scratch file");
        return;
    }
    auto path = audio->path();
    session->attach_audio(std::move(*audio));

    log(std::format("Session {} started, downloading audio", chat));

    run_async(chat, [this, chat, ref = ev.audio_ref, path] {
        auto result = port_.download_file(ref, path);
        post([this, chat, result = std::move(result)]() mutable {
            on_downloaded(chat, std::move(result));
        });
    });
}

void BotCore::on_downloaded(ChatId chat, std::expected<void, std::string> result) {
    auto* session = sessions_.find(chat);
    if (!session) return;

    if (!result) {
        update_progress(*session, "⚠️ Error: " + result.error());
        finish(chat, "download failed: " + result.error());
        return;
    }

    update_progress(*session, "🔄 Recognizing speech...");

    run_async(chat, [this, chat, path = session->audio_path()] {
        auto transcript = transcriber_.transcribe(path);
        post([this, chat, transcript = std::move(transcript)]() mutable {
            on_transcribed(chat, std::move(transcript));
        });
    });
}

void BotCore::on_transcribed(ChatId chat, std::expected<TranscriptResult, std::string> result) {
    auto* session = sessions_.find(chat);
    if (!session) return;

    if (!result) {
        update_progress(*session, "⚠️ Error: " + result.error());
        finish(chat, "transcription failed: " + result.error());
        return;
    }

    if (text::is_blank(result->text)) {
        update_progress(*session, "❌ Could not recognize speech.");
        finish(chat, "no speech detected");
        return;
    }

    session->set_transcript(*result);
    session->advance(SessionState::AwaitingCorrectionChoice, Clock::now());
    log(std::format("Transcription complete: {:.1f}s processing, {} chars, language '{}'",
                    result->processing_s, result->text.size(), result->language));

    std::string language = session->language().empty() ? "?" : text::to_upper(session->language());
    if (!update_progress(*session,
                         std::format("Transcript ready! Language: {}\n\nShould I correct errors?", language),
                         kCorrectionChoices)) {
        finish(chat, "cannot present correction choice");
    }
}

void BotCore::on_correction_choice(Session& session, bool accept) {
    ChatId chat = session.id();

    if (!accept) {
        session.set_final_text(session.raw_text(), false);
        present_format_choice(session);
        return;
    }

    session.advance(SessionState::Correcting, Clock::now());
    update_progress(session, "✏️ Correcting errors...");

    run_async(chat, [this, chat, text = session.raw_text(), language = session.language()] {
        auto corrected = corrector_.correct(text, language);
        post([this, chat, corrected = std::move(corrected)]() mutable {
            on_corrected(chat, std::move(corrected));
        });
    });
}

void BotCore::on_corrected(ChatId chat, std::expected<std::string, std::string> result) {
    auto* session = sessions_.find(chat);
    if (!session) return;

    if (result && text::is_blank(*result)) {
        result = std::unexpected("LanguageTool returned a blank text");
    }

    if (result) {
        session->set_final_text(std::move(*result), true);
    } else {
        // Correction is optional; carry on with the transcript as recognized.
        std::println(stderr, "correction: {} (chat {}, language '{}')",
                     result.error(), chat, session->language());
        session->set_final_text(session->raw_text(), false);
    }
    present_format_choice(*session);
}

void BotCore::present_format_choice(Session& session) {
    session.advance(SessionState::AwaitingFormatChoice, Clock::now());
    if (!update_progress(session, "Which format should I send the transcript in?", kFormatChoices)) {
        finish(session.id(), "cannot present format choice");
    }
}

void BotCore::on_format_choice(Session& session, OutputFormat format) {
    ChatId chat = session.id();
    session.advance(SessionState::Delivering, Clock::now());

    // Cosmetic: a progress message that will not go away does not block delivery.
    if (auto deleted = port_.delete_message(chat, session.progress_message()); !deleted) {
        log("Progress message not deleted: " + deleted.error());
    }
    session.set_progress_message(0);

    run_async(chat, [this, chat, format, text = session.final_text(),
                     timestamp = format_timestamp(std::chrono::system_clock::now())] {
        auto delivered = deliver(chat, text, format, timestamp);
        post([this, chat, format, delivered = std::move(delivered)]() mutable {
            on_delivered(chat, format, std::move(delivered));
        });
    });
}

std::expected<void, std::string> BotCore::deliver(ChatId chat, const std::string& text,
                                                  OutputFormat format,
                                                  const std::string& timestamp) {
    if (format == OutputFormat::Inline) {
        for (auto& part : split_for_messages(text)) {
            auto sent = port_.send_message(chat, part, {});
            if (!sent) {
                return std::unexpected("❌ Could not send the transcript: " + sent.error());
            }
        }
        return {};
    }

    auto doc = renderer_.render(text, format, timestamp);
    if (!doc) {
        return std::unexpected("❌ Error while creating the file: " + doc.error());
    }

    auto sent = port_.send_document(chat, doc->file.path(), doc->display_name);
    doc->file.release();
    if (!sent) {
        return std::unexpected("❌ Could not send the file: " + sent.error());
    }
    return {};
}

void BotCore::on_delivered(ChatId chat, OutputFormat format, std::expected<void, std::string> result) {
    auto* session = sessions_.find(chat);
    if (!session) return;

    if (!result) {
        notify(chat, result.error());
        finish(chat, "delivery failed");
        return;
    }

    if (history_ && history_->is_open()) {
        bool saved = history_->insert(HistoryEntry{
            .chat_id = chat,
            .language = session->language(),
            .corrected = session->corrected(),
            .format = std::string(format_name(format)),
            .text = session->final_text(),
            .audio_duration = session->audio_duration(),
            .processing_time = session->processing_time(),
        });
        if (!saved) std::println(stderr, "bot: transcript for chat {} not saved to history", chat);
    }
    finish(chat, std::format("delivered as {}", format_name(format)));
}

void BotCore::on_job_failed(ChatId chat, const std::string& error) {
    std::println(stderr, "bot: job for chat {} failed: {}", chat, error);
    auto* session = sessions_.find(chat);
    if (!session) return;

    update_progress(*session, "⚠️ Error: " + error);
    finish(chat, "job failed");
}

bool BotCore::update_progress(Session& session, const std::string& text,
                              const std::vector<Choice>& choices) {
    if (session.progress_message() != 0) {
        auto edited = port_.edit_message(session.id(), session.progress_message(), text, choices);
        if (edited) return true;
        log("Progress edit failed, sending a new message: " + edited.error());
    }

    auto sent = port_.send_message(session.id(), text, choices);
    if (!sent) {
        std::println(stderr, "bot: cannot reach chat {}: {}", session.id(), sent.error());
        return false;
    }
    session.set_progress_message(*sent);
    return true;
}

void BotCore::notify(ChatId chat, const std::string& text) {
    if (auto sent = port_.send_message(chat, text, {}); !sent) {
        std::println(stderr, "bot: cannot reach chat {}: {}", chat, sent.error());
    }
}

void BotCore::finish(ChatId chat, const std::string& reason) {
    if (auto* session = sessions_.find(chat)) {
        session->release_audio();
    }
    sessions_.erase(chat);
    log(std::format("Session {} ended: {}", chat, reason));
}

void BotCore::run_async(ChatId chat, std::function<void()> job) {
    runner_([this, chat, job = std::move(job)] {
        try {
            job();
        } catch (const std::exception& e) {
            std::string error = e.what();
            post([this, chat, error] { on_job_failed(chat, error); });
        }
    });
}

void BotCore::post(std::function<void()> completion) {
    {
        std::lock_guard lock(completions_mutex_);
        completions_.push_back(std::move(completion));
    }
    if (notify_) notify_();
}

void BotCore::process_completions() {
    while (true) {
        std::vector<std::function<void()>> batch;
        {
            std::lock_guard lock(completions_mutex_);
            batch.swap(completions_);
        }
        if (batch.empty()) break;
        for (auto& completion : batch) {
            completion();
        }
    }
}

size_t BotCore::reap_idle(Clock::time_point now) {
    if (config_.session.idle_timeout == 0) return 0;

    auto ids = sessions_.expired(now, std::chrono::seconds(config_.session.idle_timeout));
    for (ChatId id : ids) {
        if (auto* session = sessions_.find(id)) {
            update_progress(*session, "⌛ Session expired. Send the audio again to start over.");
        }
        finish(id, "idle timeout");
    }
    return ids.size();
}

void BotCore::shutdown() {
    {
        std::lock_guard lock(completions_mutex_);
        completions_.clear();
    }
    if (sessions_.size() > 0) {
        log(std::format("Shutting down, discarding {} open session(s)", sessions_.size()));
    }
    sessions_.clear();
}

void BotCore::send_history(ChatId chat) {
    if (!history_ || !history_->is_open()) {
        notify(chat, "History is disabled.");
        return;
    }

    auto entries = history_->recent(chat, kHistoryLimit);
    if (entries.empty()) {
        notify(chat, "No transcripts yet.");
        return;
    }

    std::string msg = "🕘 Recent transcripts:";
    for (auto& e : entries) {
        std::string when = e.timestamp.substr(0, 16);
        std::replace(when.begin(), when.end(), 'T', ' ');

        auto pieces = utf8::split(e.text, kHistoryPreviewChars);
        std::string preview = pieces.empty() ? "" : pieces.front();
        if (pieces.size() > 1) preview += "…";

        msg += std::format("\n\n{} · {} · {}{}\n{}", when,
                           e.language.empty() ? "?" : text::to_upper(e.language),
                           e.format, e.corrected ? " · corrected" : "", preview);
    }
    notify(chat, msg);
}

void BotCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voicescribe] {}", msg);
    }
}
