#pragma once

#include "messaging/messaging_port.hpp"
#include "scratch/scratch_file.hpp"
#include "whisper/backend.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Idle is the absence of a session. The busy states mark a worker job in
// flight; the Awaiting states are suspension points waiting for the user.
// Declaration order is the only legal order of transitions.
enum class SessionState {
    Transcribing,
    AwaitingCorrectionChoice,
    Correcting,
    AwaitingFormatChoice,
    Delivering,
};

std::string_view state_name(SessionState state);

class Session {
public:
    using Clock = std::chrono::steady_clock;

    Session(ChatId id, Clock::time_point now);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    ChatId id() const { return id_; }
    SessionState state() const { return state_; }
    bool is_awaiting_choice() const;
    Clock::time_point last_activity() const { return last_activity_; }

    // Forward only. Returns false (and changes nothing) for any transition
    // that is not strictly later than the current state.
    bool advance(SessionState next, Clock::time_point now);

    MessageId progress_message() const { return progress_message_; }
    void set_progress_message(MessageId id) { progress_message_ = id; }

    void attach_audio(ScratchFile audio);
    const std::filesystem::path& audio_path() const { return audio_.path(); }
    bool audio_released() const { return !audio_.valid(); }
    // Returns false if the audio was already released.
    bool release_audio();

    // The transcript can be stored once; later calls return false.
    bool set_transcript(const TranscriptResult& result);
    bool has_transcript() const { return raw_text_.has_value(); }
    const std::string& raw_text() const;
    const std::string& language() const { return language_; }
    double audio_duration() const { return audio_duration_; }
    double processing_time() const { return processing_time_; }

    // Final text can be set once; reading it earlier throws std::logic_error.
    bool set_final_text(std::string text, bool corrected);
    bool has_final_text() const { return final_text_.has_value(); }
    const std::string& final_text() const;
    bool corrected() const { return corrected_; }

private:
    ChatId id_;
    SessionState state_ = SessionState::Transcribing;
    Clock::time_point last_activity_;
    MessageId progress_message_ = 0;

    ScratchFile audio_;

    std::optional<std::string> raw_text_;
    std::string language_;
    double audio_duration_ = 0.0;
    double processing_time_ = 0.0;

    std::optional<std::string> final_text_;
    bool corrected_ = false;
};

// At most one session per chat. Erasing a session destroys it, which
// releases any scratch audio it still owns.
class SessionStore {
public:
    // Returns nullptr when the chat already has a session.
    Session* create(ChatId id, Session::Clock::time_point now);
    Session* find(ChatId id);
    const Session* find(ChatId id) const;
    bool erase(ChatId id);
    void clear();

    size_t size() const { return sessions_.size(); }

    // Sessions suspended on a choice for longer than idle.
    std::vector<ChatId> expired(Session::Clock::time_point now,
                                std::chrono::seconds idle) const;

private:
    std::unordered_map<ChatId, std::unique_ptr<Session>> sessions_;
};
