#include "session.hpp"

#include <stdexcept>

std::string_view state_name(SessionState state) {
    switch (state) {
        case SessionState::Transcribing: return "transcribing";
        case SessionState::AwaitingCorrectionChoice: return "awaiting_correction_choice";
        case SessionState::Correcting: return "correcting";
        case SessionState::AwaitingFormatChoice: return "awaiting_format_choice";
        case SessionState::Delivering: return "delivering";
    }
    return "unknown";
}

Session::Session(ChatId id, Clock::time_point now) : id_(id), last_activity_(now) {}

bool Session::is_awaiting_choice() const {
    return state_ == SessionState::AwaitingCorrectionChoice ||
           state_ == SessionState::AwaitingFormatChoice;
}

bool Session::advance(SessionState next, Clock::time_point now) {
    if (static_cast<int>(next) <= static_cast<int>(state_)) {
        return false;
    }
    state_ = next;
    last_activity_ = now;
    return true;
}

void Session::attach_audio(ScratchFile audio) {
    audio_ = std::move(audio);
}

bool Session::release_audio() {
    return audio_.release();
}

bool Session::set_transcript(const TranscriptResult& result) {
    if (raw_text_) return false;
    raw_text_ = result.text;
    language_ = result.language;
    audio_duration_ = result.duration_s;
    processing_time_ = result.processing_s;
    return true;
}

const std::string& Session::raw_text() const {
    if (!raw_text_) throw std::logic_error("session: transcript read before it was set");
    return *raw_text_;
}

bool Session::set_final_text(std::string text, bool corrected) {
    if (final_text_) return false;
    final_text_ = std::move(text);
    corrected_ = corrected;
    return true;
}

const std::string& Session::final_text() const {
    if (!final_text_) throw std::logic_error("session: final text read before it was set");
    return *final_text_;
}

Session* SessionStore::create(ChatId id, Session::Clock::time_point now) {
    auto [it, inserted] = sessions_.try_emplace(id);
    if (!inserted) return nullptr;
    it->second = std::make_unique<Session>(id, now);
    return it->second.get();
}

Session* SessionStore::find(ChatId id) {
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second.get() : nullptr;
}

const Session* SessionStore::find(ChatId id) const {
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second.get() : nullptr;
}

bool SessionStore::erase(ChatId id) {
    return sessions_.erase(id) > 0;
}

void SessionStore::clear() {
    sessions_.clear();
}

std::vector<ChatId> SessionStore::expired(Session::Clock::time_point now,
                                          std::chrono::seconds idle) const {
    std::vector<ChatId> ids;
    for (auto& [id, session] : sessions_) {
        if (session->is_awaiting_choice() && now - session->last_activity() >= idle) {
            ids.push_back(id);
        }
    }
    return ids;
}
