#include <catch2/catch_test_macros.hpp>

#include "scratch/scratch_file.hpp"
#include "session.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace {

struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        path = std::filesystem::temp_directory_path() /
               ("vs_test_session_" + std::to_string(getpid()));
        std::filesystem::create_directories(path);
    }

    ~TmpDir() { std::filesystem::remove_all(path); }
};

TranscriptResult transcript(const std::string& text, const std::string& language = "en") {
    return TranscriptResult{.text = text, .language = language, .duration_s = 3.0, .processing_s = 0.5};
}

} // namespace

TEST_CASE("Session state machine", "[session]") {
    auto t0 = Session::Clock::now();
    Session session(42, t0);

    SECTION("InitialStateTranscribing") {
        REQUIRE(session.id() == 42);
        REQUIRE(session.state() == SessionState::Transcribing);
        REQUIRE_FALSE(session.is_awaiting_choice());
        REQUIRE(session.progress_message() == 0);
        REQUIRE(session.audio_released());
    }

    SECTION("AdvancesForward") {
        REQUIRE(session.advance(SessionState::AwaitingCorrectionChoice, t0));
        REQUIRE(session.is_awaiting_choice());
        REQUIRE(session.advance(SessionState::Correcting, t0));
        REQUIRE_FALSE(session.is_awaiting_choice());
        REQUIRE(session.advance(SessionState::AwaitingFormatChoice, t0));
        REQUIRE(session.is_awaiting_choice());
        REQUIRE(session.advance(SessionState::Delivering, t0));
        REQUIRE(session.state() == SessionState::Delivering);
    }

    SECTION("DeclineSkipsCorrecting") {
        REQUIRE(session.advance(SessionState::AwaitingCorrectionChoice, t0));
        REQUIRE(session.advance(SessionState::AwaitingFormatChoice, t0));
        REQUIRE(session.state() == SessionState::AwaitingFormatChoice);
    }

    SECTION("NeverMovesBackward") {
        REQUIRE(session.advance(SessionState::AwaitingFormatChoice, t0));
        REQUIRE_FALSE(session.advance(SessionState::AwaitingCorrectionChoice, t0));
        REQUIRE_FALSE(session.advance(SessionState::Correcting, t0));
        REQUIRE_FALSE(session.advance(SessionState::AwaitingFormatChoice, t0));
        REQUIRE(session.state() == SessionState::AwaitingFormatChoice);
    }

    SECTION("AdvanceTouchesActivity") {
        auto later = t0 + std::chrono::seconds(30);
        REQUIRE(session.advance(SessionState::AwaitingCorrectionChoice, later));
        REQUIRE(session.last_activity() == later);
    }

    SECTION("TranscriptStoredOnce") {
        REQUIRE_FALSE(session.has_transcript());
        REQUIRE(session.set_transcript(transcript("first", "de")));
        REQUIRE_FALSE(session.set_transcript(transcript("second")));
        REQUIRE(session.raw_text() == "first");
        REQUIRE(session.language() == "de");
        REQUIRE(session.audio_duration() == 3.0);
        REQUIRE(session.processing_time() == 0.5);
    }

    SECTION("RawTextBeforeTranscriptThrows") {
        REQUIRE_THROWS_AS(session.raw_text(), std::logic_error);
    }

    SECTION("FinalTextSetOnce") {
        REQUIRE_THROWS_AS(session.final_text(), std::logic_error);
        REQUIRE(session.set_final_text("corrected text", true));
        REQUIRE_FALSE(session.set_final_text("other", false));
        REQUIRE(session.final_text() == "corrected text");
        REQUIRE(session.corrected());
    }

    SECTION("StateNames") {
        REQUIRE(state_name(SessionState::Transcribing) == "transcribing");
        REQUIRE(state_name(SessionState::AwaitingFormatChoice) == "awaiting_format_choice");
    }
}

TEST_CASE("Session audio ownership", "[session]") {
    TmpDir dir;
    ScratchTracker tracker(dir.path);
    REQUIRE(tracker.init());

    SECTION("ReleaseRemovesFileOnce") {
        Session session(1, Session::Clock::now());
        auto audio = tracker.create(".ogg");
        REQUIRE(audio);
        auto path = audio->path();
        session.attach_audio(std::move(*audio));

        REQUIRE_FALSE(session.audio_released());
        REQUIRE(std::filesystem::exists(path));

        REQUIRE(session.release_audio());
        REQUIRE_FALSE(session.release_audio());
        REQUIRE(session.audio_released());
        REQUIRE_FALSE(std::filesystem::exists(path));
        REQUIRE(tracker.released_count() == 1);
    }

    SECTION("DestroyingSessionReleasesAudio") {
        std::filesystem::path path;
        {
            Session session(1, Session::Clock::now());
            auto audio = tracker.create(".ogg");
            REQUIRE(audio);
            path = audio->path();
            session.attach_audio(std::move(*audio));
        }
        REQUIRE_FALSE(std::filesystem::exists(path));
        REQUIRE(tracker.live_count() == 0);
    }
}

TEST_CASE("SessionStore", "[session]") {
    SessionStore store;
    auto t0 = Session::Clock::now();

    SECTION("OneSessionPerChat") {
        REQUIRE(store.create(1, t0) != nullptr);
        REQUIRE(store.create(1, t0) == nullptr);
        REQUIRE(store.create(2, t0) != nullptr);
        REQUIRE(store.size() == 2);
    }

    SECTION("FindAndErase") {
        auto* s = store.create(5, t0);
        REQUIRE(store.find(5) == s);
        REQUIRE(store.erase(5));
        REQUIRE_FALSE(store.erase(5));
        REQUIRE(store.find(5) == nullptr);
        REQUIRE(store.create(5, t0) != nullptr);
    }

    SECTION("ExpiredOnlyReportsIdleChoices") {
        auto* waiting = store.create(1, t0);
        REQUIRE(waiting->advance(SessionState::AwaitingCorrectionChoice, t0));
        auto* busy = store.create(2, t0);
        REQUIRE(busy->state() == SessionState::Transcribing);
        auto* fresh = store.create(3, t0);
        REQUIRE(fresh->advance(SessionState::AwaitingFormatChoice, t0 + std::chrono::seconds(100)));

        auto ids = store.expired(t0 + std::chrono::seconds(120), std::chrono::seconds(60));
        REQUIRE(ids == std::vector<ChatId>{1});
    }

    SECTION("ClearDropsEverything") {
        store.create(1, t0);
        store.create(2, t0);
        store.clear();
        REQUIRE(store.size() == 0);
    }
}
