#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <string>

// Talks to a whisper.cpp server (/inference) or an OpenAI-compatible
// transcription endpoint (/v1/audio/transcriptions) on the network.
class LanBackend : public TranscriptionBackend {
public:
    explicit LanBackend(Config::Transcriber config);

    std::expected<TranscriptResult, std::string>
        transcribe(const std::filesystem::path& audio) override;

private:
    Config::Transcriber config_;
};

// Parses a verbose_json (or plain json) transcription response. Segment texts
// are joined with single spaces; the result is trimmed.
std::expected<TranscriptResult, std::string>
    parse_transcription_response(const std::string& body);
