#pragma once

#include <expected>
#include <filesystem>
#include <string>

struct TranscriptResult {
    std::string text;      // trimmed; empty when no speech was detected
    std::string language;  // detected (or forced) language code
    double duration_s = 0.0;
    double processing_s = 0.0;
};

class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;
    virtual std::expected<TranscriptResult, std::string>
        transcribe(const std::filesystem::path& audio) = 0;
};
