#pragma once

#include "config.hpp"
#include "corrector.hpp"

#include <string>
#include <vector>

// One rule match from LanguageTool. Offsets count UTF-16 code units.
struct CorrectionMatch {
    size_t offset = 0;
    size_t length = 0;
    std::string replacement;
};

// Client for a LanguageTool server's /v2/check endpoint.
class LanguageToolCorrector : public Corrector {
public:
    explicit LanguageToolCorrector(Config::Correction config);

    void set_language(const std::string& language) override;
    const std::string& language() const override { return language_; }

    std::expected<std::string, std::string> correct(const std::string& text) override;

private:
    Config::Correction config_;
    std::string language_;
    std::string remote_language_;
};

// Parses the "matches" array of a /v2/check response. Matches without a
// suggested replacement are dropped.
std::expected<std::vector<CorrectionMatch>, std::string>
    parse_check_response(const std::string& body);

// Applies the first suggestion of every match. Overlapping and out-of-range
// matches are skipped.
std::string apply_matches(const std::string& text, std::vector<CorrectionMatch> matches);
