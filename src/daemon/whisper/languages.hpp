#pragma once

#include <string>
#include <string_view>

// Whisper servers report the detected language either as an ISO 639-1 code
// ("en") or as the full lowercase name ("english"). Returns the code, or the
// input lowercased when it is not a known name.
std::string normalize_language(std::string_view language);
