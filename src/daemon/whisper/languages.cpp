#include "languages.hpp"

#include "text_utils.hpp"

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 62> kNames = {{
    {"afrikaans", "af"},  {"arabic", "ar"},     {"armenian", "hy"},   {"azerbaijani", "az"},
    {"belarusian", "be"}, {"bosnian", "bs"},    {"bulgarian", "bg"},  {"catalan", "ca"},
    {"chinese", "zh"},    {"croatian", "hr"},   {"czech", "cs"},      {"danish", "da"},
    {"dutch", "nl"},      {"english", "en"},    {"estonian", "et"},   {"finnish", "fi"},
    {"french", "fr"},     {"galician", "gl"},   {"german", "de"},     {"greek", "el"},
    {"hebrew", "he"},     {"hindi", "hi"},      {"hungarian", "hu"},  {"icelandic", "is"},
    {"indonesian", "id"}, {"italian", "it"},    {"japanese", "ja"},   {"kannada", "kn"},
    {"kazakh", "kk"},     {"korean", "ko"},     {"latvian", "lv"},    {"lithuanian", "lt"},
    {"macedonian", "mk"}, {"malay", "ms"},      {"marathi", "mr"},    {"maori", "mi"},
    {"nepali", "ne"},     {"norwegian", "no"},  {"persian", "fa"},    {"polish", "pl"},
    {"portuguese", "pt"}, {"romanian", "ro"},   {"russian", "ru"},    {"serbian", "sr"},
    {"slovak", "sk"},     {"slovenian", "sl"},  {"spanish", "es"},    {"swahili", "sw"},
    {"swedish", "sv"},    {"tagalog", "tl"},    {"tamil", "ta"},      {"thai", "th"},
    {"turkish", "tr"},    {"ukrainian", "uk"},  {"urdu", "ur"},       {"vietnamese", "vi"},
    {"welsh", "cy"},      {"breton", "br"},     {"irish", "ga"},      {"khmer", "km"},
    {"esperanto", "eo"},  {"basque", "eu"},
}};

} // namespace

std::string normalize_language(std::string_view language) {
    auto lower = text::to_lower(text::trim(language));
    for (auto& [name, code] : kNames) {
        if (lower == name) return std::string(code);
    }
    return lower;
}
