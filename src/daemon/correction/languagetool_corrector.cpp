#include "languagetool_corrector.hpp"

#include "http/curl_utils.hpp"
#include "utf8.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

LanguageToolCorrector::LanguageToolCorrector(Config::Correction config)
    : config_(std::move(config)), remote_language_("auto") {}

void LanguageToolCorrector::set_language(const std::string& language) {
    language_ = language;
    auto it = config_.languages.find(language);
    remote_language_ = it != config_.languages.end() ? it->second : language;
    if (remote_language_.empty()) remote_language_ = "auto";
}

std::expected<std::string, std::string>
LanguageToolCorrector::correct(const std::string& text) {
    if (text.empty()) return text;

    auto resp = http::post_form(config_.url + "/v2/check",
                                {{"text", text}, {"language", remote_language_}},
                                static_cast<long>(config_.timeout));
    if (!resp) {
        return std::unexpected(resp.error());
    }
    if (!http::is_success(resp->status)) {
        return std::unexpected("LanguageTool returned HTTP " + std::to_string(resp->status) +
                               ": " + resp->body);
    }

    auto matches = parse_check_response(resp->body);
    if (!matches) {
        return std::unexpected(matches.error());
    }
    return apply_matches(text, std::move(*matches));
}

std::expected<std::vector<CorrectionMatch>, std::string>
parse_check_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.contains("matches") || !j["matches"].is_array()) {
            return std::unexpected("unexpected response: " + body);
        }

        std::vector<CorrectionMatch> matches;
        for (auto& m : j["matches"]) {
            if (!m.contains("replacements") || !m["replacements"].is_array() ||
                m["replacements"].empty()) {
                continue;
            }
            matches.push_back(CorrectionMatch{
                .offset = m.at("offset").get<size_t>(),
                .length = m.at("length").get<size_t>(),
                .replacement = m["replacements"][0].value("value", ""),
            });
        }
        return matches;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::string apply_matches(const std::string& text, std::vector<CorrectionMatch> matches) {
    auto offsets = utf8::utf16_to_byte_offsets(text);
    size_t units = offsets.size() - 1;

    std::ranges::sort(matches, {}, &CorrectionMatch::offset);

    std::string out;
    out.reserve(text.size());
    size_t cursor = 0; // UTF-16 units consumed so far
    for (auto& m : matches) {
        if (m.offset < cursor || m.offset > units || m.length > units - m.offset) continue;
        out.append(text, offsets[cursor], offsets[m.offset] - offsets[cursor]);
        out += m.replacement;
        cursor = m.offset + m.length;
    }
    out.append(text, offsets[cursor], std::string::npos);
    return out;
}
