#include "lan_backend.hpp"

#include "http/curl_utils.hpp"
#include "languages.hpp"
#include "text_utils.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

LanBackend::LanBackend(Config::Transcriber config) : config_(std::move(config)) {}

std::expected<TranscriptResult, std::string>
LanBackend::transcribe(const std::filesystem::path& audio) {
    std::error_code ec;
    auto size = std::filesystem::file_size(audio, ec);
    if (ec) {
        return std::unexpected("cannot read audio: " + ec.message());
    }
    if (size == 0) {
        return std::unexpected("empty audio");
    }

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_filedata(part, audio.c_str());

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "verbose_json", CURL_ZERO_TERMINATED);

    std::string beam_size = std::to_string(config_.beam_size);

    if (config_.api_format == "openai") {
        endpoint = config_.url + "/v1/audio/transcriptions";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, "whisper-1", CURL_ZERO_TERMINATED);

        if (!config_.language.empty()) {
            part = curl_mime_addpart(mime);
            curl_mime_name(part, "language");
            curl_mime_data(part, config_.language.c_str(), CURL_ZERO_TERMINATED);
        }
    } else {
        // whisper.cpp server format
        endpoint = config_.url + "/inference";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "temperature");
        curl_mime_data(part, "0.0", CURL_ZERO_TERMINATED);

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "beam_size");
        curl_mime_data(part, beam_size.c_str(), CURL_ZERO_TERMINATED);

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, config_.language.empty() ? "auto" : config_.language.c_str(),
                       CURL_ZERO_TERMINATED);
    }

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);

    auto resp = http::perform(curl, static_cast<long>(config_.timeout));

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();

    if (!resp) {
        return std::unexpected(resp.error());
    }
    if (!http::is_success(resp->status)) {
        return std::unexpected("transcription server returned HTTP " +
                               std::to_string(resp->status) + ": " + resp->body);
    }

    auto result = parse_transcription_response(resp->body);
    if (!result) return result;

    result->processing_s = std::chrono::duration<double>(end - start).count();
    if (result->language.empty()) {
        result->language = normalize_language(config_.language);
    }
    return result;
}

std::expected<TranscriptResult, std::string>
parse_transcription_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        TranscriptResult tr;

        if (j.contains("error")) {
            auto& err = j["error"];
            std::string msg = err.is_object() ? err.value("message", err.dump())
                            : err.is_string() ? err.get<std::string>() : err.dump();
            return std::unexpected("server error: " + msg);
        }

        if (j.contains("segments") && j["segments"].is_array() && !j["segments"].empty()) {
            std::string joined;
            for (auto& seg : j["segments"]) {
                auto piece = text::trim(seg.value("text", ""));
                if (piece.empty()) continue;
                if (!joined.empty()) joined += ' ';
                joined += piece;
            }
            tr.text = std::move(joined);
        } else if (j.contains("text")) {
            tr.text = text::trim(j["text"].get<std::string>());
        } else {
            return std::unexpected("unexpected response: " + body);
        }

        // whisper.cpp reports "detected_language" when auto-detecting and the
        // full name under "language"; OpenAI only the latter.
        if (j.contains("detected_language") && j["detected_language"].is_string()) {
            tr.language = normalize_language(j["detected_language"].get<std::string>());
        } else if (j.contains("language") && j["language"].is_string()) {
            tr.language = normalize_language(j["language"].get<std::string>());
        }

        if (j.contains("duration") && j["duration"].is_number()) {
            tr.duration_s = j["duration"].get<double>();
        }

        return tr;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
