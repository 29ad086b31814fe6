#include "telegram_client.hpp"

#include "http/curl_utils.hpp"

#include <cstdio>
#include <curl/curl.h>

using json = nlohmann::json;

namespace {

int abort_on_stop(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(clientp);
    return stop->stop_requested() ? 1 : 0;
}

} // namespace

TelegramClient::TelegramClient(Config::Telegram config) : config_(std::move(config)) {}

std::string TelegramClient::method_url(const std::string& method) const {
    return config_.api_url + "/bot" + config_.token + "/" + method;
}

std::expected<json, std::string>
TelegramClient::call(const std::string& method, const json& payload) {
    auto resp = http::post_json(method_url(method), payload.dump(),
                                static_cast<long>(config_.request_timeout));
    if (!resp) {
        return std::unexpected(resp.error());
    }
    return parse_api_response(resp->body);
}

std::expected<std::vector<TelegramUpdate>, std::string>
TelegramClient::get_updates(int64_t offset, std::stop_token stop) {
    json payload = {
        {"offset", offset},
        {"timeout", config_.poll_timeout},
        {"allowed_updates", json::array({"message", "callback_query"})},
    };
    std::string body = payload.dump();
    std::string url = method_url("getUpdates");

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_on_stop);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);

    auto resp = http::perform(curl, static_cast<long>(config_.poll_timeout + 10));

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (!resp) {
        return std::unexpected(resp.error());
    }

    auto result = parse_api_response(resp->body);
    if (!result) {
        return std::unexpected(result.error());
    }

    std::vector<TelegramUpdate> updates;
    try {
        for (auto& u : *result) {
            updates.push_back(TelegramUpdate{
                .update_id = u.at("update_id").get<int64_t>(),
                .event = parse_update_event(u),
            });
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("malformed update: ") + e.what());
    }
    return updates;
}

std::expected<void, std::string>
TelegramClient::download_file(const std::string& ref, const std::filesystem::path& dest) {
    auto info = call("getFile", {{"file_id", ref}});
    if (!info) {
        return std::unexpected(info.error());
    }

    std::string file_path = info->value("file_path", "");
    if (file_path.empty()) {
        return std::unexpected("file is not available for download");
    }

    std::FILE* out = std::fopen(dest.c_str(), "wb");
    if (!out) {
        return std::unexpected("cannot open " + dest.string() + " for writing");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(out);
        return std::unexpected("curl_easy_init failed");
    }

    std::string url = config_.api_url + "/file/bot" + config_.token + "/" + file_path;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, out);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.request_timeout));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE,
                     static_cast<curl_off_t>(config_.max_download_bytes));

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    bool closed = std::fclose(out) == 0;

    if (res != CURLE_OK) {
        return std::unexpected(std::string("download failed: ") + curl_easy_strerror(res));
    }
    if (!http::is_success(status)) {
        return std::unexpected("download failed: HTTP " + std::to_string(status));
    }
    if (!closed) {
        return std::unexpected("download failed: cannot flush " + dest.string());
    }
    return {};
}

std::expected<MessageId, std::string>
TelegramClient::send_message(ChatId chat, const std::string& text,
                             const std::vector<Choice>& choices) {
    json payload = {{"chat_id", chat}, {"text", text}};
    if (!choices.empty()) payload["reply_markup"] = build_keyboard(choices);

    auto result = call("sendMessage", payload);
    if (!result) {
        return std::unexpected(result.error());
    }
    return result->value("message_id", MessageId{0});
}

std::expected<void, std::string>
TelegramClient::edit_message(ChatId chat, MessageId message, const std::string& text,
                             const std::vector<Choice>& choices) {
    json payload = {{"chat_id", chat}, {"message_id", message}, {"text", text}};
    if (!choices.empty()) payload["reply_markup"] = build_keyboard(choices);

    auto result = call("editMessageText", payload);
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

std::expected<void, std::string> TelegramClient::delete_message(ChatId chat, MessageId message) {
    auto result = call("deleteMessage", {{"chat_id", chat}, {"message_id", message}});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

std::expected<void, std::string>
TelegramClient::send_document(ChatId chat, const std::filesystem::path& file,
                              const std::string& display_name) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string chat_str = std::to_string(chat);
    std::string url = method_url("sendDocument");

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "chat_id");
    curl_mime_data(part, chat_str.c_str(), CURL_ZERO_TERMINATED);

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "document");
    curl_mime_filedata(part, file.c_str());
    curl_mime_filename(part, display_name.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);

    auto resp = http::perform(curl, static_cast<long>(config_.request_timeout));

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (!resp) {
        return std::unexpected(resp.error());
    }
    auto result = parse_api_response(resp->body);
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

std::expected<void, std::string> TelegramClient::answer_choice(const std::string& callback_id) {
    auto result = call("answerCallbackQuery", {{"callback_query_id", callback_id}});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

std::expected<json, std::string> parse_api_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.value("ok", false)) {
            return j.contains("result") ? j["result"] : json(nullptr);
        }
        return std::unexpected("telegram: " + j.value("description", std::string("request failed")));
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::optional<InboundEvent> parse_update_event(const json& update) {
    if (update.contains("message") && update["message"].is_object()) {
        auto& m = update["message"];
        if (!m.contains("chat")) return std::nullopt;

        InboundEvent ev;
        ev.kind = InboundEvent::Kind::Message;
        ev.chat_id = m["chat"].value("id", ChatId{0});
        ev.message_id = m.value("message_id", MessageId{0});
        ev.text = m.contains("text") ? m.value("text", "") : m.value("caption", "");

        for (const char* key : {"voice", "audio"}) {
            if (m.contains(key) && m[key].is_object()) {
                auto& a = m[key];
                ev.audio_ref = a.value("file_id", "");
                ev.audio_size = a.value("file_size", uint64_t{0});
                ev.audio_duration = a.value("duration", 0.0);
                break;
            }
        }
        return ev;
    }

    if (update.contains("callback_query") && update["callback_query"].is_object()) {
        auto& q = update["callback_query"];
        if (!q.contains("message") || !q["message"].contains("chat")) return std::nullopt;

        InboundEvent ev;
        ev.kind = InboundEvent::Kind::Choice;
        ev.chat_id = q["message"]["chat"].value("id", ChatId{0});
        ev.message_id = q["message"].value("message_id", MessageId{0});
        ev.callback_id = q.value("id", "");
        ev.signal = q.value("data", "");
        return ev;
    }

    return std::nullopt;
}

json build_keyboard(const std::vector<Choice>& choices) {
    json rows = json::array();
    for (size_t i = 0; i < choices.size(); i += 2) {
        json row = json::array();
        for (size_t k = i; k < choices.size() && k < i + 2; ++k) {
            row.push_back({{"text", choices[k].label}, {"callback_data", choices[k].signal}});
        }
        rows.push_back(std::move(row));
    }
    return {{"inline_keyboard", rows}};
}
