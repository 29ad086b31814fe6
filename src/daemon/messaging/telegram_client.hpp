#pragma once

#include "config.hpp"
#include "messaging_port.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

struct TelegramUpdate {
    int64_t update_id = 0;
    std::optional<InboundEvent> event; // empty for update kinds we do not handle
};

// Telegram Bot API over HTTPS. Every call uses its own curl handle.
class TelegramClient : public MessagingPort {
public:
    explicit TelegramClient(Config::Telegram config);

    // Long poll. Returns early with an error if stop is requested.
    std::expected<std::vector<TelegramUpdate>, std::string>
        get_updates(int64_t offset, std::stop_token stop);

    std::expected<void, std::string>
        download_file(const std::string& ref, const std::filesystem::path& dest) override;

    std::expected<MessageId, std::string>
        send_message(ChatId chat, const std::string& text, const std::vector<Choice>& choices) override;

    std::expected<void, std::string>
        edit_message(ChatId chat, MessageId message, const std::string& text,
                     const std::vector<Choice>& choices) override;

    std::expected<void, std::string> delete_message(ChatId chat, MessageId message) override;

    std::expected<void, std::string>
        send_document(ChatId chat, const std::filesystem::path& file,
                      const std::string& display_name) override;

    std::expected<void, std::string> answer_choice(const std::string& callback_id) override;

private:
    std::string method_url(const std::string& method) const;
    std::expected<nlohmann::json, std::string>
        call(const std::string& method, const nlohmann::json& payload);

    Config::Telegram config_;
};

// Unwraps {"ok": ..., "result": ...} envelopes.
std::expected<nlohmann::json, std::string> parse_api_response(const std::string& body);

std::optional<InboundEvent> parse_update_event(const nlohmann::json& update);

// Two buttons per row.
nlohmann::json build_keyboard(const std::vector<Choice>& choices);
