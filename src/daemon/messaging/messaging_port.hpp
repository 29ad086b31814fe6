#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

using ChatId = int64_t;
using MessageId = int64_t;

// One button of an inline choice: what the user sees and the signal that
// comes back when it is pressed.
struct Choice {
    std::string label;
    std::string signal;
};

struct InboundEvent {
    enum class Kind { Message, Choice };

    Kind kind = Kind::Message;
    ChatId chat_id = 0;
    MessageId message_id = 0;

    // Kind::Message
    std::string text;            // text or caption
    std::string audio_ref;       // voice note / audio file id, empty if none
    uint64_t audio_size = 0;     // bytes, 0 if unknown
    double audio_duration = 0.0; // seconds, 0 if unknown

    // Kind::Choice
    std::string callback_id;
    std::string signal;

    bool has_audio() const { return !audio_ref.empty(); }
};

// Outbound side of the chat transport. Implementations must be safe to call
// from worker threads.
class MessagingPort {
public:
    virtual ~MessagingPort() = default;

    virtual std::expected<void, std::string>
        download_file(const std::string& ref, const std::filesystem::path& dest) = 0;

    virtual std::expected<MessageId, std::string>
        send_message(ChatId chat, const std::string& text, const std::vector<Choice>& choices) = 0;

    virtual std::expected<void, std::string>
        edit_message(ChatId chat, MessageId message, const std::string& text,
                     const std::vector<Choice>& choices) = 0;

    virtual std::expected<void, std::string> delete_message(ChatId chat, MessageId message) = 0;

    virtual std::expected<void, std::string>
        send_document(ChatId chat, const std::filesystem::path& file,
                      const std::string& display_name) = 0;

    // Acknowledges a pressed button so the client stops its spinner.
    virtual std::expected<void, std::string> answer_choice(const std::string& callback_id) = 0;
};
