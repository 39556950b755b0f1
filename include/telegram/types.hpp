#ifndef FORUMBOT_TELEGRAM_TYPES_HPP
#define FORUMBOT_TELEGRAM_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace forumbot {

struct MessageEntity {
    std::string type;
    int64_t offset = 0;
    int64_t length = 0;
    std::string url;
    std::string language;
    std::string custom_emoji_id;
    int64_t user_id = 0;

    bool operator==(const MessageEntity& other) const {
        return type == other.type && offset == other.offset && length == other.length &&
               url == other.url && language == other.language &&
               custom_emoji_id == other.custom_emoji_id && user_id == other.user_id;
    }
};

struct Message {
    int64_t message_id = 0;
    int64_t chat_id = 0;
    int64_t from_id = 0;
    int64_t thread_id = 0;
    std::string text;
    std::string caption;
    // file_id of the largest size when the message carries a photo.
    std::string photo_id;
    // JSON array of the text (or caption) entities, "" when none.
    std::string entities;

    bool hasPhoto() const { return !photo_id.empty(); }
    // Text for plain messages, caption for media.
    const std::string& body() const { return text.empty() ? caption : text; }
    bool isCommand() const { return !text.empty() && text[0] == '/'; }
};

struct CallbackQuery {
    std::string id;
    int64_t from_id = 0;
    std::string data;
    // Chat and message the pressed button belongs to; 0 when Telegram omitted them.
    int64_t chat_id = 0;
    int64_t message_id = 0;
};

struct Update {
    int64_t update_id = 0;
    std::optional<Message> message;
    std::optional<CallbackQuery> callback;

    int64_t senderId() const {
        if (message) return message->from_id;
        if (callback) return callback->from_id;
        return 0;
    }
};

struct InlineButton {
    std::string text;
    std::string callback_data;
};

using InlineKeyboard = std::vector<std::vector<InlineButton>>;

struct OutgoingMessage {
    int64_t chat_id = 0;
    int64_t thread_id = 0;
    int64_t reply_to_message_id = 0;
    std::string text;
    std::string entities;
    InlineKeyboard keyboard;
};

struct SendResult {
    bool ok = false;
    int64_t message_id = 0;
    std::string error;

    static SendResult success(int64_t message_id = 0) {
        SendResult r;
        r.ok = true;
        r.message_id = message_id;
        return r;
    }

    static SendResult failure(const std::string& error) {
        SendResult r;
        r.error = error;
        return r;
    }
};

struct UpdateBatch {
    bool ok = false;
    std::vector<Update> updates;
    std::string error;
};

struct BotIdentity {
    int64_t id = 0;
    std::string username;
};

} // namespace forumbot

#endif // FORUMBOT_TELEGRAM_TYPES_HPP
