#ifndef FORUMBOT_CHAT_TRANSPORT_HPP
#define FORUMBOT_CHAT_TRANSPORT_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace forumbot {

// Outbound side of the chat API. Implementations report failures in the
// returned SendResult and never throw.
class ChatTransport {
public:
    virtual ~ChatTransport() = default;

    virtual UpdateBatch getUpdates(int64_t offset, int timeout_seconds) = 0;

    virtual SendResult sendMessage(const OutgoingMessage& message) = 0;
    // message.text becomes the caption.
    virtual SendResult sendPhoto(const OutgoingMessage& message, const std::string& photo_id) = 0;
    virtual SendResult editMessageText(int64_t chat_id, int64_t message_id, const std::string& text,
                                       const std::string& entities, const InlineKeyboard& keyboard) = 0;
    virtual SendResult editMessageCaption(int64_t chat_id, int64_t message_id, const std::string& caption,
                                          const std::string& entities) = 0;
    virtual SendResult deleteMessage(int64_t chat_id, int64_t message_id) = 0;
    virtual SendResult answerCallbackQuery(const std::string& callback_id, const std::string& text) = 0;
    virtual SendResult sendDocument(int64_t chat_id, const std::string& filename, const std::string& content,
                                    const std::string& caption) = 0;
};

} // namespace forumbot

#endif // FORUMBOT_CHAT_TRANSPORT_HPP
