#ifndef FORUMBOT_TELEGRAM_CLIENT_HPP
#define FORUMBOT_TELEGRAM_CLIENT_HPP

#include <optional>
#include <string>
#include <vector>

#include "chat_transport.hpp"

namespace forumbot {

// Bot API over HTTPS. One curl easy handle per call, so calls may come from
// several threads at once.
class TelegramClient : public ChatTransport {
public:
    TelegramClient(const std::string& token, const std::string& api_url);
    ~TelegramClient() override;

    TelegramClient(const TelegramClient&) = delete;
    TelegramClient& operator=(const TelegramClient&) = delete;

    std::optional<BotIdentity> getMe();

    UpdateBatch getUpdates(int64_t offset, int timeout_seconds) override;
    SendResult sendMessage(const OutgoingMessage& message) override;
    SendResult sendPhoto(const OutgoingMessage& message, const std::string& photo_id) override;
    SendResult editMessageText(int64_t chat_id, int64_t message_id, const std::string& text,
                               const std::string& entities, const InlineKeyboard& keyboard) override;
    SendResult editMessageCaption(int64_t chat_id, int64_t message_id, const std::string& caption,
                                  const std::string& entities) override;
    SendResult deleteMessage(int64_t chat_id, int64_t message_id) override;
    SendResult answerCallbackQuery(const std::string& callback_id, const std::string& text) override;
    SendResult sendDocument(int64_t chat_id, const std::string& filename, const std::string& content,
                            const std::string& caption) override;

    // Decodes a getUpdates response body. Updates of kinds the bot does not handle are skipped.
    static UpdateBatch parseUpdates(const std::string& body);
    static std::string keyboardJson(const InlineKeyboard& keyboard);

private:
    struct HttpResponse {
        bool transport_ok = false;
        long status = 0;
        std::string body;
        std::string error;
    };

    std::string methodUrl(const std::string& method) const;
    HttpResponse postJson(const std::string& method, const std::string& payload, long timeout_seconds);
    // Interprets {"ok":..., "result": {...}} and pulls result.message_id when present.
    static SendResult toSendResult(const std::string& method, const HttpResponse& response);

    std::string token_;
    std::string api_url_;
};

} // namespace forumbot

#endif // FORUMBOT_TELEGRAM_CLIENT_HPP
