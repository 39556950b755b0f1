#include "../../include/telegram/telegram_client.hpp"
#include "../../include/telegram/entities.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"

#include <curl/curl.h>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <sstream>

namespace forumbot {

namespace {

namespace pt = boost::property_tree;

const long kRequestTimeoutSeconds = 30;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<char*>(contents), total);
    return total;
}

// Builds a flat JSON object field by field.
class Payload {
public:
    Payload& add(const std::string& key, int64_t value) {
        field(key) << value;
        return *this;
    }
    Payload& addString(const std::string& key, const std::string& value) {
        field(key) << JsonParser::quote(value);
        return *this;
    }
    // `json` is inserted verbatim; skipped when empty.
    Payload& addRaw(const std::string& key, const std::string& json) {
        if (!json.empty()) {
            field(key) << json;
        }
        return *this;
    }
    std::string str() const { return "{" + body_.str() + "}"; }

private:
    std::ostringstream& field(const std::string& key) {
        if (!first_) body_ << ",";
        first_ = false;
        body_ << JsonParser::quote(key) << ":";
        return body_;
    }

    std::ostringstream body_;
    bool first_ = true;
};

bool parseTree(const std::string& body, pt::ptree& root, std::string& error) {
    std::istringstream ss(body);
    try {
        pt::read_json(ss, root);
    } catch (const pt::json_parser_error& e) {
        error = std::string("invalid JSON response: ") + e.what();
        return false;
    }
    return true;
}

Message messageFromTree(const pt::ptree& node) {
    Message msg;
    msg.message_id = node.get<int64_t>("message_id", 0);
    msg.chat_id = node.get<int64_t>("chat.id", 0);
    msg.from_id = node.get<int64_t>("from.id", 0);
    msg.thread_id = node.get<int64_t>("message_thread_id", 0);
    msg.text = node.get<std::string>("text", "");
    msg.caption = node.get<std::string>("caption", "");

    if (auto photos = node.get_child_optional("photo")) {
        // Sizes come smallest first.
        for (const auto& size : *photos) {
            msg.photo_id = size.second.get<std::string>("file_id", msg.photo_id);
        }
    }

    auto entities = node.get_child_optional("entities");
    if (!entities) {
        entities = node.get_child_optional("caption_entities");
    }
    if (entities) {
        msg.entities = serializeEntities(entitiesFromTree(*entities));
    }
    return msg;
}

} // namespace

TelegramClient::TelegramClient(const std::string& token, const std::string& api_url)
    : token_(token), api_url_(api_url) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    while (!api_url_.empty() && api_url_.back() == '/') {
        api_url_.pop_back();
    }
}

TelegramClient::~TelegramClient() {
    curl_global_cleanup();
}

std::string TelegramClient::methodUrl(const std::string& method) const {
    return api_url_ + "/bot" + token_ + "/" + method;
}

TelegramClient::HttpResponse TelegramClient::postJson(const std::string& method, const std::string& payload,
                                                      long timeout_seconds) {
    HttpResponse out;
    CURL* curl = curl_easy_init();
    if (!curl) {
        out.error = "curl_easy_init failed";
        return out;
    }

    const std::string url = methodUrl(method);
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        out.error = curl_easy_strerror(res);
        return out;
    }
    out.transport_ok = true;
    return out;
}

SendResult TelegramClient::toSendResult(const std::string& method, const HttpResponse& response) {
    if (!response.transport_ok) {
        Logger::getInstance().warning("Telegram " + method + " failed: " + response.error);
        return SendResult::failure(response.error);
    }

    pt::ptree root;
    std::string error;
    if (!parseTree(response.body, root, error)) {
        Logger::getInstance().warning("Telegram " + method + " failed: HTTP " + std::to_string(response.status) +
                                      ", " + error);
        return SendResult::failure(error);
    }

    if (!root.get<bool>("ok", false)) {
        std::string description = root.get<std::string>("description", "HTTP " + std::to_string(response.status));
        Logger::getInstance().warning("Telegram " + method + " failed: " + description);
        return SendResult::failure(description);
    }
    return SendResult::success(root.get<int64_t>("result.message_id", 0));
}

std::optional<BotIdentity> TelegramClient::getMe() {
    HttpResponse response = postJson("getMe", "{}", kRequestTimeoutSeconds);
    if (!response.transport_ok) {
        Logger::getInstance().warning("Telegram getMe failed: " + response.error);
        return std::nullopt;
    }
    pt::ptree root;
    std::string error;
    if (!parseTree(response.body, root, error) || !root.get<bool>("ok", false)) {
        Logger::getInstance().warning("Telegram getMe failed: HTTP " + std::to_string(response.status));
        return std::nullopt;
    }
    BotIdentity me;
    me.id = root.get<int64_t>("result.id", 0);
    me.username = root.get<std::string>("result.username", "");
    return me;
}

UpdateBatch TelegramClient::parseUpdates(const std::string& body) {
    UpdateBatch batch;
    pt::ptree root;
    if (!parseTree(body, root, batch.error)) {
        return batch;
    }
    if (!root.get<bool>("ok", false)) {
        batch.error = root.get<std::string>("description", "getUpdates returned ok=false");
        return batch;
    }
    batch.ok = true;

    auto result = root.get_child_optional("result");
    if (!result) {
        return batch;
    }
    for (const auto& item : *result) {
        const auto& node = item.second;
        Update update;
        update.update_id = node.get<int64_t>("update_id", 0);
        if (auto msg = node.get_child_optional("message")) {
            update.message = messageFromTree(*msg);
        } else if (auto cb = node.get_child_optional("callback_query")) {
            CallbackQuery query;
            query.id = cb->get<std::string>("id", "");
            query.from_id = cb->get<int64_t>("from.id", 0);
            query.data = cb->get<std::string>("data", "");
            query.chat_id = cb->get<int64_t>("message.chat.id", 0);
            query.message_id = cb->get<int64_t>("message.message_id", 0);
            update.callback = query;
        }
        batch.updates.push_back(update);
    }
    return batch;
}

std::string TelegramClient::keyboardJson(const InlineKeyboard& keyboard) {
    if (keyboard.empty()) {
        return "";
    }
    std::ostringstream out;
    out << "{\"inline_keyboard\":[";
    for (size_t r = 0; r < keyboard.size(); r++) {
        if (r > 0) out << ",";
        out << "[";
        for (size_t c = 0; c < keyboard[r].size(); c++) {
            if (c > 0) out << ",";
            out << "{\"text\":" << JsonParser::quote(keyboard[r][c].text)
                << ",\"callback_data\":" << JsonParser::quote(keyboard[r][c].callback_data) << "}";
        }
        out << "]";
    }
    out << "]}";
    return out.str();
}

UpdateBatch TelegramClient::getUpdates(int64_t offset, int timeout_seconds) {
    Payload payload;
    payload.add("offset", offset)
        .add("timeout", timeout_seconds)
        .addRaw("allowed_updates", "[\"message\",\"callback_query\"]");

    HttpResponse response = postJson("getUpdates", payload.str(), timeout_seconds + 10);
    if (!response.transport_ok) {
        UpdateBatch batch;
        batch.error = response.error;
        return batch;
    }
    return parseUpdates(response.body);
}

SendResult TelegramClient::sendMessage(const OutgoingMessage& message) {
    Payload payload;
    payload.add("chat_id", message.chat_id);
    if (message.thread_id != 0) {
        payload.add("message_thread_id", message.thread_id);
    }
    if (message.reply_to_message_id != 0) {
        payload.addRaw("reply_parameters", "{\"message_id\":" + std::to_string(message.reply_to_message_id) + "}");
    }
    payload.addString("text", message.text)
        .addRaw("entities", message.entities)
        .addRaw("reply_markup", keyboardJson(message.keyboard));
    return toSendResult("sendMessage", postJson("sendMessage", payload.str(), kRequestTimeoutSeconds));
}

SendResult TelegramClient::sendPhoto(const OutgoingMessage& message, const std::string& photo_id) {
    Payload payload;
    payload.add("chat_id", message.chat_id);
    if (message.thread_id != 0) {
        payload.add("message_thread_id", message.thread_id);
    }
    if (message.reply_to_message_id != 0) {
        payload.addRaw("reply_parameters", "{\"message_id\":" + std::to_string(message.reply_to_message_id) + "}");
    }
    payload.addString("photo", photo_id);
    if (!message.text.empty()) {
        payload.addString("caption", message.text);
    }
    payload.addRaw("caption_entities", message.entities)
        .addRaw("reply_markup", keyboardJson(message.keyboard));
    return toSendResult("sendPhoto", postJson("sendPhoto", payload.str(), kRequestTimeoutSeconds));
}

SendResult TelegramClient::editMessageText(int64_t chat_id, int64_t message_id, const std::string& text,
                                           const std::string& entities, const InlineKeyboard& keyboard) {
    Payload payload;
    payload.add("chat_id", chat_id)
        .add("message_id", message_id)
        .addString("text", text)
        .addRaw("entities", entities)
        .addRaw("reply_markup", keyboardJson(keyboard));
    return toSendResult("editMessageText", postJson("editMessageText", payload.str(), kRequestTimeoutSeconds));
}

SendResult TelegramClient::editMessageCaption(int64_t chat_id, int64_t message_id, const std::string& caption,
                                              const std::string& entities) {
    Payload payload;
    payload.add("chat_id", chat_id)
        .add("message_id", message_id)
        .addString("caption", caption)
        .addRaw("caption_entities", entities);
    return toSendResult("editMessageCaption", postJson("editMessageCaption", payload.str(), kRequestTimeoutSeconds));
}

SendResult TelegramClient::deleteMessage(int64_t chat_id, int64_t message_id) {
    Payload payload;
    payload.add("chat_id", chat_id).add("message_id", message_id);
    return toSendResult("deleteMessage", postJson("deleteMessage", payload.str(), kRequestTimeoutSeconds));
}

SendResult TelegramClient::answerCallbackQuery(const std::string& callback_id, const std::string& text) {
    Payload payload;
    payload.addString("callback_query_id", callback_id);
    if (!text.empty()) {
        payload.addString("text", text);
    }
    return toSendResult("answerCallbackQuery", postJson("answerCallbackQuery", payload.str(), kRequestTimeoutSeconds));
}

SendResult TelegramClient::sendDocument(int64_t chat_id, const std::string& filename, const std::string& content,
                                        const std::string& caption) {
    HttpResponse response;
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return toSendResult("sendDocument", response);
    }

    const std::string url = methodUrl("sendDocument");
    const std::string chat = std::to_string(chat_id);

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "chat_id");
    curl_mime_data(part, chat.c_str(), CURL_ZERO_TERMINATED);

    if (!caption.empty()) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "caption");
        curl_mime_data(part, caption.c_str(), CURL_ZERO_TERMINATED);
    }

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "document");
    curl_mime_data(part, content.data(), content.size());
    curl_mime_filename(part, filename.c_str());
    curl_mime_type(part, "text/plain");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, kRequestTimeoutSeconds * 2);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
    } else {
        response.transport_ok = true;
    }
    return toSendResult("sendDocument", response);
}

} // namespace forumbot
