#ifndef FORUMBOT_RECORDS_HPP
#define FORUMBOT_RECORDS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace forumbot {

struct PostType {
    int64_t id = 0;
    std::string name;
    std::string emoji;
    std::string photo_id;
    std::string template_text;
    // JSON array of Bot API MessageEntity objects, "" when plain text.
    std::string template_entities;
    bool is_active = true;
    std::string created_at;

    std::string buttonLabel() const { return emoji.empty() ? name : emoji + " " + name; }
};

struct PublishedPost {
    int64_t id = 0;
    int64_t post_type_id = 0;
    int64_t chat_id = 0;
    int64_t topic_id = 0;
    int64_t message_id = 0;
    std::string text;
    std::string photo_id;
    std::string entities;
    std::string user_photo_id;
    int64_t user_photo_message_id = 0;
    std::string created_at;
};

struct Reply {
    int64_t id = 0;
    int64_t chat_id = 0;
    int64_t reply_to_message_id = 0;
    int64_t message_id = 0;
    std::string text;
    std::string photo_id;
    std::string entities;
    std::string created_at;
};

struct AdminConfig {
    std::vector<int64_t> admin_ids;
    int64_t forum_chat_id = 0;
    int64_t topic_id = 0;
};

} // namespace forumbot

#endif // FORUMBOT_RECORDS_HPP
