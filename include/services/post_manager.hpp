#ifndef FORUMBOT_POST_MANAGER_HPP
#define FORUMBOT_POST_MANAGER_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "../models/records.hpp"

namespace forumbot {

class DatabaseManager;
class AdminDirectory;
struct ForumTarget;

struct PostLink {
    // 0 for a public t.me/<username>/<id> link.
    int64_t chat_id = 0;
    int64_t message_id = 0;
    // Forum topic; 0 for the General topic or a link without one.
    int64_t thread_id = 0;
};

class PostManager {
public:
    PostManager(DatabaseManager& db, AdminDirectory& admins);

    // Accepts t.me/c/<chat>/<topic>/<msg>, t.me/c/<chat>/<msg> and
    // t.me/<username>/<msg> (telegram.me too). Private chat ids become -100<chat>.
    static std::optional<PostLink> parsePostLink(const std::string& link);

    // std::nullopt when the link is malformed or the post was not published by this bot.
    std::optional<PublishedPost> findPostByLink(const std::string& link);

    std::optional<PublishedPost> getPost(int64_t post_id);
    std::optional<PublishedPost> recordPublishedPost(int64_t post_type_id, const ForumTarget& target,
                                                     int64_t message_id, const std::string& text,
                                                     const std::string& photo_id, const std::string& entities);
    bool updatePostText(int64_t post_id, const std::string& text, const std::string& entities);
    bool deletePost(int64_t post_id);

    std::optional<Reply> recordReply(int64_t chat_id, int64_t reply_to_message_id, int64_t message_id,
                                     const std::string& text, const std::string& photo_id,
                                     const std::string& entities);

private:
    DatabaseManager& db_;
    AdminDirectory& admins_;
};

} // namespace forumbot

#endif // FORUMBOT_POST_MANAGER_HPP
