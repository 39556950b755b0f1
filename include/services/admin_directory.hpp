#ifndef FORUMBOT_ADMIN_DIRECTORY_HPP
#define FORUMBOT_ADMIN_DIRECTORY_HPP

#include <cstdint>
#include <vector>

namespace forumbot {

class DatabaseManager;
struct AppConfig;

struct ForumTarget {
    int64_t chat_id = 0;
    int64_t topic_id = 0;

    bool isConfigured() const { return chat_id != 0; }
};

// Who may use the bot and where posts go. Backed by admin_config.
class AdminDirectory {
public:
    explicit AdminDirectory(DatabaseManager& db);

    // Fails closed: a storage error while reading denies access.
    bool isAdmin(int64_t user_id);

    std::vector<int64_t> admins();
    // No-op when already present.
    bool addAdmin(int64_t user_id);
    bool removeAdmin(int64_t user_id);
    bool setAdmins(const std::vector<int64_t>& ids);

    ForumTarget forumTarget();
    bool setForumTarget(int64_t chat_id, int64_t topic_id);
    bool setForumChat(int64_t chat_id);
    bool setTopic(int64_t topic_id);

    // Applies ADMIN_IDS / FORUM_CHAT_ID / TOPIC_ID. Values present in the
    // environment overwrite the stored ones; absent ones leave them alone.
    bool seedFromConfig(const AppConfig& config);

private:
    DatabaseManager& db_;
};

} // namespace forumbot

#endif // FORUMBOT_ADMIN_DIRECTORY_HPP
