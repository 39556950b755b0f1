#include "../../include/services/admin_directory.hpp"
#include "../../include/config/app_config.hpp"
#include "../../include/database/db_manager.hpp"
#include "../../include/utils/logger.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace forumbot {

AdminDirectory::AdminDirectory(DatabaseManager& db) : db_(db) {
}

bool AdminDirectory::isAdmin(int64_t user_id) {
    try {
        const AdminConfig config = db_.getAdminConfig();
        return std::find(config.admin_ids.begin(), config.admin_ids.end(), user_id) != config.admin_ids.end();
    } catch (const std::exception& e) {
        Logger::getInstance().error("Admin check for " + std::to_string(user_id) +
                                    " failed, denying: " + e.what());
        return false;
    }
}

std::vector<int64_t> AdminDirectory::admins() {
    return db_.getAdminConfig().admin_ids;
}

bool AdminDirectory::addAdmin(int64_t user_id) {
    return db_.addAdminId(user_id);
}

bool AdminDirectory::removeAdmin(int64_t user_id) {
    return db_.removeAdminId(user_id);
}

bool AdminDirectory::setAdmins(const std::vector<int64_t>& ids) {
    return db_.setConfigValue("admin_ids", joinIds(ids));
}

ForumTarget AdminDirectory::forumTarget() {
    const AdminConfig config = db_.getAdminConfig();
    ForumTarget target;
    target.chat_id = config.forum_chat_id;
    target.topic_id = config.topic_id;
    return target;
}

bool AdminDirectory::setForumTarget(int64_t chat_id, int64_t topic_id) {
    return db_.setConfigValues({{"forum_chat_id", std::to_string(chat_id)},
                                {"topic_id", std::to_string(topic_id)}});
}

bool AdminDirectory::setForumChat(int64_t chat_id) {
    return db_.setConfigValue("forum_chat_id", std::to_string(chat_id));
}

bool AdminDirectory::setTopic(int64_t topic_id) {
    return db_.setConfigValue("topic_id", std::to_string(topic_id));
}

bool AdminDirectory::seedFromConfig(const AppConfig& config) {
    std::vector<std::pair<std::string, std::string>> values;

    const std::vector<int64_t> ids = config.adminIds();
    if (!ids.empty()) {
        values.emplace_back("admin_ids", joinIds(ids));
    }
    if (!config.forum_chat_id_raw.empty()) {
        values.emplace_back("forum_chat_id", std::to_string(config.forumChatId()));
    }
    if (!config.topic_id_raw.empty()) {
        values.emplace_back("topic_id", std::to_string(config.topicId()));
    }

    if (values.empty()) {
        return true;
    }
    if (!db_.setConfigValues(values)) {
        Logger::getInstance().warning("Failed to save admin config from environment");
        return false;
    }
    Logger::getInstance().info("Admin config applied from environment (" + std::to_string(values.size()) + " keys)");
    return true;
}

} // namespace forumbot
