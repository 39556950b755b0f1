#ifndef FORUMBOT_APP_CONFIG_HPP
#define FORUMBOT_APP_CONFIG_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace forumbot {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct AppConfig {
    std::string bot_token;
    std::string api_url = "https://api.telegram.org";
    std::string db_path = "admin.db";
    std::string log_file;
    std::string log_level = "info";

    // Raw ADMIN_IDS / FORUM_CHAT_ID / TOPIC_ID values; empty when unset.
    std::string admin_ids_raw;
    std::string forum_chat_id_raw;
    std::string topic_id_raw;

    int read_connections = 4;
    int worker_threads = 4;
    int poll_timeout_seconds = 30;

    // Throws ConfigError when BOT_TOKEN is missing or a numeric variable is malformed.
    static AppConfig fromEnvironment();

    std::vector<int64_t> adminIds() const;
    int64_t forumChatId() const;
    int64_t topicId() const;
};

// Splits "1, 2,3" into ids. Empty items are skipped; a non-numeric item throws ConfigError.
std::vector<int64_t> parseIdList(const std::string& raw);

} // namespace forumbot

#endif // FORUMBOT_APP_CONFIG_HPP
