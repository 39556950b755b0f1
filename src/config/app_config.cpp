#include "../../include/config/app_config.hpp"

#include <cstdlib>
#include <sstream>

namespace forumbot {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return fallback;
    }
    return value;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

int64_t parseId(const std::string& raw, const std::string& what) {
    const std::string value = trim(raw);
    try {
        size_t used = 0;
        const long long parsed = std::stoll(value, &used);
        if (used != value.size()) {
            throw ConfigError(what + ": not an integer: " + raw);
        }
        return static_cast<int64_t>(parsed);
    } catch (const std::invalid_argument&) {
        throw ConfigError(what + ": not an integer: " + raw);
    } catch (const std::out_of_range&) {
        throw ConfigError(what + ": out of range: " + raw);
    }
}

int positiveEnv(const char* name, int fallback) {
    const std::string raw = envOr(name, "");
    if (raw.empty()) {
        return fallback;
    }
    const int64_t value = parseId(raw, name);
    if (value <= 0 || value > 1024) {
        throw ConfigError(std::string(name) + " must be between 1 and 1024");
    }
    return static_cast<int>(value);
}

} // namespace

std::vector<int64_t> parseIdList(const std::string& raw) {
    std::vector<int64_t> ids;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (trim(item).empty()) continue;
        ids.push_back(parseId(item, "id list"));
    }
    return ids;
}

AppConfig AppConfig::fromEnvironment() {
    AppConfig cfg;
    cfg.bot_token = envOr("BOT_TOKEN", "");
    if (cfg.bot_token.empty()) {
        throw ConfigError("BOT_TOKEN environment variable is required");
    }

    cfg.api_url = envOr("TELEGRAM_API_URL", cfg.api_url);
    cfg.db_path = envOr("DB_PATH", cfg.db_path);
    cfg.log_file = envOr("LOG_FILE", "");
    cfg.log_level = envOr("LOG_LEVEL", cfg.log_level);

    cfg.admin_ids_raw = trim(envOr("ADMIN_IDS", ""));
    cfg.forum_chat_id_raw = trim(envOr("FORUM_CHAT_ID", ""));
    cfg.topic_id_raw = trim(envOr("TOPIC_ID", ""));

    cfg.read_connections = positiveEnv("DB_READ_CONNECTIONS", cfg.read_connections);
    cfg.worker_threads = positiveEnv("BOT_WORKER_THREADS", cfg.worker_threads);
    cfg.poll_timeout_seconds = positiveEnv("POLL_TIMEOUT_SECONDS", cfg.poll_timeout_seconds);

    // Validate early so a typo fails at startup instead of at first use.
    cfg.adminIds();
    cfg.forumChatId();
    cfg.topicId();
    return cfg;
}

std::vector<int64_t> AppConfig::adminIds() const {
    return parseIdList(admin_ids_raw);
}

int64_t AppConfig::forumChatId() const {
    return forum_chat_id_raw.empty() ? 0 : parseId(forum_chat_id_raw, "FORUM_CHAT_ID");
}

int64_t AppConfig::topicId() const {
    return topic_id_raw.empty() ? 0 : parseId(topic_id_raw, "TOPIC_ID");
}

} // namespace forumbot
