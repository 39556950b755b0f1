// admin_config key/value access

#include "../../include/database/db_manager.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace forumbot {

namespace {

const char* kAdminIdsKey = "admin_ids";
const char* kForumChatKey = "forum_chat_id";
const char* kTopicKey = "topic_id";

std::optional<int64_t> toId(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

std::vector<int64_t> splitStoredIds(const std::string& raw) {
    std::vector<int64_t> ids;
    std::stringstream ss(raw);
    std::string part;
    while (std::getline(ss, part, ',')) {
        const auto first = part.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        const auto last = part.find_last_not_of(" \t");
        part = part.substr(first, last - first + 1);
        if (auto id = toId(part)) {
            ids.push_back(*id);
        } else {
            Logger::getInstance().warning("admin_ids contains a non-numeric entry, skipped: '" + part + "'");
        }
    }
    return ids;
}

int64_t storedInt(const std::optional<std::string>& raw, const char* key) {
    if (!raw || raw->empty()) {
        return 0;
    }
    if (auto value = toId(*raw)) {
        return *value;
    }
    Logger::getInstance().warning(std::string("admin_config.") + key + " is not a number: '" + *raw + "'");
    return 0;
}

std::optional<std::string> readValue(DatabaseConnection& conn, const std::string& key) {
    QueryResult res = conn.execute("SELECT value FROM admin_config WHERE key = ?", {SqlValue(key)});
    if (res.empty()) {
        return std::nullopt;
    }
    return res.getText(0, 0);
}

void writeValue(DatabaseConnection& conn, const std::string& key, const std::string& value) {
    conn.execute("INSERT OR REPLACE INTO admin_config (key, value) VALUES (?, ?)",
                 {SqlValue(key), SqlValue(value)});
}

} // namespace

std::optional<std::string> DatabaseManager::getConfigValue(const std::string& key) {
    return queue().read([&key](DatabaseConnection& conn) { return readValue(conn, key); });
}

bool DatabaseManager::setConfigValue(const std::string& key, const std::string& value) {
    return runWrite("setConfigValue", [key, value](DatabaseConnection& conn) {
        writeValue(conn, key, value);
    });
}

bool DatabaseManager::setConfigValues(const std::vector<std::pair<std::string, std::string>>& values) {
    return runWrite("setConfigValues", [values](DatabaseConnection& conn) {
        for (const auto& kv : values) {
            writeValue(conn, kv.first, kv.second);
        }
    });
}

// One read transaction, so the three keys come from the same committed save.
AdminConfig DatabaseManager::getAdminConfig() {
    return queue().readSnapshot([](DatabaseConnection& conn) {
        AdminConfig config;
        if (auto ids = readValue(conn, kAdminIdsKey)) {
            config.admin_ids = splitStoredIds(*ids);
        }
        config.forum_chat_id = storedInt(readValue(conn, kForumChatKey), kForumChatKey);
        config.topic_id = storedInt(readValue(conn, kTopicKey), kTopicKey);
        return config;
    });
}

bool DatabaseManager::saveAdminConfig(const AdminConfig& config) {
    return runWrite("saveAdminConfig", [config](DatabaseConnection& conn) {
        writeValue(conn, kAdminIdsKey, joinIds(config.admin_ids));
        writeValue(conn, kForumChatKey, std::to_string(config.forum_chat_id));
        writeValue(conn, kTopicKey, std::to_string(config.topic_id));
    });
}

bool DatabaseManager::addAdminId(int64_t admin_id) {
    return runWrite("addAdminId", [admin_id](DatabaseConnection& conn) {
        std::vector<int64_t> ids;
        if (auto raw = readValue(conn, kAdminIdsKey)) {
            ids = splitStoredIds(*raw);
        }
        if (std::find(ids.begin(), ids.end(), admin_id) != ids.end()) {
            return;
        }
        ids.push_back(admin_id);
        writeValue(conn, kAdminIdsKey, joinIds(ids));
    });
}

bool DatabaseManager::removeAdminId(int64_t admin_id) {
    return runWrite("removeAdminId", [admin_id](DatabaseConnection& conn) {
        auto raw = readValue(conn, kAdminIdsKey);
        if (!raw) {
            return;
        }
        std::vector<int64_t> ids = splitStoredIds(*raw);
        ids.erase(std::remove(ids.begin(), ids.end(), admin_id), ids.end());
        writeValue(conn, kAdminIdsKey, joinIds(ids));
    });
}

} // namespace forumbot
