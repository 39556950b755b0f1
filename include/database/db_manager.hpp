#ifndef FORUMBOT_DB_MANAGER_HPP
#define FORUMBOT_DB_MANAGER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "db_connection.hpp"
#include "write_queue.hpp"
#include "../models/records.hpp"
#include "../utils/logger.hpp"

namespace forumbot {

// Owns the connections and the write queue, and holds the record accessors.
//
// Mutations go through the queue and return false when the job failed (the
// error is logged). Lookups read directly, return std::nullopt when the row
// does not exist and let DatabaseError propagate.
class DatabaseManager {
public:
    DatabaseManager(const std::string& db_path, int read_connections);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // Opens the writer and reader connections, starts the queue and applies the schema.
    bool initialize();
    // Drains and closes the queue. Safe to call twice.
    void shutdown();

    WriteQueue& queue();
    const std::string& path() const { return db_path_; }

    // Post types
    bool createPostType(PostType& post_type);
    std::optional<PostType> getPostType(int64_t id);
    std::vector<PostType> getAllPostTypes();
    std::vector<PostType> getActivePostTypes();
    bool updatePostType(const PostType& post_type);
    bool setPostTypeActive(int64_t id, bool active);
    bool deletePostType(int64_t id);

    // Published posts
    bool createPublishedPost(PublishedPost& post);
    std::optional<PublishedPost> getPublishedPost(int64_t id);
    std::optional<PublishedPost> getPublishedPostByMessage(int64_t chat_id, int64_t message_id);
    std::vector<PublishedPost> getPublishedPosts(int64_t limit, int64_t offset);
    int64_t countPublishedPosts();
    bool updatePublishedPost(const PublishedPost& post);
    bool deletePublishedPost(int64_t id);

    // Replies
    bool createReply(Reply& reply);
    std::optional<Reply> getReply(int64_t id);
    std::vector<Reply> getAllReplies();
    bool deleteReply(int64_t id);

    // Admin config (key/value)
    std::optional<std::string> getConfigValue(const std::string& key);
    bool setConfigValue(const std::string& key, const std::string& value);
    // Writes every pair inside one queue job.
    bool setConfigValues(const std::vector<std::pair<std::string, std::string>>& values);
    AdminConfig getAdminConfig();
    bool saveAdminConfig(const AdminConfig& config);
    // Read-modify-write of admin_ids inside one queue job.
    bool addAdminId(int64_t admin_id);
    bool removeAdminId(int64_t admin_id);

private:
    std::string db_path_;
    int read_connections_;
    std::unique_ptr<WriteQueue> queue_;

    static PostType postTypeFromRow(const QueryResult& res, size_t row);
    static PublishedPost publishedPostFromRow(const QueryResult& res, size_t row);
    static Reply replyFromRow(const QueryResult& res, size_t row);

    template <typename Job>
    bool runWrite(const char* what, Job&& job);
};

std::string joinIds(const std::vector<int64_t>& ids);

template <typename Job>
bool DatabaseManager::runWrite(const char* what, Job&& job) {
    try {
        queue().execute(std::forward<Job>(job));
        return true;
    } catch (const QueueClosedError& e) {
        Logger::getInstance().error(std::string(what) + " rejected: " + e.what());
    } catch (const DatabaseError& e) {
        Logger::getInstance().error(std::string(what) + " failed: " + e.what());
    }
    return false;
}

} // namespace forumbot

#endif // FORUMBOT_DB_MANAGER_HPP
