// Published posts and replies

#include "../../include/database/db_manager.hpp"

namespace forumbot {

namespace {

const char* kPostColumns =
    "SELECT id, post_type_id, chat_id, topic_id, message_id, text, COALESCE(photo_id, ''), "
    "COALESCE(entities, ''), COALESCE(user_photo_id, ''), COALESCE(user_photo_message_id, 0), "
    "COALESCE(created_at, '') FROM published_posts";

const char* kReplyColumns =
    "SELECT id, chat_id, reply_to_message_id, message_id, text, COALESCE(photo_id, ''), "
    "COALESCE(entities, ''), COALESCE(created_at, '') FROM replies";

} // namespace

PublishedPost DatabaseManager::publishedPostFromRow(const QueryResult& res, size_t row) {
    PublishedPost p;
    p.id = res.getInt(row, 0);
    p.post_type_id = res.getInt(row, 1);
    p.chat_id = res.getInt(row, 2);
    p.topic_id = res.getInt(row, 3);
    p.message_id = res.getInt(row, 4);
    p.text = res.getText(row, 5);
    p.photo_id = res.getText(row, 6);
    p.entities = res.getText(row, 7);
    p.user_photo_id = res.getText(row, 8);
    p.user_photo_message_id = res.getInt(row, 9);
    p.created_at = res.getText(row, 10);
    return p;
}

Reply DatabaseManager::replyFromRow(const QueryResult& res, size_t row) {
    Reply r;
    r.id = res.getInt(row, 0);
    r.chat_id = res.getInt(row, 1);
    r.reply_to_message_id = res.getInt(row, 2);
    r.message_id = res.getInt(row, 3);
    r.text = res.getText(row, 4);
    r.photo_id = res.getText(row, 5);
    r.entities = res.getText(row, 6);
    r.created_at = res.getText(row, 7);
    return r;
}

bool DatabaseManager::createPublishedPost(PublishedPost& post) {
    int64_t new_id = 0;
    const bool ok = runWrite("createPublishedPost", [&post, &new_id](DatabaseConnection& conn) {
        QueryResult res = conn.execute(
            "INSERT INTO published_posts (post_type_id, chat_id, topic_id, message_id, text, photo_id, "
            "entities, user_photo_id, user_photo_message_id) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
            {SqlValue(post.post_type_id), SqlValue(post.chat_id), SqlValue(post.topic_id),
             SqlValue(post.message_id), SqlValue(post.text), SqlValue(post.photo_id),
             SqlValue(post.entities), SqlValue(post.user_photo_id), SqlValue(post.user_photo_message_id)});
        new_id = res.last_insert_id;
    });
    if (ok) {
        post.id = new_id;
    }
    return ok;
}

std::optional<PublishedPost> DatabaseManager::getPublishedPost(int64_t id) {
    QueryResult res = queue().read([id](DatabaseConnection& conn) {
        return conn.execute(std::string(kPostColumns) + " WHERE id = ?", {SqlValue(id)});
    });
    if (res.empty()) {
        return std::nullopt;
    }
    return publishedPostFromRow(res, 0);
}

std::optional<PublishedPost> DatabaseManager::getPublishedPostByMessage(int64_t chat_id, int64_t message_id) {
    QueryResult res = queue().read([chat_id, message_id](DatabaseConnection& conn) {
        return conn.execute(std::string(kPostColumns) + " WHERE chat_id = ? AND message_id = ?",
                            {SqlValue(chat_id), SqlValue(message_id)});
    });
    if (res.empty()) {
        return std::nullopt;
    }
    return publishedPostFromRow(res, 0);
}

std::vector<PublishedPost> DatabaseManager::getPublishedPosts(int64_t limit, int64_t offset) {
    QueryResult res = queue().read([limit, offset](DatabaseConnection& conn) {
        return conn.execute(std::string(kPostColumns) + " ORDER BY created_at DESC, id DESC LIMIT ? OFFSET ?",
                            {SqlValue(limit), SqlValue(offset)});
    });
    std::vector<PublishedPost> out;
    out.reserve(res.size());
    for (size_t i = 0; i < res.size(); i++) {
        out.push_back(publishedPostFromRow(res, i));
    }
    return out;
}

int64_t DatabaseManager::countPublishedPosts() {
    QueryResult res = queue().read([](DatabaseConnection& conn) {
        return conn.execute("SELECT COUNT(*) FROM published_posts");
    });
    return res.empty() ? 0 : res.getInt(0, 0);
}

bool DatabaseManager::updatePublishedPost(const PublishedPost& post) {
    return runWrite("updatePublishedPost", [post](DatabaseConnection& conn) {
        conn.execute(
            "UPDATE published_posts SET post_type_id = ?, chat_id = ?, topic_id = ?, message_id = ?, "
            "text = ?, photo_id = ?, entities = ?, user_photo_id = ?, user_photo_message_id = ? WHERE id = ?",
            {SqlValue(post.post_type_id), SqlValue(post.chat_id), SqlValue(post.topic_id),
             SqlValue(post.message_id), SqlValue(post.text), SqlValue(post.photo_id),
             SqlValue(post.entities), SqlValue(post.user_photo_id), SqlValue(post.user_photo_message_id),
             SqlValue(post.id)});
    });
}

bool DatabaseManager::deletePublishedPost(int64_t id) {
    return runWrite("deletePublishedPost", [id](DatabaseConnection& conn) {
        conn.execute("DELETE FROM published_posts WHERE id = ?", {SqlValue(id)});
    });
}

bool DatabaseManager::createReply(Reply& reply) {
    int64_t new_id = 0;
    const bool ok = runWrite("createReply", [&reply, &new_id](DatabaseConnection& conn) {
        QueryResult res = conn.execute(
            "INSERT INTO replies (chat_id, reply_to_message_id, message_id, text, photo_id, entities) "
            "VALUES (?, ?, ?, ?, ?, ?)",
            {SqlValue(reply.chat_id), SqlValue(reply.reply_to_message_id), SqlValue(reply.message_id),
             SqlValue(reply.text), SqlValue(reply.photo_id), SqlValue(reply.entities)});
        new_id = res.last_insert_id;
    });
    if (ok) {
        reply.id = new_id;
    }
    return ok;
}

std::optional<Reply> DatabaseManager::getReply(int64_t id) {
    QueryResult res = queue().read([id](DatabaseConnection& conn) {
        return conn.execute(std::string(kReplyColumns) + " WHERE id = ?", {SqlValue(id)});
    });
    if (res.empty()) {
        return std::nullopt;
    }
    return replyFromRow(res, 0);
}

std::vector<Reply> DatabaseManager::getAllReplies() {
    QueryResult res = queue().read([](DatabaseConnection& conn) {
        return conn.execute(std::string(kReplyColumns) + " ORDER BY created_at DESC, id DESC");
    });
    std::vector<Reply> out;
    out.reserve(res.size());
    for (size_t i = 0; i < res.size(); i++) {
        out.push_back(replyFromRow(res, i));
    }
    return out;
}

bool DatabaseManager::deleteReply(int64_t id) {
    return runWrite("deleteReply", [id](DatabaseConnection& conn) {
        conn.execute("DELETE FROM replies WHERE id = ?", {SqlValue(id)});
    });
}

} // namespace forumbot
