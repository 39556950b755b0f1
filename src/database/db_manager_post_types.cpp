// Post type catalogue

#include "../../include/database/db_manager.hpp"

namespace forumbot {

namespace {

const char* kPostTypeColumns =
    "SELECT id, name, COALESCE(emoji, ''), COALESCE(photo_id, ''), template, "
    "COALESCE(template_entities, ''), is_active, COALESCE(created_at, '') FROM post_types";

} // namespace

PostType DatabaseManager::postTypeFromRow(const QueryResult& res, size_t row) {
    PostType t;
    t.id = res.getInt(row, 0);
    t.name = res.getText(row, 1);
    t.emoji = res.getText(row, 2);
    t.photo_id = res.getText(row, 3);
    t.template_text = res.getText(row, 4);
    t.template_entities = res.getText(row, 5);
    t.is_active = res.getInt(row, 6) != 0;
    t.created_at = res.getText(row, 7);
    return t;
}

bool DatabaseManager::createPostType(PostType& post_type) {
    int64_t new_id = 0;
    const bool ok = runWrite("createPostType", [&post_type, &new_id](DatabaseConnection& conn) {
        QueryResult res = conn.execute(
            "INSERT INTO post_types (name, emoji, photo_id, template, template_entities, is_active) "
            "VALUES (?, ?, ?, ?, ?, ?)",
            {SqlValue(post_type.name), SqlValue(post_type.emoji), SqlValue(post_type.photo_id),
             SqlValue(post_type.template_text), SqlValue(post_type.template_entities),
             SqlValue(static_cast<int64_t>(post_type.is_active ? 1 : 0))});
        new_id = res.last_insert_id;
    });
    if (ok) {
        post_type.id = new_id;
    }
    return ok;
}

std::optional<PostType> DatabaseManager::getPostType(int64_t id) {
    QueryResult res = queue().read([id](DatabaseConnection& conn) {
        return conn.execute(std::string(kPostTypeColumns) + " WHERE id = ?", {SqlValue(id)});
    });
    if (res.empty()) {
        return std::nullopt;
    }
    return postTypeFromRow(res, 0);
}

std::vector<PostType> DatabaseManager::getAllPostTypes() {
    QueryResult res = queue().read([](DatabaseConnection& conn) {
        return conn.execute(std::string(kPostTypeColumns) + " ORDER BY created_at DESC, id DESC");
    });
    std::vector<PostType> out;
    out.reserve(res.size());
    for (size_t i = 0; i < res.size(); i++) {
        out.push_back(postTypeFromRow(res, i));
    }
    return out;
}

std::vector<PostType> DatabaseManager::getActivePostTypes() {
    QueryResult res = queue().read([](DatabaseConnection& conn) {
        return conn.execute(std::string(kPostTypeColumns) + " WHERE is_active = 1 ORDER BY created_at DESC, id DESC");
    });
    std::vector<PostType> out;
    out.reserve(res.size());
    for (size_t i = 0; i < res.size(); i++) {
        out.push_back(postTypeFromRow(res, i));
    }
    return out;
}

bool DatabaseManager::updatePostType(const PostType& post_type) {
    return runWrite("updatePostType", [post_type](DatabaseConnection& conn) {
        conn.execute(
            "UPDATE post_types SET name = ?, emoji = ?, photo_id = ?, template = ?, "
            "template_entities = ?, is_active = ? WHERE id = ?",
            {SqlValue(post_type.name), SqlValue(post_type.emoji), SqlValue(post_type.photo_id),
             SqlValue(post_type.template_text), SqlValue(post_type.template_entities),
             SqlValue(static_cast<int64_t>(post_type.is_active ? 1 : 0)), SqlValue(post_type.id)});
    });
}

bool DatabaseManager::setPostTypeActive(int64_t id, bool active) {
    return runWrite("setPostTypeActive", [id, active](DatabaseConnection& conn) {
        conn.execute("UPDATE post_types SET is_active = ? WHERE id = ?",
                     {SqlValue(static_cast<int64_t>(active ? 1 : 0)), SqlValue(id)});
    });
}

bool DatabaseManager::deletePostType(int64_t id) {
    return runWrite("deletePostType", [id](DatabaseConnection& conn) {
        conn.execute("DELETE FROM post_types WHERE id = ?", {SqlValue(id)});
    });
}

} // namespace forumbot
