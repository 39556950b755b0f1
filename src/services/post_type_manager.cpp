#include "../../include/services/post_type_manager.hpp"
#include "../../include/database/db_manager.hpp"
#include "../../include/utils/logger.hpp"

namespace forumbot {

PostTypeManager::PostTypeManager(DatabaseManager& db) : db_(db) {
}

template <typename Mutator>
bool PostTypeManager::modify(int64_t id, const char* what, Mutator&& mutate) {
    auto post_type = db_.getPostType(id);
    if (!post_type) {
        Logger::getInstance().warning(std::string(what) + ": post type " + std::to_string(id) + " not found");
        return false;
    }
    mutate(*post_type);
    return db_.updatePostType(*post_type);
}

std::optional<PostType> PostTypeManager::createType(const std::string& name, const std::string& emoji,
                                                    const std::string& photo_id, const std::string& template_text,
                                                    const std::string& template_entities) {
    PostType post_type;
    post_type.name = name;
    post_type.emoji = emoji;
    post_type.photo_id = photo_id;
    post_type.template_text = template_text;
    post_type.template_entities = template_entities;
    post_type.is_active = true;
    if (!db_.createPostType(post_type)) {
        return std::nullopt;
    }
    Logger::getInstance().info("Post type created: id=" + std::to_string(post_type.id) + " name=" + name);
    return post_type;
}

std::optional<PostType> PostTypeManager::getType(int64_t id) {
    return db_.getPostType(id);
}

std::vector<PostType> PostTypeManager::allTypes() {
    return db_.getAllPostTypes();
}

std::vector<PostType> PostTypeManager::activeTypes() {
    return db_.getActivePostTypes();
}

bool PostTypeManager::updateName(int64_t id, const std::string& name) {
    return modify(id, "updateName", [&name](PostType& t) { t.name = name; });
}

bool PostTypeManager::updateEmoji(int64_t id, const std::string& emoji) {
    return modify(id, "updateEmoji", [&emoji](PostType& t) { t.emoji = emoji; });
}

bool PostTypeManager::updatePhoto(int64_t id, const std::string& photo_id) {
    return modify(id, "updatePhoto", [&photo_id](PostType& t) { t.photo_id = photo_id; });
}

bool PostTypeManager::updateTemplate(int64_t id, const std::string& template_text,
                                     const std::string& template_entities) {
    return modify(id, "updateTemplate", [&](PostType& t) {
        t.template_text = template_text;
        t.template_entities = template_entities;
    });
}

bool PostTypeManager::setActive(int64_t id, bool active) {
    return db_.setPostTypeActive(id, active);
}

bool PostTypeManager::deleteType(int64_t id) {
    return db_.deletePostType(id);
}

} // namespace forumbot
