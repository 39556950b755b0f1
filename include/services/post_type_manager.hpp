#ifndef FORUMBOT_POST_TYPE_MANAGER_HPP
#define FORUMBOT_POST_TYPE_MANAGER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../models/records.hpp"

namespace forumbot {

class DatabaseManager;

class PostTypeManager {
public:
    explicit PostTypeManager(DatabaseManager& db);

    std::optional<PostType> createType(const std::string& name, const std::string& emoji,
                                       const std::string& photo_id, const std::string& template_text,
                                       const std::string& template_entities);
    std::optional<PostType> getType(int64_t id);
    std::vector<PostType> allTypes();
    std::vector<PostType> activeTypes();

    // Each returns false when the type does not exist or the write failed.
    bool updateName(int64_t id, const std::string& name);
    bool updateEmoji(int64_t id, const std::string& emoji);
    bool updatePhoto(int64_t id, const std::string& photo_id);
    bool updateTemplate(int64_t id, const std::string& template_text, const std::string& template_entities);

    bool setActive(int64_t id, bool active);
    bool deleteType(int64_t id);

private:
    template <typename Mutator>
    bool modify(int64_t id, const char* what, Mutator&& mutate);

    DatabaseManager& db_;
};

} // namespace forumbot

#endif // FORUMBOT_POST_TYPE_MANAGER_HPP
