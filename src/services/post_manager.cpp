#include "../../include/services/post_manager.hpp"
#include "../../include/database/db_manager.hpp"
#include "../../include/services/admin_directory.hpp"
#include "../../include/utils/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <regex>

namespace forumbot {

namespace {

const std::regex kTopicLink(R"((?:t\.me|telegram\.me)/c/(\d+)/(\d+)/(\d+))");
const std::regex kPrivateLink(R"((?:t\.me|telegram\.me)/c/(\d+)/(\d+))");
const std::regex kPublicLink(R"((?:t\.me|telegram\.me)/([^/]+)/(\d+))");

// The General topic is addressed without a thread id.
const int64_t kGeneralTopic = 1;

bool toInt(const std::string& digits, int64_t& out) {
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(digits.c_str(), &end, 10);
    if (errno != 0 || end != digits.c_str() + digits.size()) {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

int64_t privateChatId(int64_t id) {
    return id > 0 ? -1000000000000LL - id : id;
}

} // namespace

PostManager::PostManager(DatabaseManager& db, AdminDirectory& admins) : db_(db), admins_(admins) {
}

std::optional<PostLink> PostManager::parsePostLink(const std::string& link) {
    std::smatch m;

    if (std::regex_search(link, m, kTopicLink)) {
        PostLink out;
        int64_t chat = 0;
        if (toInt(m[1].str(), chat) && toInt(m[2].str(), out.thread_id) && toInt(m[3].str(), out.message_id)) {
            out.chat_id = privateChatId(chat);
            if (out.thread_id == kGeneralTopic) {
                out.thread_id = 0;
            }
            return out;
        }
    }

    if (std::regex_search(link, m, kPrivateLink)) {
        PostLink out;
        int64_t chat = 0;
        if (toInt(m[1].str(), chat) && toInt(m[2].str(), out.message_id)) {
            out.chat_id = privateChatId(chat);
            return out;
        }
    }

    if (std::regex_search(link, m, kPublicLink)) {
        PostLink out;
        if (toInt(m[2].str(), out.message_id)) {
            return out;
        }
    }

    return std::nullopt;
}

std::optional<PublishedPost> PostManager::findPostByLink(const std::string& link) {
    auto parsed = parsePostLink(link);
    if (!parsed) {
        Logger::getInstance().debug("Not a post link: " + link);
        return std::nullopt;
    }
    int64_t chat_id = parsed->chat_id;
    if (chat_id == 0) {
        chat_id = admins_.forumTarget().chat_id;
    }
    return db_.getPublishedPostByMessage(chat_id, parsed->message_id);
}

std::optional<PublishedPost> PostManager::getPost(int64_t post_id) {
    return db_.getPublishedPost(post_id);
}

std::optional<PublishedPost> PostManager::recordPublishedPost(int64_t post_type_id, const ForumTarget& target,
                                                              int64_t message_id, const std::string& text,
                                                              const std::string& photo_id,
                                                              const std::string& entities) {
    PublishedPost post;
    post.post_type_id = post_type_id;
    post.chat_id = target.chat_id;
    post.topic_id = target.topic_id;
    post.message_id = message_id;
    post.text = text;
    post.photo_id = photo_id;
    post.entities = entities;
    if (!db_.createPublishedPost(post)) {
        return std::nullopt;
    }
    return post;
}

bool PostManager::updatePostText(int64_t post_id, const std::string& text, const std::string& entities) {
    auto post = db_.getPublishedPost(post_id);
    if (!post) {
        Logger::getInstance().warning("updatePostText: post " + std::to_string(post_id) + " not found");
        return false;
    }
    post->text = text;
    post->entities = entities;
    return db_.updatePublishedPost(*post);
}

bool PostManager::deletePost(int64_t post_id) {
    return db_.deletePublishedPost(post_id);
}

std::optional<Reply> PostManager::recordReply(int64_t chat_id, int64_t reply_to_message_id, int64_t message_id,
                                              const std::string& text, const std::string& photo_id,
                                              const std::string& entities) {
    Reply reply;
    reply.chat_id = chat_id;
    reply.reply_to_message_id = reply_to_message_id;
    reply.message_id = message_id;
    reply.text = text;
    reply.photo_id = photo_id;
    reply.entities = entities;
    if (!db_.createReply(reply)) {
        return std::nullopt;
    }
    return reply;
}

} // namespace forumbot
