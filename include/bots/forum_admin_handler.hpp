#ifndef FORUMBOT_FORUM_ADMIN_HANDLER_HPP
#define FORUMBOT_FORUM_ADMIN_HANDLER_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "../state/conversation_state.hpp"
#include "../telegram/types.hpp"

namespace forumbot {

class ChatTransport;
class AdminDirectory;
class StateStore;
class PostManager;
class PostTypeManager;
class BackupManager;
struct PostType;

enum class HandleResult {
    // Sender is not an administrator; nothing was read or written.
    Ignored,
    // Not a command, callback or input this bot understands.
    Unhandled,
    // Handled: the state moved forward or a screen was shown.
    Advanced,
    // Input did not fit the current step; persisted state untouched.
    Rejected,
    // The workflow's side effect was performed.
    Committed,
    Cancelled,
    // Storage or transport failed; the previously persisted state is kept.
    Failed
};

const char* handleResultName(HandleResult result);

// Admin conversation state machine.
//
// Each update is handled on its own, from the persisted state alone, so any
// number of updates may be handled concurrently. Every update passes the
// admin guard before the state store is touched.
class ForumAdminHandler {
public:
    ForumAdminHandler(ChatTransport& transport, AdminDirectory& admins, StateStore& states,
                      PostManager& posts, PostTypeManager& types, BackupManager& backups);

    HandleResult handleUpdate(const Update& update);

private:
    HandleResult dispatchCommand(const Message& msg);
    HandleResult dispatchMessage(const Message& msg);
    HandleResult dispatchCallback(const CallbackQuery& query);

    // Menus
    HandleResult showAdminMenu(int64_t chat_id, int64_t message_id);
    HandleResult showSettingsMenu(int64_t chat_id, int64_t message_id);
    HandleResult showManageTypes(int64_t chat_id, int64_t message_id);
    HandleResult showAccessSettings(int64_t chat_id, int64_t message_id);

    // New post
    HandleResult startNewPost(int64_t admin_id, int64_t chat_id, int64_t message_id);
    HandleResult selectType(int64_t admin_id, int64_t chat_id, int64_t message_id, int64_t type_id);
    HandleResult enterPostText(const Message& msg, ConversationState state);
    HandleResult confirmPost(int64_t admin_id, int64_t chat_id, int64_t message_id);

    // Edit / delete post
    HandleResult startLinkWorkflow(int64_t admin_id, int64_t chat_id, int64_t message_id, ConversationStep entry);
    HandleResult enterEditLink(const Message& msg, ConversationState state);
    HandleResult enterEditText(const Message& msg, ConversationState state);
    HandleResult enterDeleteLink(const Message& msg, ConversationState state);

    // Post types
    HandleResult startNewType(int64_t admin_id, int64_t chat_id, int64_t message_id);
    HandleResult enterTypeName(const Message& msg, ConversationState state);
    HandleResult enterTypeEmoji(const Message& msg, ConversationState state);
    HandleResult skipTypeEmoji(int64_t admin_id, int64_t chat_id, int64_t message_id);
    HandleResult enterTypeImage(const Message& msg, ConversationState state);
    HandleResult skipTypeImage(int64_t admin_id, int64_t chat_id, int64_t message_id);
    HandleResult enterTypeTemplate(const Message& msg, ConversationState state);
    HandleResult manageType(int64_t admin_id, int64_t chat_id, int64_t message_id, int64_t type_id);
    HandleResult startTypeEdit(int64_t admin_id, int64_t chat_id, int64_t message_id, int64_t type_id,
                               ConversationStep step);
    HandleResult enterTypeEdit(const Message& msg, ConversationState state);
    HandleResult toggleTypeActive(int64_t chat_id, int64_t message_id, int64_t type_id);

    // Access settings
    HandleResult startAccessEdit(int64_t admin_id, int64_t chat_id, int64_t message_id, ConversationStep step);
    HandleResult enterAdminIds(const Message& msg, ConversationState state);
    HandleResult enterForumOrTopicId(const Message& msg, ConversationState state);

    // Reply
    HandleResult enterReplyLink(const Message& msg, ConversationState state);
    HandleResult enterReplyText(const Message& msg, ConversationState state);
    HandleResult confirmReply(int64_t admin_id, int64_t chat_id, int64_t message_id);

    HandleResult cancel(int64_t admin_id, int64_t chat_id, int64_t message_id);
    HandleResult backup(int64_t chat_id, int64_t message_id);

    // State helpers. persist/clear report failures to the admin and return false.
    std::optional<ConversationState> loadState(int64_t admin_id);
    bool persist(const ConversationState& state, int64_t chat_id);
    bool clearState(int64_t admin_id);
    // Stores the id of the prompt just sent so the next input can remove it. Only
    // the prompt id is written, and only while the admin is still at the state's step.
    void rememberPrompt(ConversationState& state, const SendResult& sent);
    void dropLastPrompt(ConversationState& state, int64_t chat_id);

    // Transport helpers
    SendResult say(int64_t chat_id, const std::string& text);
    // Edits `message_id` in place when set, otherwise sends a new message.
    SendResult show(int64_t chat_id, int64_t message_id, const std::string& text, const InlineKeyboard& keyboard,
                    const std::string& entities = "");
    SendResult showMaybePhoto(int64_t chat_id, const std::string& photo_id, const std::string& text,
                              const std::string& entities, const InlineKeyboard& keyboard);
    void removeMessage(int64_t chat_id, int64_t message_id);

    ChatTransport& transport_;
    AdminDirectory& admins_;
    StateStore& states_;
    PostManager& posts_;
    PostTypeManager& types_;
    BackupManager& backups_;
};

} // namespace forumbot

#endif // FORUMBOT_FORUM_ADMIN_HANDLER_HPP
