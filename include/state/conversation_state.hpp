#ifndef FORUMBOT_CONVERSATION_STATE_HPP
#define FORUMBOT_CONVERSATION_STATE_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace forumbot {

enum class ConversationStep {
    NewPostSelectType,
    NewPostEnterText,
    NewPostConfirm,
    EditPostEnterLink,
    EditPostEnterText,
    DeletePostEnterLink,
    NewTypeEnterName,
    NewTypeEnterEmoji,
    NewTypeEnterImage,
    NewTypeEnterTemplate,
    ManageTypes,
    EditTypeName,
    EditTypeEmoji,
    EditTypeImage,
    EditTypeTemplate,
    EditAdminIds,
    EditForumId,
    EditTopicId,
    ReplyEnterLink,
    ReplyEnterText,
    ReplyConfirm
};

enum class Workflow {
    NewPost,
    EditPost,
    DeletePost,
    NewType,
    ManageTypes,
    AccessSettings,
    Reply
};

// A persisted current_state value that is not one of the known step names.
class StateIntegrityError : public std::runtime_error {
public:
    StateIntegrityError(int64_t admin_id, const std::string& raw)
        : std::runtime_error("admin " + std::to_string(admin_id) + " has unknown conversation state '" + raw + "'"),
          admin_id_(admin_id), raw_(raw) {}

    int64_t adminId() const { return admin_id_; }
    const std::string& rawValue() const { return raw_; }

private:
    int64_t admin_id_;
    std::string raw_;
};

// Stable names stored in admin_state.current_state.
const char* stepName(ConversationStep step);
std::optional<ConversationStep> stepFromName(const std::string& name);
Workflow workflowOf(ConversationStep step);
const char* workflowName(Workflow workflow);

// True for the first step of a workflow. Entering one always starts from a fresh draft.
bool isEntryStep(ConversationStep step);

// The transition table. `from` is empty for idle. Staying on the same step is
// allowed (bookkeeping updates); every other pair not listed is refused.
bool isAllowedTransition(std::optional<ConversationStep> from, ConversationStep to);

struct ConversationState {
    int64_t admin_id = 0;
    // Empty means an explicitly idle row; a missing row is reported by the store instead.
    std::optional<ConversationStep> step;

    int64_t selected_type_id = 0;
    std::string draft_text;
    std::string draft_photo_id;
    std::string draft_entities;
    int64_t editing_post_id = 0;
    int64_t editing_type_id = 0;
    std::string temp_name;
    std::string temp_emoji;
    std::string temp_photo_id;
    std::string temp_template;
    int64_t last_bot_message_id = 0;
    int64_t reply_target_chat_id = 0;
    int64_t reply_target_message_id = 0;

    static ConversationState fresh(int64_t admin_id, ConversationStep step);

    bool isIdle() const { return !step.has_value(); }
    bool at(ConversationStep s) const { return step.has_value() && *step == s; }
    bool hasDraft() const;

    // Moves to `next`, keeping the draft. Throws std::logic_error for a transition the table refuses.
    void advanceTo(ConversationStep next);

    bool operator==(const ConversationState& other) const;
    bool operator!=(const ConversationState& other) const { return !(*this == other); }
};

} // namespace forumbot

#endif // FORUMBOT_CONVERSATION_STATE_HPP
