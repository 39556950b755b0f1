#include "../../include/state/conversation_state.hpp"

#include <utility>

namespace forumbot {

namespace {

struct StepEntry {
    ConversationStep step;
    const char* name;
    Workflow workflow;
};

const StepEntry kSteps[] = {
    {ConversationStep::NewPostSelectType, "new_post_select_type", Workflow::NewPost},
    {ConversationStep::NewPostEnterText, "new_post_enter_text", Workflow::NewPost},
    {ConversationStep::NewPostConfirm, "new_post_confirm", Workflow::NewPost},
    {ConversationStep::EditPostEnterLink, "edit_post_enter_link", Workflow::EditPost},
    {ConversationStep::EditPostEnterText, "edit_post_enter_text", Workflow::EditPost},
    {ConversationStep::DeletePostEnterLink, "delete_post_enter_link", Workflow::DeletePost},
    {ConversationStep::NewTypeEnterName, "new_type_enter_name", Workflow::NewType},
    {ConversationStep::NewTypeEnterEmoji, "new_type_enter_emoji", Workflow::NewType},
    {ConversationStep::NewTypeEnterImage, "new_type_enter_image", Workflow::NewType},
    {ConversationStep::NewTypeEnterTemplate, "new_type_enter_template", Workflow::NewType},
    {ConversationStep::ManageTypes, "manage_types", Workflow::ManageTypes},
    {ConversationStep::EditTypeName, "edit_type_name", Workflow::ManageTypes},
    {ConversationStep::EditTypeEmoji, "edit_type_emoji", Workflow::ManageTypes},
    {ConversationStep::EditTypeImage, "edit_type_image", Workflow::ManageTypes},
    {ConversationStep::EditTypeTemplate, "edit_type_template", Workflow::ManageTypes},
    {ConversationStep::EditAdminIds, "edit_admin_ids", Workflow::AccessSettings},
    {ConversationStep::EditForumId, "edit_forum_id", Workflow::AccessSettings},
    {ConversationStep::EditTopicId, "edit_topic_id", Workflow::AccessSettings},
    {ConversationStep::ReplyEnterLink, "reply_enter_link", Workflow::Reply},
    {ConversationStep::ReplyEnterText, "reply_enter_text", Workflow::Reply},
    {ConversationStep::ReplyConfirm, "reply_confirm", Workflow::Reply},
};

const StepEntry& entryFor(ConversationStep step) {
    for (const auto& e : kSteps) {
        if (e.step == step) return e;
    }
    throw std::logic_error("conversation step missing from step table");
}

// Forward edges inside a workflow. Entry steps are handled separately.
const std::pair<ConversationStep, ConversationStep> kForward[] = {
    {ConversationStep::NewPostSelectType, ConversationStep::NewPostEnterText},
    {ConversationStep::NewPostEnterText, ConversationStep::NewPostConfirm},
    {ConversationStep::EditPostEnterLink, ConversationStep::EditPostEnterText},
    {ConversationStep::NewTypeEnterName, ConversationStep::NewTypeEnterEmoji},
    {ConversationStep::NewTypeEnterEmoji, ConversationStep::NewTypeEnterImage},
    {ConversationStep::NewTypeEnterImage, ConversationStep::NewTypeEnterTemplate},
    {ConversationStep::ManageTypes, ConversationStep::EditTypeName},
    {ConversationStep::ManageTypes, ConversationStep::EditTypeEmoji},
    {ConversationStep::ManageTypes, ConversationStep::EditTypeImage},
    {ConversationStep::ManageTypes, ConversationStep::EditTypeTemplate},
    {ConversationStep::ReplyEnterLink, ConversationStep::ReplyEnterText},
    {ConversationStep::ReplyEnterText, ConversationStep::ReplyConfirm},
};

} // namespace

const char* stepName(ConversationStep step) {
    return entryFor(step).name;
}

std::optional<ConversationStep> stepFromName(const std::string& name) {
    for (const auto& e : kSteps) {
        if (name == e.name) return e.step;
    }
    return std::nullopt;
}

Workflow workflowOf(ConversationStep step) {
    return entryFor(step).workflow;
}

const char* workflowName(Workflow workflow) {
    switch (workflow) {
        case Workflow::NewPost: return "new_post";
        case Workflow::EditPost: return "edit_post";
        case Workflow::DeletePost: return "delete_post";
        case Workflow::NewType: return "new_type";
        case Workflow::ManageTypes: return "manage_types";
        case Workflow::AccessSettings: return "access_settings";
        case Workflow::Reply: return "reply";
    }
    return "unknown";
}

bool isEntryStep(ConversationStep step) {
    switch (step) {
        case ConversationStep::NewPostSelectType:
        case ConversationStep::EditPostEnterLink:
        case ConversationStep::DeletePostEnterLink:
        case ConversationStep::NewTypeEnterName:
        case ConversationStep::ManageTypes:
        case ConversationStep::EditAdminIds:
        case ConversationStep::EditForumId:
        case ConversationStep::EditTopicId:
        case ConversationStep::ReplyEnterLink:
            return true;
        default:
            return false;
    }
}

bool isAllowedTransition(std::optional<ConversationStep> from, ConversationStep to) {
    if (isEntryStep(to)) {
        return true;
    }
    if (!from) {
        return false;
    }
    if (*from == to) {
        return true;
    }
    for (const auto& edge : kForward) {
        if (edge.first == *from && edge.second == to) {
            return true;
        }
    }
    return false;
}

ConversationState ConversationState::fresh(int64_t admin_id, ConversationStep step) {
    if (!isEntryStep(step)) {
        throw std::logic_error(std::string("cannot start a workflow at step ") + stepName(step));
    }
    ConversationState state;
    state.admin_id = admin_id;
    state.step = step;
    return state;
}

bool ConversationState::hasDraft() const {
    return selected_type_id != 0 || !draft_text.empty() || !draft_photo_id.empty() ||
           !draft_entities.empty() || editing_post_id != 0 || editing_type_id != 0 ||
           !temp_name.empty() || !temp_emoji.empty() || !temp_photo_id.empty() ||
           !temp_template.empty() || reply_target_chat_id != 0 || reply_target_message_id != 0;
}

void ConversationState::advanceTo(ConversationStep next) {
    if (!isAllowedTransition(step, next)) {
        throw std::logic_error(std::string("transition ") + (step ? stepName(*step) : "idle") +
                               " -> " + stepName(next) + " is not allowed");
    }
    step = next;
}

bool ConversationState::operator==(const ConversationState& other) const {
    return admin_id == other.admin_id && step == other.step &&
           selected_type_id == other.selected_type_id && draft_text == other.draft_text &&
           draft_photo_id == other.draft_photo_id && draft_entities == other.draft_entities &&
           editing_post_id == other.editing_post_id && editing_type_id == other.editing_type_id &&
           temp_name == other.temp_name && temp_emoji == other.temp_emoji &&
           temp_photo_id == other.temp_photo_id && temp_template == other.temp_template &&
           last_bot_message_id == other.last_bot_message_id &&
           reply_target_chat_id == other.reply_target_chat_id &&
           reply_target_message_id == other.reply_target_message_id;
}

} // namespace forumbot
