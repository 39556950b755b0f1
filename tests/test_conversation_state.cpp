#define BOOST_TEST_MODULE conversation_state
#include <boost/test/unit_test.hpp>

#include "state/conversation_state.hpp"

#include <set>
#include <stdexcept>
#include <string>

using namespace forumbot;

namespace {

const ConversationStep kAllSteps[] = {
    ConversationStep::NewPostSelectType,  ConversationStep::NewPostEnterText,
    ConversationStep::NewPostConfirm,     ConversationStep::EditPostEnterLink,
    ConversationStep::EditPostEnterText,  ConversationStep::DeletePostEnterLink,
    ConversationStep::NewTypeEnterName,   ConversationStep::NewTypeEnterEmoji,
    ConversationStep::NewTypeEnterImage,  ConversationStep::NewTypeEnterTemplate,
    ConversationStep::ManageTypes,
    ConversationStep::EditTypeName,       ConversationStep::EditTypeEmoji,
    ConversationStep::EditTypeImage,      ConversationStep::EditTypeTemplate,
    ConversationStep::EditAdminIds,       ConversationStep::EditForumId,
    ConversationStep::EditTopicId,        ConversationStep::ReplyEnterLink,
    ConversationStep::ReplyEnterText,     ConversationStep::ReplyConfirm,
};

} // namespace

BOOST_AUTO_TEST_SUITE(conversation_state)

BOOST_AUTO_TEST_CASE(step_names_are_unique_and_parse_back) {
    std::set<std::string> seen;
    for (ConversationStep step : kAllSteps) {
        const std::string name = stepName(step);
        BOOST_TEST(seen.insert(name).second, "duplicate step name " << name);
        auto parsed = stepFromName(name);
        BOOST_REQUIRE(parsed.has_value());
        BOOST_TEST((*parsed == step));
    }
    BOOST_TEST(!stepFromName("").has_value());
    BOOST_TEST(!stepFromName("NEW_POST_SELECT_TYPE").has_value());
}

BOOST_AUTO_TEST_CASE(stored_names_match_existing_rows) {
    BOOST_TEST(std::string(stepName(ConversationStep::NewPostSelectType)) == "new_post_select_type");
    BOOST_TEST(std::string(stepName(ConversationStep::EditTypeTemplate)) == "edit_type_template");
    BOOST_TEST(std::string(stepName(ConversationStep::ReplyConfirm)) == "reply_confirm");
}

BOOST_AUTO_TEST_CASE(new_post_walks_forward) {
    ConversationState state = ConversationState::fresh(42, ConversationStep::NewPostSelectType);
    state.selected_type_id = 7;
    state.advanceTo(ConversationStep::NewPostEnterText);
    state.draft_text = "Hello";
    state.advanceTo(ConversationStep::NewPostConfirm);

    BOOST_TEST(state.at(ConversationStep::NewPostConfirm));
    BOOST_TEST(state.selected_type_id == 7);
    BOOST_TEST(state.draft_text == "Hello");
}

BOOST_AUTO_TEST_CASE(new_type_asks_for_emoji_before_image) {
    ConversationState state = ConversationState::fresh(42, ConversationStep::NewTypeEnterName);
    BOOST_CHECK_THROW(state.advanceTo(ConversationStep::NewTypeEnterImage), std::logic_error);

    state.temp_name = "Новости";
    state.advanceTo(ConversationStep::NewTypeEnterEmoji);
    state.temp_emoji = "📰";
    state.advanceTo(ConversationStep::NewTypeEnterImage);
    state.advanceTo(ConversationStep::NewTypeEnterTemplate);

    BOOST_TEST(state.temp_name == "Новости");
    BOOST_TEST(state.temp_emoji == "📰");
    BOOST_TEST(std::string(stepName(ConversationStep::NewTypeEnterEmoji)) == "new_type_enter_emoji");
}

BOOST_AUTO_TEST_CASE(skipping_a_step_is_refused_and_leaves_state_alone) {
    ConversationState state = ConversationState::fresh(42, ConversationStep::NewPostSelectType);
    BOOST_CHECK_THROW(state.advanceTo(ConversationStep::NewPostConfirm), std::logic_error);
    BOOST_TEST(state.at(ConversationStep::NewPostSelectType));

    BOOST_CHECK_THROW(state.advanceTo(ConversationStep::ReplyConfirm), std::logic_error);
    BOOST_CHECK_THROW(state.advanceTo(ConversationStep::EditTypeName), std::logic_error);
}

BOOST_AUTO_TEST_CASE(idle_only_leaves_through_an_entry_step) {
    for (ConversationStep step : kAllSteps) {
        BOOST_TEST(isAllowedTransition(std::nullopt, step) == isEntryStep(step), stepName(step));
    }
}

BOOST_AUTO_TEST_CASE(entry_steps_are_reachable_from_anywhere) {
    for (ConversationStep from : kAllSteps) {
        BOOST_TEST(isAllowedTransition(from, ConversationStep::NewPostSelectType));
        BOOST_TEST(isAllowedTransition(from, ConversationStep::ManageTypes));
        BOOST_TEST(isAllowedTransition(from, from), "same step " << stepName(from));
    }
}

BOOST_AUTO_TEST_CASE(manage_types_fans_out_to_each_edit) {
    for (ConversationStep edit : {ConversationStep::EditTypeName, ConversationStep::EditTypeEmoji,
                                  ConversationStep::EditTypeImage, ConversationStep::EditTypeTemplate}) {
        BOOST_TEST(isAllowedTransition(ConversationStep::ManageTypes, edit));
        BOOST_TEST(!isAllowedTransition(ConversationStep::NewTypeEnterName, edit));
        BOOST_TEST((workflowOf(edit) == Workflow::ManageTypes));
    }
}

BOOST_AUTO_TEST_CASE(fresh_starts_with_an_empty_draft) {
    ConversationState state = ConversationState::fresh(42, ConversationStep::EditPostEnterLink);
    BOOST_TEST(state.admin_id == 42);
    BOOST_TEST(!state.hasDraft());
    BOOST_TEST(!state.isIdle());
    BOOST_CHECK_THROW(ConversationState::fresh(42, ConversationStep::NewPostConfirm), std::logic_error);
}

BOOST_AUTO_TEST_SUITE_END()
