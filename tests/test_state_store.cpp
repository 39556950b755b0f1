#define BOOST_TEST_MODULE state_store
#include <boost/test/unit_test.hpp>

#include "test_support.hpp"
#include "state/state_store.hpp"

using namespace forumbot;

namespace {

struct StoreFixture : test::DatabaseFixture {
    SqliteStateStore store{db.queue()};
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(state_store, StoreFixture)

BOOST_AUTO_TEST_CASE(missing_row_reads_as_nullopt) {
    BOOST_TEST(!store.get(42).has_value());
}

BOOST_AUTO_TEST_CASE(every_field_survives_a_round_trip) {
    ConversationState state = ConversationState::fresh(42, ConversationStep::ReplyEnterLink);
    state.advanceTo(ConversationStep::ReplyEnterText);
    state.selected_type_id = 7;
    state.draft_text = "Привет, форум";
    state.draft_photo_id = "AgACAgIAAxkBAAI";
    state.draft_entities = R"([{"type":"bold","offset":0,"length":6}])";
    state.editing_post_id = 11;
    state.editing_type_id = 12;
    state.temp_name = "Новости";
    state.temp_emoji = "📰";
    state.temp_photo_id = "photo-1";
    state.temp_template = "It's a template";
    state.last_bot_message_id = 555;
    state.reply_target_chat_id = -1001234567890;
    state.reply_target_message_id = 321;

    store.save(state);
    auto loaded = store.get(42);

    BOOST_REQUIRE(loaded.has_value());
    BOOST_TEST((*loaded == state));
}

BOOST_AUTO_TEST_CASE(save_overwrites_every_field) {
    ConversationState first = ConversationState::fresh(42, ConversationStep::NewPostSelectType);
    first.advanceTo(ConversationStep::NewPostEnterText);
    first.selected_type_id = 3;
    first.draft_text = "old draft";
    store.save(first);

    ConversationState second = ConversationState::fresh(42, ConversationStep::EditPostEnterLink);
    store.save(second);

    auto loaded = store.get(42);
    BOOST_REQUIRE(loaded.has_value());
    BOOST_TEST(loaded->at(ConversationStep::EditPostEnterLink));
    BOOST_TEST(loaded->selected_type_id == 0);
    BOOST_TEST(loaded->draft_text.empty());
}

BOOST_AUTO_TEST_CASE(idle_row_is_distinct_from_missing_row) {
    ConversationState idle;
    idle.admin_id = 42;
    store.save(idle);

    auto loaded = store.get(42);
    BOOST_REQUIRE(loaded.has_value());
    BOOST_TEST(loaded->isIdle());
}

BOOST_AUTO_TEST_CASE(clear_removes_only_that_admin) {
    store.save(ConversationState::fresh(42, ConversationStep::NewTypeEnterName));
    store.save(ConversationState::fresh(43, ConversationStep::EditAdminIds));

    store.clear(42);
    store.clear(42);

    BOOST_TEST(!store.get(42).has_value());
    BOOST_REQUIRE(store.get(43).has_value());
    BOOST_TEST(store.get(43)->at(ConversationStep::EditAdminIds));
}

BOOST_AUTO_TEST_CASE(prompt_id_is_recorded_only_at_the_expected_step) {
    ConversationState state = ConversationState::fresh(42, ConversationStep::NewPostSelectType);
    state.advanceTo(ConversationStep::NewPostEnterText);
    state.selected_type_id = 7;
    store.save(state);

    BOOST_TEST(store.recordPrompt(42, ConversationStep::NewPostEnterText, 900));
    auto loaded = store.get(42);
    BOOST_REQUIRE(loaded.has_value());
    BOOST_TEST(loaded->last_bot_message_id == 900);
    BOOST_TEST(loaded->selected_type_id == 7);

    // A stale step leaves the row as it is.
    BOOST_TEST(!store.recordPrompt(42, ConversationStep::NewPostSelectType, 901));
    BOOST_TEST(store.get(42)->last_bot_message_id == 900);
    BOOST_TEST(store.get(42)->at(ConversationStep::NewPostEnterText));

    // A cleared row is not brought back.
    store.clear(42);
    BOOST_TEST(!store.recordPrompt(42, ConversationStep::NewPostEnterText, 902));
    BOOST_TEST(!store.get(42).has_value());
}

BOOST_AUTO_TEST_CASE(unknown_step_name_raises_integrity_error) {
    db.queue().execute([](DatabaseConnection& conn) {
        conn.execute("INSERT INTO admin_state (user_id, current_state) VALUES (42, 'waiting_for_magic')");
    });

    try {
        store.get(42);
        BOOST_FAIL("expected StateIntegrityError");
    } catch (const StateIntegrityError& e) {
        BOOST_TEST(e.adminId() == 42);
        BOOST_TEST(e.rawValue() == "waiting_for_magic");
    }
}

BOOST_AUTO_TEST_CASE(save_after_shutdown_reports_closed_queue) {
    db.shutdown();
    BOOST_CHECK_THROW(store.save(ConversationState::fresh(42, ConversationStep::NewPostSelectType)),
                      QueueClosedError);
}

BOOST_AUTO_TEST_SUITE_END()
