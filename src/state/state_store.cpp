#include "../../include/state/state_store.hpp"
#include "../../include/database/write_queue.hpp"
#include "../../include/utils/logger.hpp"

namespace forumbot {

namespace {

const char* kUpsertState = R"SQL(
INSERT INTO admin_state (user_id, current_state, selected_type_id, draft_text, draft_photo_id,
                         draft_entities, editing_post_id, editing_type_id, temp_name, temp_emoji,
                         temp_photo_id, temp_template, last_bot_message_id,
                         reply_target_chat_id, reply_target_message_id)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
ON CONFLICT(user_id) DO UPDATE SET
    current_state = excluded.current_state,
    selected_type_id = excluded.selected_type_id,
    draft_text = excluded.draft_text,
    draft_photo_id = excluded.draft_photo_id,
    draft_entities = excluded.draft_entities,
    editing_post_id = excluded.editing_post_id,
    editing_type_id = excluded.editing_type_id,
    temp_name = excluded.temp_name,
    temp_emoji = excluded.temp_emoji,
    temp_photo_id = excluded.temp_photo_id,
    temp_template = excluded.temp_template,
    last_bot_message_id = excluded.last_bot_message_id,
    reply_target_chat_id = excluded.reply_target_chat_id,
    reply_target_message_id = excluded.reply_target_message_id
)SQL";

const char* kSelectState = R"SQL(
SELECT user_id, current_state, COALESCE(selected_type_id, 0), COALESCE(draft_text, ''),
       COALESCE(draft_photo_id, ''), COALESCE(draft_entities, ''), COALESCE(editing_post_id, 0),
       COALESCE(editing_type_id, 0), COALESCE(temp_name, ''), COALESCE(temp_emoji, ''),
       COALESCE(temp_photo_id, ''), COALESCE(temp_template, ''), COALESCE(last_bot_message_id, 0),
       COALESCE(reply_target_chat_id, 0), COALESCE(reply_target_message_id, 0)
FROM admin_state WHERE user_id = ?
)SQL";

} // namespace

SqliteStateStore::SqliteStateStore(WriteQueue& queue) : queue_(queue) {
}

void SqliteStateStore::save(const ConversationState& state) {
    std::vector<SqlValue> params = {
        SqlValue(state.admin_id),
        SqlValue(std::string(state.step ? stepName(*state.step) : "")),
        SqlValue(state.selected_type_id),
        SqlValue(state.draft_text),
        SqlValue(state.draft_photo_id),
        SqlValue(state.draft_entities),
        SqlValue(state.editing_post_id),
        SqlValue(state.editing_type_id),
        SqlValue(state.temp_name),
        SqlValue(state.temp_emoji),
        SqlValue(state.temp_photo_id),
        SqlValue(state.temp_template),
        SqlValue(state.last_bot_message_id),
        SqlValue(state.reply_target_chat_id),
        SqlValue(state.reply_target_message_id)
    };

    queue_.execute([params = std::move(params)](DatabaseConnection& conn) {
        conn.execute(kUpsertState, params);
    });
}

std::optional<ConversationState> SqliteStateStore::get(int64_t admin_id) {
    QueryResult res = queue_.read([admin_id](DatabaseConnection& conn) {
        return conn.execute(kSelectState, {SqlValue(admin_id)});
    });
    if (res.empty()) {
        return std::nullopt;
    }

    ConversationState state;
    state.admin_id = res.getInt(0, 0);

    const std::string raw = res.getText(0, 1);
    if (!raw.empty()) {
        state.step = stepFromName(raw);
        if (!state.step) {
            Logger::getInstance().error("admin_state row for " + std::to_string(admin_id) +
                                        " holds unknown state '" + raw + "'");
            throw StateIntegrityError(admin_id, raw);
        }
    }

    state.selected_type_id = res.getInt(0, 2);
    state.draft_text = res.getText(0, 3);
    state.draft_photo_id = res.getText(0, 4);
    state.draft_entities = res.getText(0, 5);
    state.editing_post_id = res.getInt(0, 6);
    state.editing_type_id = res.getInt(0, 7);
    state.temp_name = res.getText(0, 8);
    state.temp_emoji = res.getText(0, 9);
    state.temp_photo_id = res.getText(0, 10);
    state.temp_template = res.getText(0, 11);
    state.last_bot_message_id = res.getInt(0, 12);
    state.reply_target_chat_id = res.getInt(0, 13);
    state.reply_target_message_id = res.getInt(0, 14);
    return state;
}

void SqliteStateStore::clear(int64_t admin_id) {
    queue_.execute([admin_id](DatabaseConnection& conn) {
        conn.execute("DELETE FROM admin_state WHERE user_id = ?", {SqlValue(admin_id)});
    });
}

bool SqliteStateStore::recordPrompt(int64_t admin_id, ConversationStep expected, int64_t message_id) {
    const std::string step = stepName(expected);
    return queue_.execute([admin_id, step, message_id](DatabaseConnection& conn) {
        QueryResult res = conn.execute(
            "UPDATE admin_state SET last_bot_message_id = ? WHERE user_id = ? AND current_state = ?",
            {SqlValue(message_id), SqlValue(admin_id), SqlValue(step)});
        return res.changes > 0;
    });
}

} // namespace forumbot
