#ifndef FORUMBOT_STATE_STORE_HPP
#define FORUMBOT_STATE_STORE_HPP

#include <cstdint>
#include <optional>

#include "conversation_state.hpp"

namespace forumbot {

class WriteQueue;

// One conversation state row per administrator.
class StateStore {
public:
    virtual ~StateStore() = default;

    // Upsert: insert when absent, otherwise overwrite every field.
    virtual void save(const ConversationState& state) = 0;
    // std::nullopt when no row exists. Throws StateIntegrityError for an unknown step name.
    virtual std::optional<ConversationState> get(int64_t admin_id) = 0;
    virtual void clear(int64_t admin_id) = 0;
    // Sets last_bot_message_id only, and only while the row is still at `expected`.
    // False when the row is gone or has moved to another step.
    virtual bool recordPrompt(int64_t admin_id, ConversationStep expected, int64_t message_id) = 0;
};

// save/clear go through the write queue and block until executed; get reads directly.
class SqliteStateStore : public StateStore {
public:
    explicit SqliteStateStore(WriteQueue& queue);

    void save(const ConversationState& state) override;
    std::optional<ConversationState> get(int64_t admin_id) override;
    void clear(int64_t admin_id) override;
    bool recordPrompt(int64_t admin_id, ConversationStep expected, int64_t message_id) override;

private:
    WriteQueue& queue_;
};

} // namespace forumbot

#endif // FORUMBOT_STATE_STORE_HPP
