#define BOOST_TEST_MODULE update_poller
#include <boost/test/unit_test.hpp>

#include "test_support.hpp"
#include "bots/forum_admin_handler.hpp"
#include "bots/update_poller.hpp"
#include "services/admin_directory.hpp"
#include "services/backup_manager.hpp"
#include "services/post_manager.hpp"
#include "services/post_type_manager.hpp"
#include "state/state_store.hpp"

#include <chrono>
#include <thread>

using namespace forumbot;

namespace {

// Hands out one scripted batch, then empty ones.
class ScriptedTransport : public test::FakeTransport {
public:
    UpdateBatch getUpdates(int64_t offset, int) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            offsets_.push_back(offset);
        }
        UpdateBatch batch;
        batch.ok = true;
        if (!served_.exchange(true)) {
            batch.updates = script;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return batch;
    }

    std::vector<int64_t> offsets() {
        std::lock_guard<std::mutex> lock(mutex_);
        return offsets_;
    }

    std::vector<Update> script;

private:
    std::atomic<bool> served_{false};
    std::mutex mutex_;
    std::vector<int64_t> offsets_;
};

Update command(int64_t update_id, int64_t from, const std::string& text) {
    Update update;
    update.update_id = update_id;
    Message msg;
    msg.message_id = update_id;
    msg.chat_id = from;
    msg.from_id = from;
    msg.text = text;
    update.message = msg;
    return update;
}

struct PollerFixture : test::DatabaseFixture {
    ScriptedTransport transport;
    AdminDirectory admins{db};
    SqliteStateStore states{db.queue()};
    PostTypeManager types{db};
    PostManager posts{db, admins};
    BackupManager backups{db, transport};
    ForumAdminHandler handler{transport, admins, states, posts, types, backups};

    PollerFixture() {
        BOOST_REQUIRE(admins.setAdmins({42, 43}));
        BOOST_REQUIRE(types.createType("Новости", "", "", "Шаблон", "").has_value());
    }

    bool waitFor(int64_t admin) {
        for (int i = 0; i < 200; i++) {
            if (states.get(admin).has_value()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(update_poller, PollerFixture)

BOOST_AUTO_TEST_CASE(dispatches_updates_and_advances_offset) {
    transport.script = {command(100, 42, "/new"), command(101, 99, "/new"), command(102, 43, "/edit")};

    UpdatePoller poller(transport, handler, 2, 0);
    poller.start();
    BOOST_TEST(poller.isRunning());
    BOOST_TEST(waitFor(42));
    BOOST_TEST(waitFor(43));
    poller.stop();
    BOOST_TEST(!poller.isRunning());

    BOOST_TEST(poller.offset() == 103);
    BOOST_TEST(states.get(42)->at(ConversationStep::NewPostSelectType));
    BOOST_TEST(states.get(43)->at(ConversationStep::EditPostEnterLink));
    BOOST_TEST(!states.get(99).has_value());

    auto offsets = transport.offsets();
    BOOST_REQUIRE(offsets.size() >= 2u);
    BOOST_TEST(offsets.front() == 0);
    BOOST_TEST(offsets.back() == 103);
}

BOOST_AUTO_TEST_CASE(update_contents_are_logged_at_debug_only) {
    Update pressed;
    pressed.update_id = 201;
    CallbackQuery query;
    query.id = "cb-201";
    query.from_id = 43;
    query.data = "select_type:987654";
    query.chat_id = 43;
    query.message_id = 500;
    pressed.callback = query;
    transport.script = {command(200, 42, "/new черновик с паролем"), pressed};

    {
        test::CapturedLog log(LogLevel::INFO);
        UpdatePoller poller(transport, handler, 1, 0);
        poller.start();
        BOOST_TEST(waitFor(42));
        poller.stop();
        BOOST_TEST(!log.contains("черновик с паролем"));
        BOOST_TEST(!log.contains("[CALLBACK]"));
        BOOST_TEST(!log.contains("[MSG]"));
    }

    ScriptedTransport second;
    second.script = {command(300, 99, "секретный текст")};
    ForumAdminHandler second_handler{second, admins, states, posts, types, backups};
    test::CapturedLog log(LogLevel::DEBUG);
    UpdatePoller poller(second, second_handler, 1, 0);
    poller.start();
    for (int i = 0; i < 200 && !log.contains("[MSG]"); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    poller.stop();
    BOOST_TEST(log.contains("[MSG] from=99 text=\"секретный текст\""));
}

BOOST_AUTO_TEST_CASE(stop_is_idempotent) {
    UpdatePoller poller(transport, handler, 1, 0);
    poller.stop();
    poller.start();
    poller.stop();
    poller.stop();
    BOOST_TEST(!poller.isRunning());
}

BOOST_AUTO_TEST_SUITE_END()
