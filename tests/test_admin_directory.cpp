#define BOOST_TEST_MODULE admin_directory
#include <boost/test/unit_test.hpp>

#include "test_support.hpp"
#include "config/app_config.hpp"
#include "services/admin_directory.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace forumbot;

namespace {

struct DirectoryFixture : test::DatabaseFixture {
    AdminDirectory admins{db};
};

} // namespace

BOOST_AUTO_TEST_SUITE(id_lists)

BOOST_AUTO_TEST_CASE(parses_comma_separated_ids) {
    std::vector<int64_t> expected = {1, -1002, 30};
    BOOST_TEST(parseIdList(" 1, -1002 ,30 ") == expected, boost::test_tools::per_element());
    BOOST_TEST(parseIdList("").empty());
    BOOST_TEST(parseIdList("5,,6").size() == 2u);
}

BOOST_AUTO_TEST_CASE(rejects_garbage) {
    BOOST_CHECK_THROW(parseIdList("12,abc"), ConfigError);
    BOOST_CHECK_THROW(parseIdList("12x"), ConfigError);
    BOOST_CHECK_THROW(parseIdList("99999999999999999999999"), ConfigError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(admin_directory, DirectoryFixture)

BOOST_AUTO_TEST_CASE(nobody_is_admin_on_an_empty_store) {
    BOOST_TEST(!admins.isAdmin(42));
    BOOST_TEST(admins.admins().empty());
    BOOST_TEST(!admins.forumTarget().isConfigured());
}

BOOST_AUTO_TEST_CASE(set_add_and_remove) {
    BOOST_REQUIRE(admins.setAdmins({42, 43}));
    BOOST_TEST(admins.isAdmin(42));
    BOOST_TEST(admins.isAdmin(43));
    BOOST_TEST(!admins.isAdmin(44));

    BOOST_REQUIRE(admins.addAdmin(44));
    BOOST_REQUIRE(admins.addAdmin(44));
    BOOST_TEST(admins.admins().size() == 3u);

    BOOST_REQUIRE(admins.removeAdmin(43));
    BOOST_TEST(!admins.isAdmin(43));
    BOOST_TEST(admins.isAdmin(44));
}

BOOST_AUTO_TEST_CASE(forum_target_round_trip) {
    BOOST_REQUIRE(admins.setForumTarget(-1001234567890, 15));
    ForumTarget target = admins.forumTarget();
    BOOST_TEST(target.chat_id == -1001234567890);
    BOOST_TEST(target.topic_id == 15);

    BOOST_REQUIRE(admins.setTopic(0));
    BOOST_TEST(admins.forumTarget().topic_id == 0);
    BOOST_TEST(admins.forumTarget().chat_id == -1001234567890);
}

BOOST_AUTO_TEST_CASE(environment_values_overwrite_stored_ones) {
    BOOST_REQUIRE(admins.setAdmins({1}));
    BOOST_REQUIRE(admins.setForumTarget(-100500, 9));

    AppConfig config;
    config.admin_ids_raw = "42,43";
    config.forum_chat_id_raw = "-1009999";
    BOOST_REQUIRE(admins.seedFromConfig(config));

    BOOST_TEST(admins.isAdmin(42));
    BOOST_TEST(!admins.isAdmin(1));
    BOOST_TEST(admins.forumTarget().chat_id == -1009999);
    // TOPIC_ID was not set, so the stored topic stays.
    BOOST_TEST(admins.forumTarget().topic_id == 9);
}

BOOST_AUTO_TEST_CASE(empty_environment_leaves_store_alone) {
    BOOST_REQUIRE(admins.setAdmins({7}));
    BOOST_REQUIRE(admins.seedFromConfig(AppConfig{}));
    BOOST_TEST(admins.isAdmin(7));
}

BOOST_AUTO_TEST_CASE(admin_config_is_read_from_one_save) {
    AdminConfig first;
    first.admin_ids = {1};
    first.forum_chat_id = -1001;
    first.topic_id = 1;
    AdminConfig second;
    second.admin_ids = {2};
    second.forum_chat_id = -1002;
    second.topic_id = 2;
    BOOST_REQUIRE(db.saveAdminConfig(first));

    std::atomic<bool> done{false};
    std::atomic<int> failed_saves{0};
    std::thread writer([&]() {
        for (int i = 0; i < 200; i++) {
            if (!db.saveAdminConfig(i % 2 == 0 ? second : first)) failed_saves++;
        }
        done = true;
    });

    int mixed = 0;
    int reads = 0;
    while (!done || reads == 0) {
        AdminConfig seen = db.getAdminConfig();
        reads++;
        if (seen.admin_ids.size() != 1u || seen.forum_chat_id != -1000 - seen.topic_id ||
            seen.admin_ids.front() != seen.topic_id) {
            mixed++;
        }
    }
    writer.join();
    BOOST_TEST(failed_saves == 0);
    BOOST_TEST(mixed == 0);
    BOOST_TEST(reads > 0);
}

BOOST_AUTO_TEST_CASE(writes_fail_after_shutdown) {
    BOOST_REQUIRE(admins.setAdmins({42}));
    BOOST_TEST(admins.isAdmin(42));
    // Writes fail once the queue is closed, reads keep working.
    db.shutdown();
    BOOST_TEST(!admins.setAdmins({42, 43}));
    BOOST_TEST(admins.isAdmin(42));
}

BOOST_AUTO_TEST_SUITE_END()
