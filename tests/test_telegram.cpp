#define BOOST_TEST_MODULE telegram
#include <boost/test/unit_test.hpp>

#include "telegram/entities.hpp"
#include "telegram/telegram_client.hpp"
#include "utils/json_parser.hpp"
#include "utils/logger.hpp"

using namespace forumbot;

namespace {

struct QuietLogs {
    QuietLogs() { Logger::getInstance().setMinLevel(LogLevel::ERROR); }
};

} // namespace

BOOST_GLOBAL_FIXTURE(QuietLogs);

BOOST_AUTO_TEST_SUITE(entities)

BOOST_AUTO_TEST_CASE(utf16_length_counts_code_units) {
    BOOST_TEST(utf16Length("") == 0);
    BOOST_TEST(utf16Length("Hello") == 5);
    BOOST_TEST(utf16Length("Привет") == 6);
    // Emoji outside the BMP take a surrogate pair.
    BOOST_TEST(utf16Length("📰") == 2);
    BOOST_TEST(utf16Length("Шаблон для типа \"📰\":\n\n") == 23);
}

BOOST_AUTO_TEST_CASE(parse_and_serialize) {
    auto parsed = parseEntities(
        R"([{"type":"bold","offset":0,"length":5},)"
        R"({"type":"text_link","offset":6,"length":4,"url":"https://example.com"},)"
        R"({"type":"text_mention","offset":11,"length":3,"user":{"id":42,"is_bot":false}}])");
    BOOST_REQUIRE_EQUAL(parsed.size(), 3u);
    BOOST_TEST(parsed[0].type == "bold");
    BOOST_TEST(parsed[1].url == "https://example.com");
    BOOST_TEST(parsed[2].user_id == 42);

    const std::string json = serializeEntities(parsed);
    BOOST_TEST(json.find("\"offset\":6") != std::string::npos);
    BOOST_TEST(json.find("\"user\":{\"id\":42}") != std::string::npos);
    BOOST_TEST((parseEntities(json) == parsed));
}

BOOST_AUTO_TEST_CASE(empty_and_malformed_inputs) {
    BOOST_TEST(parseEntities("").empty());
    BOOST_TEST(parseEntities("[").empty());
    BOOST_TEST(serializeEntities({}).empty());
    BOOST_TEST(shiftEntities("", 10).empty());
}

BOOST_AUTO_TEST_CASE(shift_moves_offsets_only) {
    const std::string shifted = shiftEntities(R"([{"type":"italic","offset":2,"length":3}])", 20);
    auto entities = parseEntities(shifted);
    BOOST_REQUIRE_EQUAL(entities.size(), 1u);
    BOOST_TEST(entities[0].offset == 22);
    BOOST_TEST(entities[0].length == 3);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(updates)

BOOST_AUTO_TEST_CASE(parses_messages_and_callbacks) {
    const std::string body = R"({"ok":true,"result":[
        {"update_id":100,"message":{"message_id":5,"from":{"id":42,"is_bot":false},
            "chat":{"id":42,"type":"private"},"text":"/new@forum_bot",
            "entities":[{"type":"bot_command","offset":0,"length":14}]}},
        {"update_id":101,"callback_query":{"id":"cb-1","from":{"id":42},
            "message":{"message_id":77,"chat":{"id":42}},"data":"select_type:7"}},
        {"update_id":102,"message":{"message_id":6,"from":{"id":42},"chat":{"id":42},
            "photo":[{"file_id":"small","width":90},{"file_id":"large","width":1280}],
            "caption":"Фото"}},
        {"update_id":103,"edited_message":{"message_id":6}}
    ]})";

    UpdateBatch batch = TelegramClient::parseUpdates(body);
    BOOST_REQUIRE(batch.ok);
    BOOST_REQUIRE_EQUAL(batch.updates.size(), 4u);

    const Update& cmd = batch.updates[0];
    BOOST_REQUIRE(cmd.message.has_value());
    BOOST_TEST(cmd.message->isCommand());
    BOOST_TEST(cmd.senderId() == 42);
    BOOST_TEST(!cmd.message->entities.empty());

    const Update& cb = batch.updates[1];
    BOOST_REQUIRE(cb.callback.has_value());
    BOOST_TEST(cb.callback->id == "cb-1");
    BOOST_TEST(cb.callback->data == "select_type:7");
    BOOST_TEST(cb.callback->chat_id == 42);
    BOOST_TEST(cb.callback->message_id == 77);

    const Update& photo = batch.updates[2];
    BOOST_REQUIRE(photo.message.has_value());
    BOOST_TEST(photo.message->hasPhoto());
    BOOST_TEST(photo.message->photo_id == "large");
    BOOST_TEST(photo.message->body() == "Фото");

    // Kinds the bot does not handle still advance the offset.
    const Update& edited = batch.updates[3];
    BOOST_TEST(edited.update_id == 103);
    BOOST_TEST(edited.senderId() == 0);
}

BOOST_AUTO_TEST_CASE(reports_api_errors) {
    UpdateBatch denied = TelegramClient::parseUpdates(R"({"ok":false,"error_code":401,"description":"Unauthorized"})");
    BOOST_TEST(!denied.ok);
    BOOST_TEST(denied.error == "Unauthorized");

    UpdateBatch garbage = TelegramClient::parseUpdates("<html>bad gateway</html>");
    BOOST_TEST(!garbage.ok);
    BOOST_TEST(!garbage.error.empty());
}

BOOST_AUTO_TEST_CASE(keyboard_markup) {
    BOOST_TEST(TelegramClient::keyboardJson({}).empty());
    InlineKeyboard keyboard = {{{"✅ Да", "confirm_post"}, {"Нет \"совсем\"", "cancel"}}};
    BOOST_TEST(TelegramClient::keyboardJson(keyboard) ==
               R"({"inline_keyboard":[[{"text":"✅ Да","callback_data":"confirm_post"},)"
               R"({"text":"Нет \"совсем\"","callback_data":"cancel"}]]})");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(json_parser)

BOOST_AUTO_TEST_CASE(escapes_control_characters) {
    BOOST_TEST(JsonParser::escapeJson("line\n\"quoted\"\\tab\t") == "line\\n\\\"quoted\\\"\\\\tab\\t");
    BOOST_TEST(JsonParser::escapeJson(std::string("\x01\r", 2)) == "\\u0001\\r");
    BOOST_TEST(JsonParser::escapeJson("Новости 📰") == "Новости 📰");
}

BOOST_AUTO_TEST_CASE(quote_wraps_escaped_text) {
    BOOST_TEST(JsonParser::quote("a\"b") == "\"a\\\"b\"");
    BOOST_TEST(JsonParser::quote("") == "\"\"");
}

BOOST_AUTO_TEST_SUITE_END()
