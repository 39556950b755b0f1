#define BOOST_TEST_MODULE logger
#include <boost/test/unit_test.hpp>

#include "test_support.hpp"
#include "utils/logger.hpp"

using namespace forumbot;

BOOST_AUTO_TEST_SUITE(logger)

BOOST_AUTO_TEST_CASE(level_names) {
    BOOST_TEST((Logger::levelFromString("DEBUG") == LogLevel::DEBUG));
    BOOST_TEST((Logger::levelFromString("warn") == LogLevel::WARNING));
    BOOST_TEST((Logger::levelFromString("Error") == LogLevel::ERROR));
    BOOST_TEST((Logger::levelFromString("verbose") == LogLevel::INFO));
    BOOST_TEST(std::string(Logger::levelName(LogLevel::WARNING)) == "WARN");
}

BOOST_AUTO_TEST_CASE(line_layout) {
    BOOST_TEST(Logger::formatLine("2024-01-01 10:00:00.005", LogLevel::INFO, "7", "started") ==
               "2024-01-01 10:00:00.005 INFO  [7] started");
    BOOST_TEST(Logger::formatLine("t", LogLevel::ERROR, "7", "x") == "t ERROR [7] x");
}

BOOST_AUTO_TEST_CASE(drops_lines_below_min_level) {
    test::CapturedLog log(LogLevel::WARNING);
    Logger& logger = Logger::getInstance();
    BOOST_TEST(!logger.isEnabled(LogLevel::INFO));
    BOOST_TEST(logger.isEnabled(LogLevel::ERROR));

    logger.info("quiet line");
    logger.warning("storage slow");
    logger.error("storage gone");

    BOOST_TEST(!log.contains("quiet line"));
    BOOST_TEST(log.contains(" WARN  ["));
    BOOST_TEST(log.contains("] storage slow"));
    BOOST_TEST(log.contains(" ERROR ["));
}

BOOST_AUTO_TEST_CASE(masks_registered_secrets) {
    test::CapturedLog log(LogLevel::DEBUG);
    Logger& logger = Logger::getInstance();
    logger.addSecret("123456:ABC-token");
    logger.addSecret("");

    logger.warning("POST https://api.telegram.org/bot123456:ABC-token/sendMessage failed, "
                   "retry bot123456:ABC-token");

    BOOST_TEST(!log.contains("ABC-token"));
    BOOST_TEST(log.contains("https://api.telegram.org/bot***/sendMessage failed, retry bot***"));
}

BOOST_AUTO_TEST_CASE(empty_file_name_closes_the_file) {
    test::CapturedLog log(LogLevel::INFO);
    Logger& logger = Logger::getInstance();
    logger.info("before");
    logger.setLogFile("");
    logger.info("after");

    BOOST_TEST(log.contains("before"));
    BOOST_TEST(!log.contains("after"));
}

BOOST_AUTO_TEST_SUITE_END()
