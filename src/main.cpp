#include "bots/forum_admin_handler.hpp"
#include "bots/update_poller.hpp"
#include "config/app_config.hpp"
#include "database/db_connection.hpp"
#include "database/db_manager.hpp"
#include "services/admin_directory.hpp"
#include "services/backup_manager.hpp"
#include "services/post_manager.hpp"
#include "services/post_type_manager.hpp"
#include "state/state_store.hpp"
#include "telegram/telegram_client.hpp"
#include "utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace {

std::atomic<bool> g_stop_requested{false};

void signalHandler(int) {
    g_stop_requested = true;
}

int restoreFromFile(const std::string& db_path, const std::string& dump_path) {
    std::ifstream in(dump_path);
    if (!in) {
        forumbot::Logger::getInstance().error("Cannot read dump file " + dump_path);
        return 1;
    }
    std::stringstream sql;
    sql << in.rdbuf();

    forumbot::DatabaseConnection conn(db_path);
    if (!conn.open()) {
        forumbot::Logger::getInstance().error("Cannot open database " + db_path + ": " + conn.getLastError());
        return 1;
    }
    try {
        forumbot::BackupManager::restoreDump(conn, sql.str());
    } catch (const std::runtime_error& e) {
        forumbot::Logger::getInstance().error(std::string("Restore failed: ") + e.what());
        return 1;
    }
    forumbot::Logger::getInstance().info("Restored " + db_path + " from " + dump_path);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    forumbot::AppConfig config;
    try {
        config = forumbot::AppConfig::fromEnvironment();
    } catch (const forumbot::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    auto& logger = forumbot::Logger::getInstance();
    logger.setMinLevel(forumbot::Logger::levelFromString(config.log_level));
    // Bot API URLs carry the token.
    logger.addSecret(config.bot_token);
    if (!config.log_file.empty()) {
        logger.setLogFile(config.log_file);
    }

    // forumbot --restore backup_2024-01-01_00-00-00.sql
    if (argc > 2 && std::strcmp(argv[1], "--restore") == 0) {
        return restoreFromFile(config.db_path, argv[2]);
    }

    logger.info("Starting forum admin bot (db: " + config.db_path + ")");

    forumbot::DatabaseManager db(config.db_path, config.read_connections);
    if (!db.initialize()) {
        logger.error("Failed to initialize database " + config.db_path);
        return 1;
    }

    forumbot::TelegramClient telegram(config.bot_token, config.api_url);

    std::optional<forumbot::BotIdentity> me;
    for (int attempt = 1; attempt <= 3 && !me; attempt++) {
        me = telegram.getMe();
        if (!me) {
            logger.warning("getMe attempt " + std::to_string(attempt) + " failed");
            if (attempt < 3) std::this_thread::sleep_for(std::chrono::seconds(2));
        }
    }
    if (!me) {
        logger.error("Could not reach the Bot API, check BOT_TOKEN");
        db.shutdown();
        return 1;
    }
    logger.info("Authorized as @" + me->username + " (" + std::to_string(me->id) + ")");

    forumbot::AdminDirectory admins(db);
    if (!admins.seedFromConfig(config)) {
        logger.warning("Could not store admin settings from the environment");
    }
    if (admins.admins().empty()) {
        logger.warning("No administrators configured; every update will be ignored");
    }

    forumbot::PostTypeManager types(db);
    forumbot::PostManager posts(db, admins);
    forumbot::BackupManager backups(db, telegram);
    forumbot::SqliteStateStore states(db.queue());
    forumbot::ForumAdminHandler handler(telegram, admins, states, posts, types, backups);

    forumbot::UpdatePoller poller(telegram, handler, config.worker_threads, config.poll_timeout_seconds);
    poller.start();

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    logger.info("Shutting down...");
    poller.stop();
    db.shutdown();
    logger.info("Bye");
    return 0;
}
