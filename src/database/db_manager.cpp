#include "../../include/database/db_manager.hpp"
#include "../../include/database/schema.hpp"
#include "../../include/utils/logger.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace forumbot {

DatabaseManager::DatabaseManager(const std::string& db_path, int read_connections)
    : db_path_(db_path), read_connections_(read_connections) {
}

DatabaseManager::~DatabaseManager() {
    shutdown();
}

bool DatabaseManager::initialize() {
    if (queue_) {
        return true;
    }

    auto writer = std::make_unique<DatabaseConnection>(db_path_, DatabaseConnection::Mode::ReadWrite);
    if (!writer->open()) {
        Logger::getInstance().error("Failed to open database " + db_path_);
        return false;
    }

    // A private in-memory database exists only on its own connection, so reads share the writer.
    std::vector<std::unique_ptr<DatabaseConnection>> readers;
    if (!writer->isMemory()) {
        for (int i = 0; i < read_connections_; i++) {
            auto reader = std::make_unique<DatabaseConnection>(db_path_, DatabaseConnection::Mode::ReadOnly);
            if (!reader->open()) {
                Logger::getInstance().error("Failed to open reader connection " + std::to_string(i) + " for " + db_path_);
                return false;
            }
            readers.push_back(std::move(reader));
        }
    }

    try {
        queue_ = std::make_unique<WriteQueue>(std::move(writer), std::move(readers));
        queue_->execute([](DatabaseConnection& conn) { Schema::apply(conn); });
    } catch (const std::runtime_error& e) {
        Logger::getInstance().error(std::string("Database initialization failed: ") + e.what());
        queue_.reset();
        return false;
    }

    Logger::getInstance().info("Database ready: " + db_path_);
    return true;
}

void DatabaseManager::shutdown() {
    if (queue_) {
        queue_->close();
    }
}

WriteQueue& DatabaseManager::queue() {
    if (!queue_) {
        throw std::logic_error("DatabaseManager used before initialize()");
    }
    return *queue_;
}

std::string joinIds(const std::vector<int64_t>& ids) {
    std::ostringstream oss;
    for (size_t i = 0; i < ids.size(); i++) {
        if (i > 0) oss << ",";
        oss << ids[i];
    }
    return oss.str();
}

} // namespace forumbot
