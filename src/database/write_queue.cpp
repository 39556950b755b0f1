#include "../../include/database/write_queue.hpp"
#include "../../include/utils/logger.hpp"

namespace forumbot {

WriteQueue::WriteQueue(std::unique_ptr<DatabaseConnection> writer,
                       std::vector<std::unique_ptr<DatabaseConnection>> readers)
    : writer_(std::move(writer)) {
    if (!writer_ || !writer_->isOpen()) {
        throw DatabaseError("write queue needs an open writer connection", 21); // SQLITE_MISUSE
    }
    for (auto& reader : readers) {
        if (!reader || !reader->isOpen()) {
            throw DatabaseError("write queue got a closed reader connection", 21);
        }
        auto slot = std::make_unique<ReaderSlot>();
        slot->conn = std::move(reader);
        readers_.push_back(std::move(slot));
    }

    worker_ = std::thread([this]() { run(); });
    Logger::getInstance().info("WriteQueue started with " + std::to_string(readers_.size()) + " reader connection(s)");
}

WriteQueue::~WriteQueue() {
    close();
}

void WriteQueue::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (closed_) {
            throw QueueClosedError();
        }
        jobs_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void WriteQueue::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this]() { return closed_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                break;
            }
            task = std::move(jobs_.front());
            jobs_.pop_front();
        }
        task();
    }
    Logger::getInstance().debug("WriteQueue worker exited");
}

void WriteQueue::close() {
    size_t left = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!closed_) {
            closed_ = true;
            left = jobs_.size();
            Logger::getInstance().info("WriteQueue closing, draining " + std::to_string(left) + " job(s)");
        }
    }
    cv_.notify_all();

    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool WriteQueue::isClosed() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return closed_;
}

size_t WriteQueue::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return jobs_.size();
}

WriteQueue::ReaderSlot* WriteQueue::pickReader() {
    if (readers_.empty()) {
        return nullptr;
    }
    const size_t idx = next_reader_.fetch_add(1, std::memory_order_relaxed) % readers_.size();
    return readers_[idx].get();
}

void WriteQueue::rollbackQuietly(DatabaseConnection& conn) {
    try {
        conn.rollback();
    } catch (const DatabaseError& e) {
        Logger::getInstance().warning(std::string("WriteQueue rollback failed: ") + e.what());
    }
}

} // namespace forumbot
