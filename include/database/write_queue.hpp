#ifndef FORUMBOT_WRITE_QUEUE_HPP
#define FORUMBOT_WRITE_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "db_connection.hpp"

namespace forumbot {

// Serializes every mutation of the store onto one worker thread.
//
// Jobs run strictly in submission order, one at a time, each inside its own
// BEGIN IMMEDIATE ... COMMIT on the writer connection. A job that throws is
// rolled back and its exception reaches only its own future; the jobs after
// it still run. Nothing is retried.
//
// Reads bypass the FIFO and run on a pool of reader connections, so they can
// overlap each other and the write in flight (WAL). An in-memory database has
// no separate readers: reads then share the writer and wait for the current job.
class WriteQueue {
public:
    WriteQueue(std::unique_ptr<DatabaseConnection> writer,
               std::vector<std::unique_ptr<DatabaseConnection>> readers);
    ~WriteQueue();

    WriteQueue(const WriteQueue&) = delete;
    WriteQueue& operator=(const WriteQueue&) = delete;

    // Throws QueueClosedError once close() has started.
    template <typename Job>
    auto submit(Job&& job) -> std::future<std::invoke_result_t<std::decay_t<Job>&, DatabaseConnection&>>;

    // submit() and wait. Rethrows the job's exception.
    template <typename Job>
    auto execute(Job&& job) -> std::invoke_result_t<std::decay_t<Job>&, DatabaseConnection&> {
        return submit(std::forward<Job>(job)).get();
    }

    // Must not be called from inside a write job.
    template <typename Fn>
    auto read(Fn&& fn) -> std::invoke_result_t<Fn&, DatabaseConnection&>;

    // Like read(), but inside one read transaction so every statement sees the same snapshot.
    template <typename Fn>
    auto readSnapshot(Fn&& fn) -> std::invoke_result_t<Fn&, DatabaseConnection&>;

    // Stops accepting jobs, drains the ones already accepted, joins the worker. Idempotent.
    void close();
    bool isClosed() const;
    size_t pending() const;
    size_t readerCount() const { return readers_.size(); }

private:
    struct ReaderSlot {
        std::unique_ptr<DatabaseConnection> conn;
        std::mutex mutex;
    };

    void enqueue(std::function<void()> task);
    void run();
    ReaderSlot* pickReader();
    void rollbackQuietly(DatabaseConnection& conn);

    std::unique_ptr<DatabaseConnection> writer_;
    std::mutex writer_mutex_;
    std::vector<std::unique_ptr<ReaderSlot>> readers_;
    std::atomic<size_t> next_reader_{0};

    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    bool closed_ = false;

    std::mutex join_mutex_;
    std::thread worker_;
};

template <typename Job>
auto WriteQueue::submit(Job&& job) -> std::future<std::invoke_result_t<std::decay_t<Job>&, DatabaseConnection&>> {
    using Result = std::invoke_result_t<std::decay_t<Job>&, DatabaseConnection&>;

    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    auto body = std::make_shared<std::decay_t<Job>>(std::forward<Job>(job));

    enqueue([this, promise, body]() {
        std::lock_guard<std::mutex> lock(writer_mutex_);
        try {
            writer_->begin(true);
            if constexpr (std::is_void_v<Result>) {
                (*body)(*writer_);
                writer_->commit();
                promise->set_value();
            } else {
                Result value = (*body)(*writer_);
                writer_->commit();
                promise->set_value(std::move(value));
            }
        } catch (...) {
            rollbackQuietly(*writer_);
            promise->set_exception(std::current_exception());
        }
    });
    return future;
}

template <typename Fn>
auto WriteQueue::read(Fn&& fn) -> std::invoke_result_t<Fn&, DatabaseConnection&> {
    ReaderSlot* slot = pickReader();
    if (!slot) {
        std::lock_guard<std::mutex> lock(writer_mutex_);
        return fn(*writer_);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return fn(*slot->conn);
}

template <typename Fn>
auto WriteQueue::readSnapshot(Fn&& fn) -> std::invoke_result_t<Fn&, DatabaseConnection&> {
    using Result = std::invoke_result_t<Fn&, DatabaseConnection&>;
    return read([&fn, this](DatabaseConnection& conn) -> Result {
        conn.begin(false);
        try {
            if constexpr (std::is_void_v<Result>) {
                fn(conn);
                conn.commit();
            } else {
                Result value = fn(conn);
                conn.commit();
                return value;
            }
        } catch (...) {
            rollbackQuietly(conn);
            throw;
        }
    });
}

} // namespace forumbot

#endif // FORUMBOT_WRITE_QUEUE_HPP
