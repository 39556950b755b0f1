#ifndef FORUMBOT_UPDATE_POLLER_HPP
#define FORUMBOT_UPDATE_POLLER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

#include <boost/asio/thread_pool.hpp>

namespace forumbot {

class ChatTransport;
class ForumAdminHandler;
struct Update;

// Long-polls getUpdates on its own thread and hands every update to a worker
// pool, so a slow update never holds up the ones behind it.
class UpdatePoller {
public:
    UpdatePoller(ChatTransport& transport, ForumAdminHandler& handler, int worker_threads, int poll_timeout_seconds);
    ~UpdatePoller();

    UpdatePoller(const UpdatePoller&) = delete;
    UpdatePoller& operator=(const UpdatePoller&) = delete;

    void start();
    // Stops polling and waits for the updates already handed out. Returns after
    // the current getUpdates call comes back (at most the poll timeout).
    void stop();

    bool isRunning() const { return running_; }
    int64_t offset() const { return offset_; }

private:
    void pollLoop();
    void dispatch(const Update& update);

    ChatTransport& transport_;
    ForumAdminHandler& handler_;
    int worker_threads_;
    int poll_timeout_;

    std::atomic<bool> running_{false};
    std::atomic<int64_t> offset_{0};
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::thread worker_;
};

} // namespace forumbot

#endif // FORUMBOT_UPDATE_POLLER_HPP
