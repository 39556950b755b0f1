#include "../../include/bots/update_poller.hpp"
#include "../../include/bots/forum_admin_handler.hpp"
#include "../../include/telegram/chat_transport.hpp"
#include "../../include/utils/logger.hpp"

#include <boost/asio/post.hpp>

#include <chrono>
#include <iomanip>
#include <sstream>

namespace forumbot {

namespace {

std::string quoted(const std::string& s) {
    std::ostringstream oss;
    oss << std::quoted(s);
    return oss.str();
}

} // namespace

UpdatePoller::UpdatePoller(ChatTransport& transport, ForumAdminHandler& handler, int worker_threads,
                           int poll_timeout_seconds)
    : transport_(transport), handler_(handler),
      worker_threads_(worker_threads > 0 ? worker_threads : 1),
      poll_timeout_(poll_timeout_seconds >= 0 ? poll_timeout_seconds : 0) {
}

UpdatePoller::~UpdatePoller() {
    stop();
}

void UpdatePoller::start() {
    if (running_.exchange(true)) return;

    pool_ = std::make_unique<boost::asio::thread_pool>(static_cast<std::size_t>(worker_threads_));
    worker_ = std::thread([this]() { pollLoop(); });
}

void UpdatePoller::stop() {
    if (!running_.exchange(false)) return;
    if (worker_.joinable()) worker_.join();
    if (pool_) {
        pool_->join();
        pool_.reset();
    }
    Logger::getInstance().info("Update poller stopped at offset " + std::to_string(offset_.load()));
}

void UpdatePoller::pollLoop() {
    Logger::getInstance().info("Update poller started (" + std::to_string(worker_threads_) + " workers)");

    while (running_) {
        UpdateBatch batch = transport_.getUpdates(offset_, poll_timeout_);
        if (!batch.ok) {
            Logger::getInstance().warning("getUpdates failed: " + batch.error);
            std::this_thread::sleep_for(std::chrono::seconds(3));
            continue;
        }

        for (const auto& update : batch.updates) {
            if (update.update_id >= offset_) {
                offset_ = update.update_id + 1;
            }
            dispatch(update);
        }
    }
}

void UpdatePoller::dispatch(const Update& update) {
    // Message bodies and callback data stay out of INFO logs.
    Logger& logger = Logger::getInstance();
    if (logger.isEnabled(LogLevel::DEBUG)) {
        if (update.message) {
            logger.debug("[MSG] from=" + std::to_string(update.message->from_id) +
                         " text=" + quoted(update.message->body()));
        } else if (update.callback) {
            logger.debug("[CALLBACK] from=" + std::to_string(update.callback->from_id) +
                         " data=" + quoted(update.callback->data));
        }
    }

    boost::asio::post(*pool_, [this, update]() {
        try {
            HandleResult result = handler_.handleUpdate(update);
            if (result == HandleResult::Failed) {
                Logger::getInstance().warning("Update " + std::to_string(update.update_id) + " failed");
            }
        } catch (const std::exception& e) {
            Logger::getInstance().error("Update " + std::to_string(update.update_id) + " crashed: " + e.what());
        }
    });
}

} // namespace forumbot
