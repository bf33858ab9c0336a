#ifndef KEYWARD_SERVICE_APPROVAL_POLLER_HPP
#define KEYWARD_SERVICE_APPROVAL_POLLER_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace keyward {
namespace service {

/**
 * @brief Background thread that calls a tick function at a fixed interval
 *
 * The thread ends when the tick returns false or stop() is called. A tick
 * that throws is reported through the error handler and polling continues.
 */
class ApprovalPoller {
public:
    using Tick = std::function<bool()>;
    using ErrorHandler = std::function<void(const std::string&)>;

    ApprovalPoller() = default;
    ~ApprovalPoller();

    ApprovalPoller(const ApprovalPoller&) = delete;
    ApprovalPoller& operator=(const ApprovalPoller&) = delete;

    /**
     * @brief Start polling; a no-op while already running
     *
     * Must not be called from inside a tick.
     */
    void start(std::chrono::milliseconds interval, Tick tick);

    /**
     * @brief Stop and join; must not be called from inside a tick
     */
    void stop();

    bool running() const;
    void set_error_handler(ErrorHandler handler);

private:
    void run(std::chrono::milliseconds interval, Tick tick);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    bool stop_requested_ = false;
    bool running_ = false;
    ErrorHandler on_error_;
};

} // namespace service
} // namespace keyward

#endif // KEYWARD_SERVICE_APPROVAL_POLLER_HPP
