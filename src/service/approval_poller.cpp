#include "approval_poller.hpp"

#include <iostream>

namespace keyward {
namespace service {

ApprovalPoller::~ApprovalPoller() {
    stop();
}

void ApprovalPoller::start(std::chrono::milliseconds interval, Tick tick) {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return;
        // A thread that ended on its own still needs joining
        finished = std::move(thread_);
        stop_requested_ = false;
        running_ = true;
    }
    if (finished.joinable()) finished.join();

    std::lock_guard<std::mutex> lock(mutex_);
    thread_ = std::thread(&ApprovalPoller::run, this, interval, std::move(tick));
}

void ApprovalPoller::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        worker = std::move(thread_);
    }
    cv_.notify_all();
    if (worker.joinable()) worker.join();
}

bool ApprovalPoller::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void ApprovalPoller::set_error_handler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_error_ = std::move(handler);
}

void ApprovalPoller::run(std::chrono::milliseconds interval, Tick tick) {
    for (;;) {
        ErrorHandler on_error;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval, [this] { return stop_requested_; })) break;
            on_error = on_error_;
        }

        bool more = true;
        try {
            more = tick();
        } catch (const std::exception& e) {
            if (on_error) {
                on_error(e.what());
            } else {
                std::cerr << "WARNING: approval poll failed: " << e.what() << std::endl;
            }
        }
        if (!more) break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

} // namespace service
} // namespace keyward
