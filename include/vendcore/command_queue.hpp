#pragma once

#include "logging.hpp"
#include "machine_controller.hpp"
#include "protocol.hpp"
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>

namespace vendcore {

class QueueStoppedError : public std::runtime_error {
public:
    QueueStoppedError() : std::runtime_error("command queue is stopped") {}
};

// Single-consumer queue in front of a controller: any thread may submit,
// one worker executes requests in submission order.
class CommandQueue {
public:
    explicit CommandQueue(MachineController& machine) : machine_(machine), running_(false), stopped_(false) {
        VENDCORE_LOG_DEBUG("CommandQueue created for '{}'", machine_.name());
    }

    ~CommandQueue() {
        VENDCORE_LOG_DEBUG("CommandQueue destructor called");
        stop();
    }

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // Requests submitted before start() wait for the worker. After stop() the
    // returned future holds QueueStoppedError until the queue is restarted.
    std::future<Response> submit(json request) {
        Pending pending{std::move(request), std::promise<Response>{}};
        auto future = pending.promise.get_future();
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stopped_) {
                VENDCORE_LOG_WARN("Request refused, CommandQueue is stopped: {}", pending.request.dump());
                pending.promise.set_exception(std::make_exception_ptr(QueueStoppedError()));
                return future;
            }
            queue_.push(std::move(pending));
            VENDCORE_LOG_TRACE("Request queued, queue size: {}", queue_.size());
        }
        queue_cv_.notify_one();
        return future;
    }

    void start() {
        if (running_) {
            return;
        }
        VENDCORE_LOG_INFO("Starting CommandQueue");
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stopped_ = false;
            running_ = true;
        }
        worker_ = std::thread([this]() {
            process_requests();
        });
    }

    // Requests still queued when the worker exits are executed before stop()
    // returns, so no submitted future is left without a value.
    void stop() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
            stopped_ = true;
        }
        VENDCORE_LOG_INFO("Stopping CommandQueue");
        queue_cv_.notify_all();

        if (worker_.joinable()) {
            VENDCORE_LOG_DEBUG("Waiting for worker thread to finish");
            worker_.join();
        }
        VENDCORE_LOG_INFO("CommandQueue stopped");
    }

    std::size_t pending() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return queue_.size();
    }

    bool is_running() const { return running_.load(); }

private:
    struct Pending {
        json request;
        std::promise<Response> promise;
    };

    void process_requests() {
        VENDCORE_LOG_DEBUG("Command worker thread started");
        std::unique_lock<std::mutex> lock(queue_mutex_);
        while (true) {
            queue_cv_.wait(lock, [this]() { return !queue_.empty() || !running_; });

            while (!queue_.empty()) {
                auto pending = std::move(queue_.front());
                queue_.pop();
                VENDCORE_LOG_TRACE("Processing request, remaining: {}", queue_.size());
                lock.unlock();

                process_request(pending);

                lock.lock();
            }

            if (!running_) {
                break;
            }
        }
        VENDCORE_LOG_DEBUG("Command worker thread exiting");
    }

    void process_request(Pending& pending) {
        try {
            pending.promise.set_value(execute(machine_, pending.request));
        } catch (const std::exception& e) {
            VENDCORE_LOG_ERROR("Exception processing request {}: {}", pending.request.dump(), e.what());
            pending.promise.set_exception(std::current_exception());
        }
    }

    MachineController& machine_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<Pending> queue_;
    std::atomic<bool> running_;
    bool stopped_;
    std::thread worker_;
};

} // namespace vendcore
