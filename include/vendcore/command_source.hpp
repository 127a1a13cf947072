#pragma once

#include "logging.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vendcore {

using json = nlohmann::json;

// A caller that turns some outside input into controller requests. Every
// subscriber sees every request; a throwing subscriber does not stop the rest.
class CommandSource {
public:
    using Callback = std::function<void(const json&)>;

    enum class State {
        Disconnected,
        Connecting,
        Connected,
        Disconnecting,
        Error
    };

    static const char* to_string(State state) {
        switch (state) {
            case State::Disconnected: return "disconnected";
            case State::Connecting: return "connecting";
            case State::Connected: return "connected";
            case State::Disconnecting: return "disconnecting";
            case State::Error: return "error";
        }
        return "unknown";
    }

    explicit CommandSource(std::string name) : name_(std::move(name)), state_(State::Disconnected) {
        VENDCORE_LOG_DEBUG("CommandSource '{}' created", name_);
    }
    virtual ~CommandSource() = default;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    const std::string& name() const { return name_; }
    State state() const { return state_.load(); }

    void subscribe(Callback callback) {
        callbacks_.push_back(std::move(callback));
        VENDCORE_LOG_DEBUG("Callback subscribed to source '{}', total callbacks: {}", name_, callbacks_.size());
    }

protected:
    void emit(const json& request) {
        VENDCORE_LOG_TRACE("Source '{}' emitting {}", name_, request.dump());
        for (const auto& callback : callbacks_) {
            try {
                callback(request);
            } catch (const std::exception& e) {
                VENDCORE_LOG_ERROR("Callback exception in source '{}': {}", name_, e.what());
            }
        }
    }

    void set_state(State new_state) {
        auto old_state = state_.load();
        state_.store(new_state);
        VENDCORE_LOG_INFO("Source '{}' state changed: {} -> {}", name_, to_string(old_state), to_string(new_state));
    }

private:
    std::string name_;
    std::atomic<State> state_;
    std::vector<Callback> callbacks_;
};

// Calls poll() every interval on its own thread until disconnected.
// disconnect() wakes the thread instead of waiting out the interval.
class PollingCommandSource : public CommandSource {
public:
    PollingCommandSource(std::string name, std::chrono::milliseconds interval)
        : CommandSource(std::move(name))
        , polling_interval_(interval)
        , should_poll_(false) {}

    ~PollingCommandSource() override {
        stop_polling();
    }

    void connect() override {
        if (should_poll_) {
            return;
        }
        VENDCORE_LOG_INFO("Connecting polling source '{}' with interval {}ms", name(), polling_interval_.count());
        should_poll_ = true;
        set_state(State::Connected);
        start_polling();
    }

    void disconnect() override {
        if (!should_poll_) {
            return;
        }
        VENDCORE_LOG_INFO("Disconnecting polling source '{}'", name());
        stop_polling();
        set_state(State::Disconnected);
    }

    bool is_connected() const override {
        return should_poll_.load();
    }

protected:
    virtual void poll() = 0;

private:
    void start_polling() {
        polling_thread_ = std::thread([this]() {
            VENDCORE_LOG_DEBUG("Polling thread started for source '{}'", name());
            while (should_poll_.load()) {
                try {
                    poll();
                } catch (const std::exception& e) {
                    VENDCORE_LOG_ERROR("Polling error in source '{}': {}", name(), e.what());
                }
                std::unique_lock<std::mutex> lock(wake_mutex_);
                wake_.wait_for(lock, polling_interval_, [this]() { return !should_poll_.load(); });
            }
            VENDCORE_LOG_DEBUG("Polling thread stopped for source '{}'", name());
        });
    }

    void stop_polling() {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            should_poll_ = false;
        }
        wake_.notify_all();
        if (polling_thread_.joinable()) {
            VENDCORE_LOG_DEBUG("Waiting for polling thread to finish for source '{}'", name());
            polling_thread_.join();
        }
    }

    std::chrono::milliseconds polling_interval_;
    std::atomic<bool> should_poll_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread polling_thread_;
};

} // namespace vendcore
