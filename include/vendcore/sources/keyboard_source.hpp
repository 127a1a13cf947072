#pragma once

#include "../command_source.hpp"
#include "../types.hpp"
#include <sys/select.h>
#include <termios.h>
#include <unistd.h>
#include <fcntl.h>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace vendcore::sources {

// Coin values are in the same unit as product prices.
struct KeyMap {
    Amount quarter = 25;
    Amount dime = 10;
    Amount nickel = 5;
    Amount dollar = 100;
    std::vector<ProductId> buttons; // '1' selects buttons[0]
};

// Raw-mode terminal reader. Keys:
//   q/d/n/o  insert coin          1-9  select product
//   v        dispense             c    cancel (refund)
//   r        restock              m    maintenance
//   s        shutdown             p    status
//   x        stop reading input
class KeyboardSource : public CommandSource {
public:
    explicit KeyboardSource(KeyMap keys, std::string name = "Keyboard")
        : CommandSource(std::move(name))
        , keys_(std::move(keys))
        , should_run_(false)
        , exit_requested_(false) {}

    ~KeyboardSource() override {
        disconnect();
    }

    static std::optional<json> request_for_key(char key, const KeyMap& keys) {
        switch (key) {
            case 'q': case 'Q':
                return json{{"command", "insert_coin"}, {"amount", keys.quarter}};
            case 'd': case 'D':
                return json{{"command", "insert_coin"}, {"amount", keys.dime}};
            case 'n': case 'N':
                return json{{"command", "insert_coin"}, {"amount", keys.nickel}};
            case 'o': case 'O':
                return json{{"command", "insert_coin"}, {"amount", keys.dollar}};
            case 'v': case 'V':
                return json{{"command", "dispense"}};
            case 'c': case 'C':
                return json{{"command", "refund"}};
            case 'r': case 'R':
                return json{{"command", "restock"}};
            case 'm': case 'M':
                return json{{"command", "enter_maintenance"}};
            case 's': case 'S':
                return json{{"command", "shutdown"}};
            case 'p': case 'P':
                return json{{"command", "status"}};
            default:
                break;
        }

        if (key >= '1' && key <= '9') {
            auto index = static_cast<std::size_t>(key - '1');
            if (index < keys.buttons.size()) {
                return json{{"command", "select_product"}, {"product", keys.buttons[index]}};
            }
        }
        return std::nullopt;
    }

    void connect() override {
        if (should_run_) {
            return;
        }
        set_state(State::Connecting);

        if (tcgetattr(STDIN_FILENO, &old_termios_) != 0) {
            VENDCORE_LOG_ERROR("Source '{}': failed to get terminal attributes", name());
            set_state(State::Error);
            return;
        }

        termios raw = old_termios_;
        raw.c_lflag &= ~(ICANON | ECHO);
        raw.c_cc[VMIN] = 0;
        raw.c_cc[VTIME] = 0;
        if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
            VENDCORE_LOG_ERROR("Source '{}': failed to set terminal attributes", name());
            set_state(State::Error);
            return;
        }

        int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
        fcntl(STDIN_FILENO, F_SETFL, flags | O_NONBLOCK);

        should_run_ = true;
        exit_requested_ = false;
        set_state(State::Connected);

        input_thread_ = std::thread([this]() {
            process_input();
        });
    }

    void disconnect() override {
        if (state() != State::Connected) {
            return;
        }
        set_state(State::Disconnecting);
        should_run_ = false;

        if (input_thread_.joinable()) {
            input_thread_.join();
        }

        tcsetattr(STDIN_FILENO, TCSANOW, &old_termios_);
        int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
        fcntl(STDIN_FILENO, F_SETFL, flags & ~O_NONBLOCK);

        set_state(State::Disconnected);
    }

    bool is_connected() const override {
        return should_run_.load();
    }

    bool exit_requested() const { return exit_requested_.load(); }

private:
    void process_input() {
        while (should_run_) {
            fd_set fds;
            FD_ZERO(&fds);
            FD_SET(STDIN_FILENO, &fds);

            timeval timeout = {0, 100000}; // 100ms
            if (select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &timeout) > 0) {
                char ch;
                if (read(STDIN_FILENO, &ch, 1) == 1) {
                    handle_key(ch);
                }
            }
        }
    }

    void handle_key(char ch) {
        if (ch == 'x' || ch == 'X') {
            exit_requested_ = true;
            should_run_ = false;
            return;
        }
        if (auto request = request_for_key(ch, keys_)) {
            emit(*request);
        } else {
            VENDCORE_LOG_DEBUG("Source '{}' ignored key {}", name(), static_cast<int>(ch));
        }
    }

    KeyMap keys_;
    std::atomic<bool> should_run_;
    std::atomic<bool> exit_requested_;
    std::thread input_thread_;
    termios old_termios_{};
};

} // namespace vendcore::sources
