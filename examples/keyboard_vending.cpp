#include <vendcore/command_queue.hpp>
#include <vendcore/config.hpp>
#include <vendcore/logging.hpp>
#include <vendcore/machine_controller.hpp>
#include <vendcore/sources/keyboard_source.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

namespace {

void show_menu(const vendcore::MachineController& machine, const vendcore::sources::KeyMap& keys) {
    std::cout << "\n=== VENDING MACHINE ===" << std::endl;
    std::cout << "Products:" << std::endl;
    auto status = machine.status();
    for (std::size_t i = 0; i < keys.buttons.size(); ++i) {
        for (const auto& product : status.inventory) {
            if (product.id == keys.buttons[i]) {
                std::cout << "  " << i + 1 << " - " << product.name << " (" << product.price
                          << ", " << product.stock << " left)" << std::endl;
            }
        }
    }
    std::cout << "\nCoins: q " << keys.quarter << ", d " << keys.dime << ", n " << keys.nickel
              << ", o " << keys.dollar << std::endl;
    std::cout << "Other: v dispense, c cancel/refund, r restock, m maintenance, s shutdown, p status, x exit"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "config/machine.json";

    vendcore::MachineConfig config;
    vendcore::Inventory inventory;
    try {
        config = vendcore::load_config(config_path);
        inventory = vendcore::build_inventory(config);
        vendcore::apply_logging(config);
    } catch (const vendcore::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    vendcore::MachineController machine(std::move(inventory), config.name);
    vendcore::CommandQueue queue(machine);

    vendcore::sources::KeyMap keys;
    for (const auto& product : config.products) {
        keys.buttons.push_back(product.id);
    }
    auto keyboard = std::make_shared<vendcore::sources::KeyboardSource>(keys);

    std::atomic<Clock::rep> last_activity{Clock::now().time_since_epoch().count()};
    keyboard->subscribe([&](const vendcore::json& request) {
        last_activity = Clock::now().time_since_epoch().count();
        auto response = queue.submit(request).get();
        std::cout << "\n" << vendcore::json(response).dump() << std::endl;
    });

    queue.start();
    show_menu(machine, keys);
    keyboard->connect();

    while (keyboard->is_connected()) {
        std::this_thread::sleep_for(100ms);

        // Abandoned transactions are refunded by the caller, not the controller.
        if (config.idle_refund_timeout.count() > 0 && machine.balance() > 0) {
            auto idle = Clock::now() - Clock::time_point(Clock::duration(last_activity.load()));
            if (idle > config.idle_refund_timeout) {
                VENDCORE_LOG_INFO("No input for {}ms, refunding", config.idle_refund_timeout.count());
                auto response = queue.submit(vendcore::json{{"command", "refund"}}).get();
                std::cout << "\n" << vendcore::json(response).dump() << std::endl;
                last_activity = Clock::now().time_since_epoch().count();
            }
        }
    }

    keyboard->disconnect();
    queue.stop();

    std::cout << "\nRecent transactions:" << std::endl;
    for (const auto& entry : machine.recent_transactions(10)) {
        std::cout << "  " << entry.command_name() << " -> " << vendcore::to_string(entry.resulting_state)
                  << " (" << entry.amount << ") " << entry.detail << std::endl;
    }

    vendcore::Logger::shutdown();
    return 0;
}
