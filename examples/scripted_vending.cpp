#include <vendcore/command_queue.hpp>
#include <vendcore/config.hpp>
#include <vendcore/logging.hpp>
#include <vendcore/machine_controller.hpp>
#include <vendcore/sources/script_source.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

// Replays a JSON-lines request script against a machine and keeps following
// the file for appended requests until the run time elapses.
int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <config.json> <requests.jsonl> [seconds]" << std::endl;
        return 2;
    }

    int seconds = 1;
    if (argc > 3) {
        try {
            std::size_t used = 0;
            seconds = std::stoi(argv[3], &used);
            if (used != std::string(argv[3]).size() || seconds < 0) {
                throw std::invalid_argument(argv[3]);
            }
        } catch (const std::logic_error&) {
            std::cerr << "seconds must be a non-negative integer, got '" << argv[3] << "'" << std::endl;
            return 2;
        }
    }

    vendcore::MachineConfig config;
    vendcore::Inventory inventory;
    try {
        config = vendcore::load_config(argv[1]);
        inventory = vendcore::build_inventory(config);
        vendcore::apply_logging(config);
    } catch (const vendcore::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    VENDCORE_LOG_INFO("=== Scripted vending session starting ===");

    vendcore::MachineController machine(std::move(inventory), config.name);
    vendcore::CommandQueue queue(machine);

    auto script = std::make_shared<vendcore::sources::ScriptSource>(
        "Script", argv[2], std::chrono::milliseconds(200));
    script->subscribe([&queue](const vendcore::json& request) {
        auto response = queue.submit(request).get();
        std::cout << request.dump() << " => " << vendcore::json(response).dump() << std::endl;
    });

    queue.start();
    script->connect();

    std::this_thread::sleep_for(std::chrono::seconds(seconds));

    script->disconnect();
    queue.stop();

    std::cout << "\nFinal status: " << vendcore::json(machine.status()).dump(2) << std::endl;

    VENDCORE_LOG_INFO("=== Scripted vending session stopped ===");
    vendcore::Logger::shutdown();
    return 0;
}
