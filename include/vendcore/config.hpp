#pragma once

#include "inventory.hpp"
#include "logging.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace vendcore {

using json = nlohmann::json;

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console = true;
    std::string file;
};

struct MachineConfig {
    std::string name = "vendcore";
    // Zero disables the caller-side idle refund.
    std::chrono::milliseconds idle_refund_timeout{0};
    LoggingConfig logging;
    std::vector<Product> products;
};

namespace detail {

template <typename T>
T value_or(const json& object, const char* key, T fallback, const std::string& where) {
    if (!object.contains(key)) {
        return fallback;
    }
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if (!object.at(key).is_number_integer()) {
            throw ConfigError(where + "." + key + " must be an integer");
        }
    }
    try {
        return object.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(where + "." + key + ": " + e.what());
    }
}

template <typename T>
T required(const json& object, const char* key, const std::string& where) {
    if (!object.contains(key)) {
        throw ConfigError(where + "." + key + " is required");
    }
    return value_or<T>(object, key, T{}, where);
}

inline spdlog::level::level_enum parse_level(const std::string& name) {
    auto level = Logger::parse_level(name);
    if (!level) {
        throw ConfigError("logging.level: unknown level '" + name + "'");
    }
    return *level;
}

} // namespace detail

inline MachineConfig parse_config(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    MachineConfig config;

    if (document.contains("machine")) {
        const auto& machine = document.at("machine");
        config.name = detail::value_or<std::string>(machine, "name", config.name, "machine");
        auto timeout = detail::value_or<std::int64_t>(machine, "idle_refund_timeout_ms", 0, "machine");
        if (timeout < 0) {
            throw ConfigError("machine.idle_refund_timeout_ms must not be negative");
        }
        config.idle_refund_timeout = std::chrono::milliseconds(timeout);
    }

    if (document.contains("logging")) {
        const auto& logging = document.at("logging");
        config.logging.level = detail::parse_level(
            detail::value_or<std::string>(logging, "level", "info", "logging"));
        config.logging.console = detail::value_or<bool>(logging, "console", true, "logging");
        config.logging.file = detail::value_or<std::string>(logging, "file", "", "logging");
    }

    if (!document.contains("products") || !document.at("products").is_array()) {
        throw ConfigError("products must be an array");
    }
    for (std::size_t i = 0; i < document.at("products").size(); ++i) {
        const auto& entry = document.at("products").at(i);
        auto where = "products[" + std::to_string(i) + "]";
        Product product;
        product.id = detail::required<std::string>(entry, "id", where);
        product.name = detail::value_or<std::string>(entry, "name", product.id, where);
        product.price = detail::required<Amount>(entry, "price", where);
        product.stock = detail::value_or<std::int64_t>(entry, "stock", 0, where);
        product.capacity = detail::value_or<std::int64_t>(entry, "capacity", product.stock, where);
        config.products.push_back(std::move(product));
    }

    return config;
}

inline MachineConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open configuration file '" + path + "'");
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("configuration file '" + path + "': " + e.what());
    }

    VENDCORE_LOG_DEBUG("Loaded configuration from {}", path);
    return parse_config(document);
}

inline Inventory build_inventory(const MachineConfig& config) {
    try {
        return Inventory(config.products);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("products: ") + e.what());
    }
}

inline void apply_logging(const MachineConfig& config) {
    try {
        Logger::initialize(config.name, config.logging.level, config.logging.console, config.logging.file);
    } catch (const spdlog::spdlog_ex& e) {
        throw ConfigError("logging.file: " + std::string(e.what()));
    }
}

} // namespace vendcore
