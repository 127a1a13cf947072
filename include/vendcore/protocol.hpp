#pragma once

#include "errors.hpp"
#include "logging.hpp"
#include "machine_controller.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace vendcore {

using json = nlohmann::json;

// Request/response mapping for callers outside the process. Every
// controller call is one request {"command": ..., args} answered by one
// response {"ok", "error", "detail", "result"}.
struct Response {
    bool ok = true;
    std::string error;
    std::string detail;
    json result = json::object();
};

inline void to_json(json& j, const Product& product) {
    j = json{{"id", product.id},
             {"name", product.name},
             {"price", product.price},
             {"stock", product.stock},
             {"capacity", product.capacity}};
}

inline void to_json(json& j, const TransactionLogEntry& entry) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()).count();
    j = json{{"timestamp_ms", millis},
             {"command", entry.command_name()},
             {"state", to_string(entry.resulting_state)},
             {"amount", entry.amount},
             {"detail", entry.detail}};
}

inline void to_json(json& j, const MachineStatus& status) {
    j = json{{"state", to_string(status.state)},
             {"balance", status.balance},
             {"selection", status.selection ? json(*status.selection) : json(nullptr)},
             {"inventory", status.inventory}};
}

inline void to_json(json& j, const Response& response) {
    j = json{{"ok", response.ok}, {"result", response.result}};
    if (!response.ok) {
        j["error"] = response.error;
        j["detail"] = response.detail;
    }
}

enum class RequestType {
    INSERT_COIN,
    SELECT_PRODUCT,
    DISPENSE,
    REFUND,
    RESTOCK,
    ENTER_MAINTENANCE,
    SHUTDOWN,
    STATUS,
    RECENT_TRANSACTIONS,
    UNKNOWN
};

inline RequestType string_to_request_type(const std::string& type) {
    static const std::unordered_map<std::string, RequestType> type_map = {
        {"insert_coin", RequestType::INSERT_COIN},
        {"select_product", RequestType::SELECT_PRODUCT},
        {"dispense", RequestType::DISPENSE},
        {"refund", RequestType::REFUND},
        {"restock", RequestType::RESTOCK},
        {"enter_maintenance", RequestType::ENTER_MAINTENANCE},
        {"shutdown", RequestType::SHUTDOWN},
        {"status", RequestType::STATUS},
        {"recent_transactions", RequestType::RECENT_TRANSACTIONS}
    };

    auto it = type_map.find(type);
    return (it != type_map.end()) ? it->second : RequestType::UNKNOWN;
}

// A request argument of the wrong shape. Reported as malformed_request.
class MalformedRequestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace detail {

// Only JSON integers that fit an Amount are accepted; floats are never
// truncated.
inline std::int64_t integer_arg(const json& value, const std::string& name) {
    if (!value.is_number_integer()) {
        throw MalformedRequestError("'" + name + "' must be an integer");
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw MalformedRequestError("'" + name + "' is out of range");
    }
    return value.get<std::int64_t>();
}

inline RestockPlan restock_plan_arg(const json& products) {
    if (!products.is_object()) {
        throw MalformedRequestError("'products' must map product ids to quantities");
    }
    RestockPlan plan;
    for (auto it = products.begin(); it != products.end(); ++it) {
        plan[it.key()] = integer_arg(it.value(), "products." + it.key());
    }
    return plan;
}

inline std::size_t count_arg(const json& request, std::size_t fallback) {
    if (!request.contains("count")) {
        return fallback;
    }
    auto count = integer_arg(request.at("count"), "count");
    if (count < 0) {
        throw MalformedRequestError("'count' must not be negative");
    }
    return static_cast<std::size_t>(count);
}

} // namespace detail

inline Response failure(std::string error, std::string detail) {
    Response response;
    response.ok = false;
    response.error = std::move(error);
    response.detail = std::move(detail);
    return response;
}

inline Response execute(MachineController& machine, const json& request) {
    if (!request.is_object() || !request.contains("command") || !request.at("command").is_string()) {
        VENDCORE_LOG_WARN("Request without a command: {}", request.dump());
        return failure("malformed_request", "request must be an object with a string 'command'");
    }

    auto command = request.at("command").get<std::string>();
    VENDCORE_LOG_DEBUG("Executing request '{}'", command);

    Response response;
    try {
        switch (string_to_request_type(command)) {
            case RequestType::INSERT_COIN:
                response.result["balance"] = machine.insert_coin(detail::integer_arg(request.at("amount"), "amount"));
                break;

            case RequestType::SELECT_PRODUCT: {
                auto confirmed = machine.select_product(request.at("product").get<ProductId>());
                response.result = json{{"product", confirmed.product_id},
                                       {"name", confirmed.product_name},
                                       {"price", confirmed.price},
                                       {"balance", confirmed.balance}};
                break;
            }

            case RequestType::DISPENSE: {
                auto receipt = machine.dispense();
                response.result = json{{"product", receipt.product_id},
                                       {"name", receipt.product_name},
                                       {"price", receipt.price},
                                       {"change", receipt.change}};
                break;
            }

            case RequestType::REFUND:
                response.result["returned"] = machine.refund();
                break;

            case RequestType::RESTOCK:
                if (request.contains("products")) {
                    machine.restock(detail::restock_plan_arg(request.at("products")));
                } else {
                    machine.restock();
                }
                break;

            case RequestType::ENTER_MAINTENANCE:
                machine.enter_maintenance();
                break;

            case RequestType::SHUTDOWN:
                machine.shutdown();
                break;

            case RequestType::STATUS:
                response.result = machine.status();
                break;

            case RequestType::RECENT_TRANSACTIONS:
                response.result["entries"] = machine.recent_transactions(
                    detail::count_arg(request, 10));
                break;

            case RequestType::UNKNOWN:
            default:
                VENDCORE_LOG_WARN("Unknown request command: {}", command);
                return failure("malformed_request", "unknown command '" + command + "'");
        }
    } catch (const InsufficientFundsError& e) {
        auto rejected = failure(to_string(e.code()), e.what());
        rejected.result["shortfall"] = e.shortfall();
        return rejected;
    } catch (const MachineError& e) {
        return failure(to_string(e.code()), e.what());
    } catch (const MalformedRequestError& e) {
        VENDCORE_LOG_WARN("Malformed '{}' request: {}", command, e.what());
        return failure("malformed_request", e.what());
    } catch (const json::exception& e) {
        VENDCORE_LOG_WARN("Malformed '{}' request: {}", command, e.what());
        return failure("malformed_request", e.what());
    }

    return response;
}

} // namespace vendcore
