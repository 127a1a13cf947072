#pragma once

#include <cstdint>
#include <string>

namespace vendcore {

// Currency is counted in the smallest unit the coin mechanism reports.
using Amount = std::int64_t;
using ProductId = std::string;

struct Product {
    ProductId id;
    std::string name;
    Amount price = 0;
    std::int64_t stock = 0;
    std::int64_t capacity = 0;
};

enum class MachineState {
    Ready,
    CoinInserted,
    ProductSelected,
    Dispensing,
    Maintenance,
    OutOfOrder
};

inline const char* to_string(MachineState state) {
    switch (state) {
        case MachineState::Ready: return "Ready";
        case MachineState::CoinInserted: return "CoinInserted";
        case MachineState::ProductSelected: return "ProductSelected";
        case MachineState::Dispensing: return "Dispensing";
        case MachineState::Maintenance: return "Maintenance";
        case MachineState::OutOfOrder: return "OutOfOrder";
    }
    return "Unknown";
}

enum class CommandKind {
    InsertCoin,
    SelectProduct,
    Dispense,
    Refund,
    Restock,
    EnterMaintenance,
    Shutdown
};

inline const char* to_string(CommandKind command) {
    switch (command) {
        case CommandKind::InsertCoin: return "insert_coin";
        case CommandKind::SelectProduct: return "select_product";
        case CommandKind::Dispense: return "dispense";
        case CommandKind::Refund: return "refund";
        case CommandKind::Restock: return "restock";
        case CommandKind::EnterMaintenance: return "enter_maintenance";
        case CommandKind::Shutdown: return "shutdown";
    }
    return "unknown";
}

} // namespace vendcore
