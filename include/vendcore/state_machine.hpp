#pragma once

#include "errors.hpp"
#include "inventory.hpp"
#include "logging.hpp"
#include "types.hpp"
#include <boost/sml.hpp>
#include <limits>
#include <optional>

namespace vendcore {

namespace sml = boost::sml;

namespace events {

struct InsertCoin { Amount amount; };
struct SelectProduct { ProductId id; };
struct Dispense {};
struct Refund {};
// A null plan fills every slot to capacity.
struct Restock { const RestockPlan* plan = nullptr; };
struct EnterMaintenance {};
struct Shutdown {};

} // namespace events

namespace states {

struct Ready {};
struct CoinInserted {};
struct ProductSelected {};
struct Dispensing {};
struct Maintenance {};
struct OutOfOrder {};

} // namespace states

// Why a guard refused an event that the current state otherwise accepts.
struct Rejection {
    ErrorCode code;
    Amount shortfall = 0;
    Amount amount = 0;
};

// Mutable data shared by guards and actions. Actions never allocate, so a
// command that got past its allocations cannot fail half-way.
struct MachineContext {
    Amount balance = 0;
    const Product* selection = nullptr;
    Amount returned = 0;
    std::optional<Rejection> rejection;
    const RestockPlan* service_plan = nullptr;
    bool resume_after_service = false;
};

namespace guards {

inline const auto valid_coin = [](const events::InsertCoin& e, MachineContext& ctx) {
    bool valid = e.amount > 0 && e.amount <= std::numeric_limits<Amount>::max() - ctx.balance;
    VENDCORE_LOG_DEBUG("GUARD - coin {} on balance {}: {}", e.amount, ctx.balance, valid ? "accepted" : "refused");
    if (!valid) {
        ctx.rejection = Rejection{ErrorCode::InvalidAmount, 0, e.amount};
    }
    return valid;
};

inline const auto can_select = [](const events::SelectProduct& e, MachineContext& ctx, Inventory& inventory) {
    auto product = inventory.find(e.id);
    if (product == nullptr) {
        ctx.rejection = Rejection{ErrorCode::UnknownProduct};
    } else if (product->stock == 0) {
        ctx.rejection = Rejection{ErrorCode::OutOfStock};
    } else if (ctx.balance < product->price) {
        ctx.rejection = Rejection{ErrorCode::InsufficientFunds, product->price - ctx.balance};
    }
    VENDCORE_LOG_DEBUG("GUARD - select '{}' with balance {}: {}", e.id, ctx.balance,
                       ctx.rejection ? to_string(ctx.rejection->code) : "ok");
    return !ctx.rejection;
};

inline const auto selection_in_stock = [](MachineContext& ctx, Inventory& inventory) {
    return ctx.selection != nullptr && inventory.is_available(ctx.selection->id);
};

inline const auto service_pending = [](MachineContext& ctx) {
    return ctx.resume_after_service;
};

} // namespace guards

namespace actions {

inline const auto accept_coin = [](const events::InsertCoin& e, MachineContext& ctx) {
    ctx.balance += e.amount;
    VENDCORE_LOG_INFO("ACTION - coin {} accepted, balance {}", e.amount, ctx.balance);
};

inline const auto choose_product = [](const events::SelectProduct& e, MachineContext& ctx, Inventory& inventory) {
    ctx.selection = inventory.find(e.id);
    VENDCORE_LOG_INFO("ACTION - selected '{}'", e.id);
};

// Runs on the way out of Dispensing: the only place stock is decremented.
inline const auto vend = [](MachineContext& ctx, Inventory& inventory) {
    const auto& product = *ctx.selection;
    inventory.decrement(product.id);
    ctx.returned = ctx.balance - product.price;
    ctx.balance = 0;
    ctx.selection = nullptr;
    VENDCORE_LOG_INFO("ACTION - dispensed '{}', change {}", product.id, ctx.returned);
};

inline const auto abort_dispense = [](MachineContext& ctx) {
    ctx.rejection = Rejection{ErrorCode::OutOfStock};
    VENDCORE_LOG_WARN("ACTION - dispense aborted, selection out of stock; balance {} retained", ctx.balance);
};

inline const auto refund = [](MachineContext& ctx) {
    ctx.returned = ctx.balance;
    ctx.balance = 0;
    ctx.selection = nullptr;
    VENDCORE_LOG_INFO("ACTION - refunded {}", ctx.returned);
};

inline const auto nothing_to_refund = [](MachineContext& ctx) {
    ctx.returned = 0;
};

inline const auto stage_service = [](const events::Restock& e, MachineContext& ctx) {
    ctx.service_plan = e.plan;
    ctx.resume_after_service = true;
};

inline const auto service = [](MachineContext& ctx, Inventory& inventory) {
    if (ctx.service_plan != nullptr) {
        inventory.restock(*ctx.service_plan);
    } else {
        inventory.restock_all();
    }
    ctx.service_plan = nullptr;
    ctx.resume_after_service = false;
};

inline const auto restock_now = [](const events::Restock& e, MachineContext& ctx, Inventory& inventory) {
    ctx.service_plan = e.plan;
    service(ctx, inventory);
};

inline const auto end_service = [](MachineContext& ctx) {
    ctx.service_plan = nullptr;
    ctx.resume_after_service = false;
};

inline const auto no_op = [] {};

} // namespace actions

struct VendingMachineTable {
    auto operator()() const {
        using namespace sml;
        using namespace states;
        using namespace guards;
        using namespace actions;

        return make_transition_table(
            //+-----------------------+--------------------------------+------------------------+---------------------------+-----------------------+
            //| Source State          | Event                          | Guard                  | Action                    | Dest State            |
            //+-----------------------+--------------------------------+------------------------+---------------------------+-----------------------+
           *state<Ready>           + event<events::InsertCoin>        [valid_coin]             / accept_coin               = state<CoinInserted>,
            state<Ready>           + event<events::Refund>                                     / nothing_to_refund,
            state<Ready>           + event<events::Restock>                                    / stage_service             = state<Maintenance>,
            state<Ready>           + event<events::EnterMaintenance>                                                       = state<Maintenance>,
            state<Ready>           + event<events::Shutdown>                                                               = state<OutOfOrder>,

            state<CoinInserted>    + event<events::InsertCoin>        [valid_coin]             / accept_coin,
            state<CoinInserted>    + event<events::SelectProduct>     [can_select]             / choose_product            = state<ProductSelected>,
            state<CoinInserted>    + event<events::Refund>                                     / refund                    = state<Ready>,

            state<ProductSelected> + event<events::InsertCoin>        [valid_coin]             / accept_coin,
            state<ProductSelected> + event<events::SelectProduct>     [can_select]             / choose_product,
            state<ProductSelected> + event<events::Dispense>                                                               = state<Dispensing>,
            state<ProductSelected> + event<events::Refund>                                     / refund                    = state<Ready>,

            // Completion transitions: Dispensing is left within the same event.
            state<Dispensing>                                         [selection_in_stock]     / vend                      = state<Ready>,
            state<Dispensing>                                         [!selection_in_stock]    / abort_dispense            = state<ProductSelected>,

            state<Maintenance>                                        [service_pending]        / service                   = state<Ready>,
            state<Maintenance>     + event<events::Restock>                                    / restock_now               = state<Ready>,
            state<Maintenance>     + event<events::EnterMaintenance>                           / no_op,
            state<Maintenance>     + event<events::Shutdown>                                   / end_service               = state<OutOfOrder>,

            state<OutOfOrder>      + event<events::Restock>                                    / stage_service             = state<Maintenance>,
            state<OutOfOrder>      + event<events::Shutdown>                                   / no_op
            //+-----------------------+--------------------------------+------------------------+---------------------------+-----------------------+
        );
    }
};

// Forwards boost::sml introspection to spdlog at trace level.
struct TransitionLogger {
    template <class SM, class TEvent>
    void log_process_event(const TEvent&) {
        VENDCORE_LOG_TRACE("[sml] process_event {}", sml::aux::get_type_name<TEvent>());
    }

    template <class SM, class TGuard, class TEvent>
    void log_guard(const TGuard&, const TEvent&, bool result) {
        VENDCORE_LOG_TRACE("[sml] guard on {}: {}", sml::aux::get_type_name<TEvent>(), result ? "pass" : "fail");
    }

    template <class SM, class TAction, class TEvent>
    void log_action(const TAction&, const TEvent&) {
        VENDCORE_LOG_TRACE("[sml] action on {}", sml::aux::get_type_name<TEvent>());
    }

    template <class SM, class TSrcState, class TDstState>
    void log_state_change(const TSrcState& src, const TDstState& dst) {
        VENDCORE_LOG_DEBUG("TRANSITION - {} -> {}", src.c_str(), dst.c_str());
    }
};

using VendingStateMachine = sml::sm<VendingMachineTable, sml::logger<TransitionLogger>>;

} // namespace vendcore
