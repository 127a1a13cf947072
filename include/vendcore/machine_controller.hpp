#pragma once

#include "errors.hpp"
#include "inventory.hpp"
#include "logging.hpp"
#include "state_machine.hpp"
#include "transaction_log.hpp"
#include "types.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vendcore {

struct SelectionConfirmed {
    ProductId product_id;
    std::string product_name;
    Amount price = 0;
    Amount balance = 0;
};

struct DispenseReceipt {
    ProductId product_id;
    std::string product_name;
    Amount price = 0;
    Amount change = 0;
};

struct MachineStatus {
    MachineState state = MachineState::Ready;
    Amount balance = 0;
    std::optional<ProductId> selection;
    std::vector<Product> inventory;
};

// Owns the inventory, the balance and the transaction log, and drives them
// through VendingMachineTable. Every command and query takes the same mutex,
// so commands from several threads are applied one at a time.
//
// Commands either complete or throw a MachineError with nothing changed.
// All allocations a command needs happen before the state machine runs; a
// std::bad_alloc therefore also leaves the machine as it was.
class MachineController {
public:
    explicit MachineController(Inventory inventory, std::string name = "vendcore")
        : name_(std::move(name))
        , inventory_(std::move(inventory))
        , sm_{transition_logger_, ctx_, inventory_} {
        VENDCORE_LOG_INFO("MachineController '{}' created with {} products", name_, inventory_.size());
    }

    MachineController(const MachineController&) = delete;
    MachineController& operator=(const MachineController&) = delete;

    Amount insert_coin(Amount amount) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entry = begin_entry(CommandKind::InsertCoin, "amount=" + std::to_string(amount));
        execute(CommandKind::InsertCoin, events::InsertCoin{amount});
        entry.amount = ctx_.balance;
        commit(std::move(entry));
        return ctx_.balance;
    }

    SelectionConfirmed select_product(const ProductId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entry = begin_entry(CommandKind::SelectProduct, "product=" + id);
        SelectionConfirmed confirmed;
        confirmed.product_id = id;
        if (auto product = inventory_.find(id)) {
            confirmed.product_name = product->name;
            confirmed.price = product->price;
        }
        execute(CommandKind::SelectProduct, events::SelectProduct{id});
        confirmed.balance = ctx_.balance;
        entry.amount = ctx_.balance;
        commit(std::move(entry));
        return confirmed;
    }

    DispenseReceipt dispense() {
        std::lock_guard<std::mutex> lock(mutex_);
        DispenseReceipt receipt;
        if (ctx_.selection != nullptr) {
            receipt.product_id = ctx_.selection->id;
            receipt.product_name = ctx_.selection->name;
            receipt.price = ctx_.selection->price;
        }
        auto entry = begin_entry(CommandKind::Dispense, "product=" + receipt.product_id);
        execute(CommandKind::Dispense, events::Dispense{});
        receipt.change = ctx_.returned;
        entry.amount = receipt.change;
        commit(std::move(entry));
        return receipt;
    }

    Amount refund() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entry = begin_entry(CommandKind::Refund, "balance=" + std::to_string(ctx_.balance));
        execute(CommandKind::Refund, events::Refund{});
        entry.amount = ctx_.returned;
        commit(std::move(entry));
        return ctx_.returned;
    }

    void restock() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entry = begin_entry(CommandKind::Restock, "all slots to capacity");
        execute(CommandKind::Restock, events::Restock{});
        commit(std::move(entry));
    }

    void restock(const RestockPlan& plan) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entry = begin_entry(CommandKind::Restock, "products=" + std::to_string(plan.size()));
        execute(CommandKind::Restock, events::Restock{&plan});
        commit(std::move(entry));
    }

    void enter_maintenance() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entry = begin_entry(CommandKind::EnterMaintenance, "");
        execute(CommandKind::EnterMaintenance, events::EnterMaintenance{});
        commit(std::move(entry));
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entry = begin_entry(CommandKind::Shutdown, "");
        execute(CommandKind::Shutdown, events::Shutdown{});
        commit(std::move(entry));
    }

    MachineStatus status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        MachineStatus status;
        status.state = current_state();
        status.balance = ctx_.balance;
        if (ctx_.selection != nullptr) {
            status.selection = ctx_.selection->id;
        }
        status.inventory = inventory_.snapshot();
        return status;
    }

    std::vector<TransactionLogEntry> recent_transactions(std::size_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_.query_recent(n);
    }

    MachineState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_state();
    }

    Amount balance() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ctx_.balance;
    }

    const std::string& name() const { return name_; }

private:
    MachineState current_state() const {
        using sml::state;
        if (sm_.is(state<states::Ready>)) return MachineState::Ready;
        if (sm_.is(state<states::CoinInserted>)) return MachineState::CoinInserted;
        if (sm_.is(state<states::ProductSelected>)) return MachineState::ProductSelected;
        if (sm_.is(state<states::Dispensing>)) return MachineState::Dispensing;
        if (sm_.is(state<states::Maintenance>)) return MachineState::Maintenance;
        return MachineState::OutOfOrder;
    }

    TransactionLogEntry begin_entry(CommandKind command, std::string detail) {
        log_.reserve_next();
        TransactionLogEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.command = command;
        entry.detail = std::move(detail);
        return entry;
    }

    void commit(TransactionLogEntry entry) {
        entry.resulting_state = current_state();
        VENDCORE_LOG_INFO("'{}' {} -> {} (amount {})", name_, entry.command_name(),
                          to_string(entry.resulting_state), entry.amount);
        log_.append(std::move(entry));
    }

    template <typename Event>
    void execute(CommandKind command, const Event& event) {
        auto before = current_state();
        if (before == MachineState::Dispensing) {
            VENDCORE_LOG_WARN("'{}' {} rejected: dispense in progress", name_, to_string(command));
            throw BusyError(command);
        }

        ctx_.rejection.reset();
        bool handled = sm_.process_event(event);
        if (handled && !ctx_.rejection) {
            return;
        }

        auto rejection = ctx_.rejection.value_or(Rejection{ErrorCode::InvalidCommandForState});
        ctx_.rejection.reset();
        VENDCORE_LOG_WARN("'{}' {} rejected in state {}: {}", name_, to_string(command),
                          to_string(before), to_string(rejection.code));
        raise(command, before, rejection, subject_of(event));
    }

    const ProductId& subject_of(const events::SelectProduct& event) const { return event.id; }

    template <typename Event>
    ProductId subject_of(const Event&) const {
        return ctx_.selection != nullptr ? ctx_.selection->id : ProductId{};
    }

    [[noreturn]] void raise(CommandKind command, MachineState state, const Rejection& rejection,
                            const ProductId& product) const {
        switch (rejection.code) {
            case ErrorCode::UnknownProduct:
                throw UnknownProductError(product);
            case ErrorCode::OutOfStock:
                throw OutOfStockError(product);
            case ErrorCode::InsufficientFunds:
                throw InsufficientFundsError(product, ctx_.balance + rejection.shortfall, ctx_.balance);
            case ErrorCode::InvalidAmount:
                throw InvalidAmountError(rejection.amount);
            case ErrorCode::Busy:
                throw BusyError(command);
            case ErrorCode::InvalidCommandForState:
                break;
        }
        throw InvalidCommandForStateError(command, state);
    }

    std::string name_;
    mutable std::mutex mutex_;
    Inventory inventory_;
    MachineContext ctx_;
    TransactionLog log_;
    TransitionLogger transition_logger_;
    VendingStateMachine sm_;
};

} // namespace vendcore
