#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

namespace vendcore {

enum class ErrorCode {
    InvalidCommandForState,
    UnknownProduct,
    OutOfStock,
    InsufficientFunds,
    Busy,
    InvalidAmount
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidCommandForState: return "invalid_command_for_state";
        case ErrorCode::UnknownProduct: return "unknown_product";
        case ErrorCode::OutOfStock: return "out_of_stock";
        case ErrorCode::InsufficientFunds: return "insufficient_funds";
        case ErrorCode::Busy: return "busy";
        case ErrorCode::InvalidAmount: return "invalid_amount";
    }
    return "unknown";
}

// Base of every recoverable controller error. A command that throws one of
// these has left state, balance, selection and inventory untouched.
class MachineError : public std::runtime_error {
public:
    MachineError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class InvalidCommandForStateError : public MachineError {
public:
    InvalidCommandForStateError(CommandKind command, MachineState state)
        : MachineError(ErrorCode::InvalidCommandForState,
                       std::string(to_string(command)) + " is not permitted in state " + to_string(state))
        , command_(command)
        , state_(state) {}

    CommandKind command() const { return command_; }
    MachineState state() const { return state_; }

private:
    CommandKind command_;
    MachineState state_;
};

class UnknownProductError : public MachineError {
public:
    explicit UnknownProductError(const ProductId& id)
        : MachineError(ErrorCode::UnknownProduct, "unknown product '" + id + "'")
        , product_id_(id) {}

    const ProductId& product_id() const { return product_id_; }

private:
    ProductId product_id_;
};

class OutOfStockError : public MachineError {
public:
    explicit OutOfStockError(const ProductId& id)
        : MachineError(ErrorCode::OutOfStock, "product '" + id + "' is out of stock")
        , product_id_(id) {}

    const ProductId& product_id() const { return product_id_; }

private:
    ProductId product_id_;
};

class InsufficientFundsError : public MachineError {
public:
    InsufficientFundsError(const ProductId& id, Amount price, Amount balance)
        : MachineError(ErrorCode::InsufficientFunds,
                       "insufficient funds for '" + id + "': price " + std::to_string(price) +
                       ", balance " + std::to_string(balance) +
                       ", shortfall " + std::to_string(price - balance))
        , product_id_(id)
        , price_(price)
        , balance_(balance) {}

    const ProductId& product_id() const { return product_id_; }
    Amount price() const { return price_; }
    Amount balance() const { return balance_; }
    Amount shortfall() const { return price_ - balance_; }

private:
    ProductId product_id_;
    Amount price_;
    Amount balance_;
};

// Only observable when commands race a dispense in progress.
class BusyError : public MachineError {
public:
    explicit BusyError(CommandKind command)
        : MachineError(ErrorCode::Busy,
                       std::string(to_string(command)) + " rejected: machine is dispensing") {}
};

class InvalidAmountError : public MachineError {
public:
    explicit InvalidAmountError(Amount amount)
        : MachineError(ErrorCode::InvalidAmount,
                       "invalid coin amount " + std::to_string(amount))
        , amount_(amount) {}

    Amount amount() const { return amount_; }

private:
    Amount amount_;
};

} // namespace vendcore
