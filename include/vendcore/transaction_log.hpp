#pragma once

#include "types.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace vendcore {

struct TransactionLogEntry {
    std::chrono::system_clock::time_point timestamp;
    CommandKind command = CommandKind::InsertCoin;
    MachineState resulting_state = MachineState::Ready;
    Amount amount = 0;
    std::string detail;

    const char* command_name() const { return to_string(command); }
};

// Append-only audit trail. Callers reserve a slot with reserve_next() before
// they mutate anything, which makes the later append() non-allocating.
class TransactionLog {
public:
    void reserve_next() {
        if (entries_.size() == entries_.capacity()) {
            entries_.reserve(std::max<std::size_t>(kInitialCapacity, entries_.capacity() * 2));
        }
    }

    void append(TransactionLogEntry entry) {
        entries_.push_back(std::move(entry));
    }

    std::vector<TransactionLogEntry> query_recent(std::size_t n) const {
        auto count = std::min(n, entries_.size());
        return std::vector<TransactionLogEntry>(entries_.end() - static_cast<std::ptrdiff_t>(count),
                                                entries_.end());
    }

    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return entries_.capacity(); }
    bool empty() const { return entries_.empty(); }

private:
    static constexpr std::size_t kInitialCapacity = 64;

    std::vector<TransactionLogEntry> entries_;
};

} // namespace vendcore
