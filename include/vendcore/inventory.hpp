#pragma once

#include "errors.hpp"
#include "logging.hpp"
#include "types.hpp"
#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <vector>

namespace vendcore {

using RestockPlan = std::map<ProductId, std::int64_t>;

// Product slots keyed by id. Not synchronised: the owning controller
// serialises every access.
class Inventory {
public:
    Inventory() = default;

    explicit Inventory(const std::vector<Product>& products) {
        for (const auto& product : products) {
            add(product);
        }
    }

    void add(Product product) {
        if (product.id.empty()) {
            throw std::invalid_argument("product id must not be empty");
        }
        if (product.price < 0 || product.stock < 0 || product.capacity < 0) {
            throw std::invalid_argument("product '" + product.id + "' has a negative price, stock or capacity");
        }
        if (product.stock > product.capacity) {
            throw std::invalid_argument("product '" + product.id + "' stock exceeds slot capacity");
        }
        if (products_.count(product.id) != 0) {
            throw std::invalid_argument("duplicate product id '" + product.id + "'");
        }
        VENDCORE_LOG_DEBUG("Inventory: added '{}' price {} stock {}/{}",
                           product.id, product.price, product.stock, product.capacity);
        auto id = product.id;
        products_.emplace(std::move(id), std::move(product));
    }

    std::optional<Product> get(const ProductId& id) const {
        auto it = products_.find(id);
        if (it == products_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Entries are never erased, so the pointer stays valid for the
    // inventory's lifetime.
    const Product* find(const ProductId& id) const {
        auto it = products_.find(id);
        return it == products_.end() ? nullptr : &it->second;
    }

    bool is_available(const ProductId& id) const {
        auto product = find(id);
        return product != nullptr && product->stock > 0;
    }

    void decrement(const ProductId& id) {
        auto it = products_.find(id);
        if (it == products_.end()) {
            throw UnknownProductError(id);
        }
        if (it->second.stock == 0) {
            throw OutOfStockError(id);
        }
        --it->second.stock;
        VENDCORE_LOG_DEBUG("Inventory: '{}' stock now {}", id, it->second.stock);
    }

    void restock(const ProductId& id, std::int64_t quantity) {
        auto it = products_.find(id);
        if (it == products_.end()) {
            VENDCORE_LOG_WARN("Inventory: restock skipped unknown product '{}'", id);
            return;
        }
        if (quantity <= 0) {
            VENDCORE_LOG_WARN("Inventory: restock of '{}' ignored non-positive quantity {}", id, quantity);
            return;
        }
        auto& product = it->second;
        auto room = product.capacity - product.stock;
        if (quantity > room) {
            VENDCORE_LOG_DEBUG("Inventory: restock of '{}' clamped from {} to {}", id, quantity, room);
            quantity = room;
        }
        product.stock += quantity;
        VENDCORE_LOG_INFO("Inventory: restocked '{}' by {} -> {}/{}", id, quantity, product.stock, product.capacity);
    }

    void restock(const RestockPlan& plan) {
        for (const auto& [id, quantity] : plan) {
            restock(id, quantity);
        }
    }

    void restock_all() {
        for (auto& entry : products_) {
            entry.second.stock = entry.second.capacity;
        }
        VENDCORE_LOG_INFO("Inventory: {} slots filled to capacity", products_.size());
    }

    std::vector<Product> snapshot() const {
        std::vector<Product> products;
        products.reserve(products_.size());
        std::transform(products_.begin(), products_.end(), std::back_inserter(products),
                       [](const auto& entry) { return entry.second; });
        return products;
    }

    std::size_t size() const { return products_.size(); }
    bool empty() const { return products_.empty(); }

private:
    std::map<ProductId, Product> products_;
};

} // namespace vendcore
