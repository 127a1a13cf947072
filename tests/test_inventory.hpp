#pragma once

#include <vendcore/inventory.hpp>

namespace vendcore::test {

// cola 1000 (5/10), coffee 1500 (3/5), gum 50 (0/4)
inline Inventory make_inventory() {
    Inventory inventory;
    inventory.add(Product{"cola", "Cola", 1000, 5, 10});
    inventory.add(Product{"coffee", "Coffee", 1500, 3, 5});
    inventory.add(Product{"gum", "Gum", 50, 0, 4});
    return inventory;
}

inline std::int64_t stock_of(const std::vector<Product>& products, const ProductId& id) {
    for (const auto& product : products) {
        if (product.id == id) {
            return product.stock;
        }
    }
    return -1;
}

} // namespace vendcore::test
