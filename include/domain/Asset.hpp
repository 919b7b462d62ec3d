#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace holdings::domain {

/**
 * @brief Актив и его держатели
 *
 * entities хранит держателей в порядке первого появления.
 * Итоги пересчитываются при каждой агрегации.
 */
class Asset {
public:
    std::string symbol;
    std::string name;
    std::vector<std::string> entities;
    double totalQuantity = 0.0;
    double totalValue = 0.0;

    Asset() = default;

    Asset(std::string sym, std::string displayName)
        : symbol(std::move(sym)), name(std::move(displayName)) {}

    bool heldBy(const std::string& entity) const {
        return std::find(entities.begin(), entities.end(), entity) != entities.end();
    }

    bool isMultiHolder() const {
        return entities.size() > 1;
    }

    bool operator==(const Asset& other) const {
        return symbol == other.symbol && name == other.name && entities == other.entities &&
               totalQuantity == other.totalQuantity && totalValue == other.totalValue;
    }
};

} // namespace holdings::domain
