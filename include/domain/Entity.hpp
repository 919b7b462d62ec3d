#pragma once

#include "Holding.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace holdings::domain {

/**
 * @brief Участник рынка (биржа или институционал)
 *
 * totalValue = сумма valueUsd по собственным позициям,
 * не зависит от итогов по активам.
 * symbols хранит символы в порядке первого появления в источнике.
 */
class Entity {
public:
    std::string name;
    double totalValue = 0.0;
    std::map<std::string, Holding> assets;
    std::vector<std::string> symbols;

    Entity() = default;
    explicit Entity(std::string n) : name(std::move(n)) {}

    /// Добавляет позицию; повторный символ суммируется. false, если символ уже был
    bool add(const std::string& symbol, const Holding& h) {
        totalValue += h.valueUsd;
        auto [it, inserted] = assets.emplace(symbol, h);
        if (inserted) {
            symbols.push_back(symbol);
        } else {
            it->second.quantity += h.quantity;
            it->second.valueUsd += h.valueUsd;
        }
        return inserted;
    }

    bool holds(const std::string& symbol) const {
        return assets.find(symbol) != assets.end();
    }

    std::optional<Holding> holding(const std::string& symbol) const {
        auto it = assets.find(symbol);
        if (it == assets.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Стоимость актива у участника, 0 если актива нет
    double valueOf(const std::string& symbol) const {
        auto it = assets.find(symbol);
        return it != assets.end() ? it->second.valueUsd : 0.0;
    }

    bool operator==(const Entity& other) const {
        return name == other.name && totalValue == other.totalValue
            && assets == other.assets && symbols == other.symbols;
    }
};

} // namespace holdings::domain
